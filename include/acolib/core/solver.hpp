/**
 * ACO Library - Solver Interface
 * Drives a colony over the demonstration tour problem
 */

#pragma once

#include "acolib/core/data.hpp"

namespace acolib {

    /**
    * @brief Command line driver - configuration, runs and reporting
    */
    class AcoSolver {
    public:
        AcoSolver() = default;

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        /**
        * @brief Parses the command line and the YAML configuration
        * @return 0 on success, > 0 when help was printed, < 0 on errors
        */
        int init(int argc, char* argv[]);

        void run();

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const core::TRunData& getRunData() const { return runData_; }
        const core::TBestPath& getBestPath() const { return bestGlobal_; }
        double getBestTourLength() const { return bestTourLength_; }
        double getAverageQuality() const { return averageQuality_; }
        const std::vector<double>& getQualities() const { return qualities_; }

    private:
        unsigned int baseSeed() const;

        // -------------------------------------------------------------------------
        // MEMBER VARIABLES
        // -------------------------------------------------------------------------
        std::string configPath_ = "config/colony.yaml";
        std::string outputPath_;
        core::TRunData runData_;

        core::TBestPath bestGlobal_;
        double bestTourLength_ = 0.0;
        double averageQuality_ = 0.0;
        float timeBest_ = 0.0f;
        float timeTotal_ = 0.0f;
        std::vector<double> qualities_;
    };

} // namespace acolib
