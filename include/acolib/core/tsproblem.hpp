#pragma once

#include "acolib/core/data.hpp"
#include "acolib/core/itraversal.hpp"
#include "acolib/core/iscoring.hpp"

namespace acolib::core {

    //----------------- DEFINITION OF PROBLEM SPECIFIC TYPES -----------------------
    struct TCity
    {
        double x;
        double y;
    };

    //-------------------------- FUNCTIONS OF SPECIFIC PROBLEM --------------------------

    /**
     * Method: GenerateCities
     * Description: uniform random cities in [0, 1000) x [0, 1000)
     */
    std::vector<TCity> GenerateCities(int count, unsigned int seed);

    /**
     * Method: Distance
     * Description: euclidean distance between two cities
     */
    double Distance(const TCity& a, const TCity& b);

    //--------------------------------------------------------------------------
    // Class: EuclideanTour
    // Description: Travelling salesman traversal. Each ant starts at a random
    // city and may visit every city once, optionally closing the tour.
    //--------------------------------------------------------------------------
    class EuclideanTour : public ITraversal {
    public:
        EuclideanTour(std::vector<TCity> cities, unsigned int seed, bool closeTour = true);

        // --- ITraversal ---
        TNode reset() override;
        void targets(TNode node, const TargetSink& sink) const override;
        void walkTo(TNode node) override;

        /**
         * Length of the walk start -> path[0] -> ... -> path.back().
         * A closed tour ends at its start, so the whole cycle is measured.
         */
        double TourLength(TNode start, std::span<const TNode> path) const;

        int getDimension() const { return static_cast<int>(cities_.size()); }
        const std::vector<TCity>& cities() const { return cities_; }

    private:
        std::vector<TCity> cities_;
        std::mt19937 rng_;
        bool closeTour_;

        std::vector<char> visited_;
        std::size_t numVisited_ = 0;
        TNode start_ = 0;
        bool closed_ = false;
    };

    //--------------------------------------------------------------------------
    // Class: PowerLawScoring
    // Description: visit score q^beta * (1 + p)^alpha, deposit Q * total
    //--------------------------------------------------------------------------
    class PowerLawScoring : public IScoring {
    public:
        explicit PowerLawScoring(const TScoringParams& params) : params_(params) {}

        double edgeQuality(double quality, double pheromone) const override;
        double pheromonesDeposited(double totalQuality) const override;

    private:
        TScoringParams params_;
    };

} // namespace acolib::core
