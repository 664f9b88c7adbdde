#pragma once

#include "acolib/core/data.hpp"

namespace acolib::utils {

    /**
     * Outputs the best path and the run statistics to the screen.
     */
    void WriteSolutionScreen(const acolib::core::TBestPath &best, double tourLength,
                             double qualityAverage, const std::vector<double> &qualities,
                             float timeBest, float timeTotal);

    /**
     * Appends one line with the results of all runs to a csv file.
     * Throws std::runtime_error if the file cannot be opened.
     */
    void WriteResults(const std::string &fileName, const acolib::core::TRunData &runData,
                      double quality, double qualityAverage, const std::vector<double> &qualities,
                      double tourLength, float timeBest, float timeTotal);

} // namespace acolib::utils
