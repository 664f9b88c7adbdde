#include "acolib/utils/io.hpp"

namespace acolib::utils {

    void WriteSolutionScreen(const acolib::core::TBestPath &best, double tourLength,
                             double qualityAverage, const std::vector<double> &qualities,
                             float timeBest, float timeTotal)
    {
        printf("\n\nACO: %d run(s)", (int)qualities.size());
        printf("\npath: %zu | ", best.start);
        for (auto node : best.nodes)
            printf("%zu ", node);

        printf("\nquality: %.5lf", best.quality);
        printf("\naverage quality: %.5lf", qualityAverage);
        printf("\ntour length: %.3lf", tourLength);
        printf("\nTotal time: %.3f", timeTotal);
        printf("\nBest time: %.3f\n\n", timeBest);
    }

    void WriteResults(const std::string &fileName, const acolib::core::TRunData &runData,
                      double quality, double qualityAverage, const std::vector<double> &qualities,
                      double tourLength, float timeBest, float timeTotal)
    {
        FILE *File = fopen(fileName.c_str(), "a");

        if (!File)
        {
            throw std::runtime_error("Cannot open results file " + fileName);
        }

        fprintf(File, "\n%d\t%d\t%d", runData.cities, runData.ants, runData.generations);
        fprintf(File, "\t%.3lf\t%.3lf\t%.3lf", runData.scoring.alpha, runData.scoring.beta, runData.scoring.q);

        fprintf(File, "\t%d", (int)qualities.size());
        for (unsigned int i = 0; i < qualities.size(); i++) {
            fprintf(File, "\t%lf", qualities[i]);
        }
        fprintf(File, "\t%lf", quality);
        fprintf(File, "\t%lf", qualityAverage);
        fprintf(File, "\t%.3lf", tourLength);
        fprintf(File, "\t%.3f", timeBest);
        fprintf(File, "\t%.3f", timeTotal);

        fclose(File);
    }

} // namespace acolib::utils
