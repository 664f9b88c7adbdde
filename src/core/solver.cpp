#include "acolib/core/solver.hpp"
#include "acolib/core/method.hpp"
#include "acolib/core/colony.hpp"
#include "acolib/core/tsproblem.hpp"
#include "acolib/utils/io.hpp"

#include <CLI/CLI.hpp>

namespace acolib {

    int AcoSolver::init(int argc, char* argv[]) {
        CLI::App app{"ACO Library - Ant Colony Tour Solver"};

        int generations = 0;
        int ants = 0;
        int cities = 0;
        long long seed = -1;
        bool debug = false;

        app.add_option("-c,--config", configPath_, "Path to YAML configuration file")->capture_default_str()->check(CLI::ExistingFile);
        auto* optGenerations = app.add_option("-g,--generations", generations, "Generations per run");
        auto* optAnts = app.add_option("-a,--ants", ants, "Ants per generation");
        auto* optCities = app.add_option("-n,--cities", cities, "Number of generated cities");
        auto* optSeed = app.add_option("-s,--seed", seed, "RNG Seed (default: random)");
        app.add_option("-o,--output", outputPath_, "Append results to this csv file");
        app.add_flag("-d,--debug", debug, "Log every improvement");

        try {
            app.parse(argc, argv);

            core::LoadConfigurationYaml(configPath_, runData_);

            // command line wins over the configuration file
            if (optGenerations->count()) runData_.generations = generations;
            if (optAnts->count())        runData_.ants = ants;
            if (optCities->count())      runData_.cities = cities;
            if (optSeed->count())        runData_.seed = seed;
            if (debug)                   runData_.debug = 1;

            core::ValidateRunData(runData_);
            return 0;
        } catch (const CLI::ParseError &e) {
            return (app.exit(e) == 0) ? 1 : -1;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return -1;
        }
    }

    unsigned int AcoSolver::baseSeed() const {
        return (runData_.seed == -1)
            ? static_cast<unsigned int>(std::chrono::steady_clock::now().time_since_epoch().count())
            : static_cast<unsigned int>(runData_.seed);
    }

    void AcoSolver::run() {
        const unsigned int GLOBAL_SEED = baseSeed();

        // one instance shared by every run
        const std::vector<core::TCity> cities = core::GenerateCities(runData_.cities, GLOBAL_SEED);
        const core::PowerLawScoring scoring(runData_.scoring);

        bestGlobal_ = core::TBestPath{};
        bestTourLength_ = 0.0;
        qualities_.clear();
        timeBest_ = 0.0f;
        timeTotal_ = 0.0f;

        std::cout << "Cities: " << runData_.cities << " (seed " << GLOBAL_SEED << ")\nRuns: ";

        for (int run = 0; run < runData_.MAXRUNS; run++)
        {
            std::cout << (run + 1) << " " << std::flush;

            core::EuclideanTour tour(cities, GLOBAL_SEED + run, runData_.closeTour);
            core::Colony colony;

            double start_time = core::get_time_in_seconds();
            double runQuality = 0.0;
            double runBestTime = 0.0;

            for (int g = 0; g < runData_.generations; g++)
            {
                colony.runGeneration(static_cast<std::size_t>(runData_.ants), tour, scoring);

                auto best = colony.bestPath();
                if (best && best->quality > runQuality) {
                    runQuality = best->quality;
                    runBestTime = core::get_time_in_seconds() - start_time;

                    if (runData_.debug) {
                        std::cout << "\n[run " << (run + 1) << "] generation " << g
                                  << " quality " << std::fixed << std::setprecision(6) << runQuality
                                  << " length " << std::setprecision(3) << tour.TourLength(best->start, best->nodes)
                                  << " [" << runBestTime << "s]" << std::defaultfloat;
                    }
                }
            }

            double end_time = core::get_time_in_seconds();

            qualities_.push_back(runQuality);
            timeBest_ += static_cast<float>(runBestTime);
            timeTotal_ += static_cast<float>(end_time - start_time);

            auto best = colony.bestPath();
            if (best && best->quality > bestGlobal_.quality) {
                bestGlobal_.quality = best->quality;
                bestGlobal_.start = best->start;
                bestGlobal_.nodes.assign(best->nodes.begin(), best->nodes.end());
                bestTourLength_ = tour.TourLength(best->start, best->nodes);
            }
        }

        averageQuality_ = std::accumulate(qualities_.begin(), qualities_.end(), 0.0) / runData_.MAXRUNS;
        timeBest_ /= runData_.MAXRUNS;
        timeTotal_ /= runData_.MAXRUNS;

        utils::WriteSolutionScreen(bestGlobal_, bestTourLength_, averageQuality_, qualities_, timeBest_, timeTotal_);

        if (!outputPath_.empty()) {
            utils::WriteResults(outputPath_, runData_, bestGlobal_.quality, averageQuality_, qualities_,
                                bestTourLength_, timeBest_, timeTotal_);
        }
    }

} // namespace acolib
