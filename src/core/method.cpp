#include "acolib/core/method.hpp"

#include <yaml-cpp/yaml.h>

namespace acolib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    namespace {

        template <typename T>
        void ReadKey(const YAML::Node& section, const char* key, T& value)
        {
            if (section && section[key]) {
                value = section[key].as<T>();
            }
        }

    }

    void LoadConfigurationYaml(const std::string& configFile, TRunData &runData)
    {
        try {
            YAML::Node config = YAML::LoadFile(configFile);

            const YAML::Node run = config["run"];
            ReadKey(run, "MAXRUNS", runData.MAXRUNS);
            ReadKey(run, "generations", runData.generations);
            ReadKey(run, "ants", runData.ants);
            ReadKey(run, "debug", runData.debug);
            ReadKey(run, "seed", runData.seed);

            const YAML::Node instance = config["instance"];
            ReadKey(instance, "cities", runData.cities);
            ReadKey(instance, "closeTour", runData.closeTour);

            const YAML::Node scoring = config["scoring"];
            ReadKey(scoring, "alpha", runData.scoring.alpha);
            ReadKey(scoring, "beta", runData.scoring.beta);
            ReadKey(scoring, "q", runData.scoring.q);

        } catch (const YAML::BadFile&) {
            throw std::runtime_error("Cannot open YAML file: " + configFile);
        } catch (const YAML::ParserException& e) {
            throw std::runtime_error("YAML syntax error in " + configFile + ": " + e.what());
        } catch (const YAML::BadConversion& e) {
            throw std::runtime_error("Invalid value in " + configFile + ": " + e.what());
        }
    }

    void ValidateRunData(const TRunData &runData)
    {
        if (runData.MAXRUNS < 1)
            throw std::invalid_argument("MAXRUNS must be at least 1");
        if (runData.generations < 0)
            throw std::invalid_argument("generations must be non-negative");
        if (runData.ants < 0)
            throw std::invalid_argument("ants must be non-negative");
        if (runData.cities < 2)
            throw std::invalid_argument("cities must be at least 2");
        if (runData.scoring.q < 0.0)
            throw std::invalid_argument("scoring.q must be non-negative");
    }

} // namespace acolib::core
