#pragma once

#include "acolib/core/data.hpp"

namespace acolib::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double get_time_in_seconds();

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    /**
     * Method: LoadConfigurationYaml
     * Description: fills runData from the `run`, `instance` and `scoring` maps
     * of a YAML file. Missing keys keep their current values.
     * Throws std::runtime_error if the file cannot be read or parsed.
     */
    void LoadConfigurationYaml(const std::string& configFile, TRunData &runData);

    /**
     * Method: ValidateRunData
     * Description: throws std::invalid_argument on out-of-range parameters
     */
    void ValidateRunData(const TRunData &runData);

} // namespace acolib::core
