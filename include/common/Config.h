#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace zonerisk {

class Config {
public:
    // Reads the JSON file; a missing or malformed file yields defaults.
    static engine::EngineConfig load(const std::string& config_path);

    // Missing keys keep their defaults.
    static engine::EngineConfig fromJson(const nlohmann::json& j);

    // Clamps invalid values in place and reports each correction on stderr.
    static void validate(engine::EngineConfig& config);
};

} // namespace zonerisk
