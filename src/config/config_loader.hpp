#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace termgate::config {

std::filesystem::path GetHomePath();

// TERMGATE_CONFIG when set, else ~/.termgate/config.json.
std::filesystem::path GetConfigPath();

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

// Defaults, then the config file, then environment overrides.
Config LoadConfig();

}  // namespace termgate::config
