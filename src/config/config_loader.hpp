#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace evalbox::config {

// Defaults, then ~/.evalbox/config.json (or $EVALBOX_CONFIG), then
// EVALBOX_* environment variables.
Config LoadConfig();

std::filesystem::path GetConfigPath();

// evalbox-worker next to the running executable.
std::filesystem::path DefaultWorkerPath();

}  // namespace evalbox::config
