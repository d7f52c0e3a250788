#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace execbox::config {

// Defaults, then the JSON file, then EXECBOX_* environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

// Forces max >= 1 and default into [1, max].
void NormalizeLimits(ExecutionConfig& execution);

std::filesystem::path DefaultConfigPath();

}  // namespace execbox::config
