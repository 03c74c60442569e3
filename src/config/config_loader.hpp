#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace scriptbox::config {

// Reads ~/.scriptbox/config.json (if present) and applies SCRIPTBOX_* overrides.
ExecutorConfig LoadConfig();

ExecutorConfig LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(ExecutorConfig& config, const nlohmann::json& data);

}  // namespace scriptbox::config
