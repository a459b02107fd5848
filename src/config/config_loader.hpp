#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"

namespace mathguard::config {

// ~/.mathguard/config.json
std::filesystem::path GetConfigPath();

// Overlays the recognized keys of `data` onto `config`; unknown keys and
// wrongly-typed values are ignored.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

// Defaults, then the config file (if present and parseable), then
// MATHGUARD_* environment overrides.
Config LoadConfig();

// Resolves SandboxConfig::worker_path, falling back to the worker binary
// installed beside the current executable.
std::string ResolveWorkerPath(const SandboxConfig& sandbox);

}  // namespace mathguard::config
