#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include "utils/logging.hpp"

namespace mathguard::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

template <typename T>
void ApplyPositive(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        const auto value = section[key].get<long long>();
        if (value > 0) {
            target = static_cast<T>(value);
        }
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        return fallback;
    }
}

template <typename T>
void ApplyPositiveEnv(const char* primary, const char* secondary, T& target) {
    const auto raw = GetEnvFallback(primary, secondary);
    if (raw.empty()) {
        return;
    }
    const auto value = ParseLong(raw, -1);
    if (value > 0) {
        target = static_cast<T>(value);
    } else {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring invalid value",
                   {{"name", primary}, {"value", raw}});
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".mathguard" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyPositive(sandbox, "timeoutMs", config.sandbox.timeout_ms);
        if (sandbox.contains("workerPath") && sandbox["workerPath"].is_string()) {
            config.sandbox.worker_path = sandbox["workerPath"].get<std::string>();
        }
        ApplyPositive(sandbox, "memoryLimitBytes", config.sandbox.memory_limit_bytes);
        ApplyPositive(sandbox, "maxSteps", config.sandbox.max_steps);
        ApplyPositive(sandbox, "maxRecursionDepth", config.sandbox.max_recursion_depth);
        ApplyPositive(sandbox, "maxCollectionSize", config.sandbox.max_collection_size);
        ApplyPositive(sandbox, "maxOutputBytes", config.sandbox.max_output_bytes);
    }

    if (data.contains("validator") && data["validator"].is_object()) {
        const auto& validator = data["validator"];
        ApplyPositive(validator, "maxSourceBytes", config.validator.max_source_bytes);
        ApplyPositive(validator, "maxFunctionDepth", config.validator.max_function_depth);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            // Keep defaults on parse errors
            utils::Log(utils::LogLevel::kWarn, "config", "failed to parse config file",
                       {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    ApplyPositiveEnv("MATHGUARD_SANDBOX__TIMEOUT_MS",
                     "MATHGUARD_SANDBOX_TIMEOUT_MS",
                     config.sandbox.timeout_ms);

    const auto worker_path = GetEnvFallback(
        "MATHGUARD_SANDBOX__WORKER_PATH",
        "MATHGUARD_SANDBOX_WORKER_PATH");
    if (!worker_path.empty()) {
        config.sandbox.worker_path = worker_path;
    }

    ApplyPositiveEnv("MATHGUARD_SANDBOX__MEMORY_LIMIT_BYTES",
                     "MATHGUARD_SANDBOX_MEMORY_LIMIT_BYTES",
                     config.sandbox.memory_limit_bytes);
    ApplyPositiveEnv("MATHGUARD_SANDBOX__MAX_STEPS",
                     "MATHGUARD_SANDBOX_MAX_STEPS",
                     config.sandbox.max_steps);
    ApplyPositiveEnv("MATHGUARD_SANDBOX__MAX_RECURSION_DEPTH",
                     "MATHGUARD_SANDBOX_MAX_RECURSION_DEPTH",
                     config.sandbox.max_recursion_depth);
    ApplyPositiveEnv("MATHGUARD_SANDBOX__MAX_COLLECTION_SIZE",
                     "MATHGUARD_SANDBOX_MAX_COLLECTION_SIZE",
                     config.sandbox.max_collection_size);
    ApplyPositiveEnv("MATHGUARD_SANDBOX__MAX_OUTPUT_BYTES",
                     "MATHGUARD_SANDBOX_MAX_OUTPUT_BYTES",
                     config.sandbox.max_output_bytes);
    ApplyPositiveEnv("MATHGUARD_VALIDATOR__MAX_SOURCE_BYTES",
                     "MATHGUARD_VALIDATOR_MAX_SOURCE_BYTES",
                     config.validator.max_source_bytes);
    ApplyPositiveEnv("MATHGUARD_VALIDATOR__MAX_FUNCTION_DEPTH",
                     "MATHGUARD_VALIDATOR_MAX_FUNCTION_DEPTH",
                     config.validator.max_function_depth);

    const auto log_level = GetEnvFallback(
        "MATHGUARD_LOGGING__LEVEL",
        "MATHGUARD_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    return config;
}

std::string ResolveWorkerPath(const SandboxConfig& sandbox) {
    if (!sandbox.worker_path.empty()) {
        return sandbox.worker_path;
    }
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "mathguard_worker";
    }
    return (self.parent_path() / "mathguard_worker").string();
}

}  // namespace mathguard::config
