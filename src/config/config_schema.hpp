#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mathguard::config {

struct SandboxConfig {
    int timeout_ms = 10 * 1000;
    // Empty means "mathguard_worker next to the running executable".
    std::string worker_path;
    std::uint64_t memory_limit_bytes = 256ull * 1024 * 1024;
    std::uint64_t max_steps = 50'000'000;
    int max_recursion_depth = 200;
    std::size_t max_collection_size = 10'000'000;
    std::size_t max_output_bytes = 1024 * 1024;
};

struct ValidatorConfig {
    std::size_t max_source_bytes = 64 * 1024;
    int max_function_depth = 2;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    ValidatorConfig validator;
    LoggingConfig logging;
};

}  // namespace mathguard::config
