#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace mathguard::sandbox {

struct WorkerLimits {
    std::uint64_t max_steps = 50'000'000;
    int max_recursion_depth = 200;
    std::size_t max_collection_size = 10'000'000;
    // 0 leaves the address space unlimited.
    std::uint64_t memory_limit_bytes = 256ull * 1024 * 1024;
    int cpu_seconds = 10;
    // Caps every file the worker writes, its stdout included.
    std::size_t max_output_bytes = 1024 * 1024;
};

// What the parent writes to the worker's stdin.
struct WorkerRequest {
    std::string code;
    std::string entry_point;
    nlohmann::json args = nlohmann::json::array();
    WorkerLimits limits;
};

enum class WorkerStatus {
    kValue,
    kError,
    kBudgetExceeded
};

const char* ToString(WorkerStatus status);

// What the worker writes to its stdout, exactly one JSON document.
struct WorkerResponse {
    WorkerStatus status = WorkerStatus::kError;
    nlohmann::json value;
    std::string display;
    std::string error_type;
    std::string message;

    static WorkerResponse Value(nlohmann::json value, std::string display);
    static WorkerResponse Error(std::string error_type, std::string message);
    static WorkerResponse BudgetExceeded(std::string message);
};

nlohmann::json ToJson(const WorkerRequest& request);
nlohmann::json ToJson(const WorkerResponse& response);

// Both throw std::invalid_argument for documents that do not follow the
// protocol.
WorkerRequest ParseRequest(const nlohmann::json& data);
WorkerResponse ParseResponse(const nlohmann::json& data);

}  // namespace mathguard::sandbox
