#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "sandbox/worker_protocol.hpp"

namespace mathguard::sandbox {

enum class OutcomeKind {
    kValue,
    kTimedOut,
    kRuntimeFailure
};

const char* ToString(OutcomeKind kind);

struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::kRuntimeFailure;
    // JSON encoding of the entry point's return value (kValue only).
    nlohmann::json value;
    // repr() of the return value (kValue only).
    std::string display;
    // "<ErrorType>: <message>" for failures, a short reason for timeouts.
    std::string message;

    static ExecutionOutcome Value(nlohmann::json value, std::string display);
    static ExecutionOutcome TimedOut(std::string message);
    static ExecutionOutcome RuntimeFailure(std::string message);
};

struct SandboxOptions {
    std::string worker_path;
    WorkerLimits limits;
};

// Runs validated code in a throwaway mathguard_worker process. The caller
// guarantees the code passed the static validator; nothing is re-checked
// here. Each call owns its worker and temporary files, so one executor may
// serve concurrent callers.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxOptions options);

    ExecutionOutcome Execute(const std::string& code,
                             const std::string& entry_point,
                             std::chrono::milliseconds deadline,
                             const nlohmann::json& args = nlohmann::json::array()) const;

    const SandboxOptions& options() const { return options_; }

private:
    SandboxOptions options_;
};

}  // namespace mathguard::sandbox
