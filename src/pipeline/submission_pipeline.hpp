#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "validator/static_validator.hpp"

namespace mathguard::pipeline {

enum class ErrorKind {
    kSecurityViolation,
    kSyntaxError,
    kTimeout,
    kExecutionFailed
};

const char* ToString(ErrorKind kind);

// Ok(value) or Error(kind, message). All error kinds are terminal; retrying
// the same submission yields the same kind.
struct SolveResult {
    bool ok = false;
    nlohmann::json value;
    std::string display;
    ErrorKind error = ErrorKind::kExecutionFailed;
    std::string message;

    static SolveResult Ok(nlohmann::json value, std::string display);
    static SolveResult Error(ErrorKind kind, std::string message);
};

// Validator first, then the sandbox with a fixed deadline. Rejected code is
// never handed to the sandbox.
class SubmissionPipeline {
public:
    SubmissionPipeline(validator::StaticValidator validator,
                       sandbox::SandboxExecutor executor,
                       std::chrono::milliseconds deadline);

    SolveResult Solve(const std::string& code,
                      const std::string& entry_point,
                      const nlohmann::json& args = nlohmann::json::array()) const;

    std::chrono::milliseconds deadline() const { return deadline_; }

private:
    validator::StaticValidator validator_;
    sandbox::SandboxExecutor executor_;
    std::chrono::milliseconds deadline_;
};

std::unique_ptr<SubmissionPipeline> CreatePipeline(const config::Config& config);

}  // namespace mathguard::pipeline
