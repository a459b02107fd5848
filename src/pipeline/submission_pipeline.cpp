#include "pipeline/submission_pipeline.hpp"

#include <utility>

#include "config/config_loader.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace mathguard::pipeline {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kSecurityViolation: return "security_violation";
        case ErrorKind::kSyntaxError: return "syntax_error";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kExecutionFailed: return "execution_failed";
    }
    return "execution_failed";
}

SolveResult SolveResult::Ok(nlohmann::json value, std::string display) {
    SolveResult result;
    result.ok = true;
    result.value = std::move(value);
    result.display = std::move(display);
    return result;
}

SolveResult SolveResult::Error(ErrorKind kind, std::string message) {
    SolveResult result;
    result.ok = false;
    result.error = kind;
    result.message = std::move(message);
    return result;
}

SubmissionPipeline::SubmissionPipeline(validator::StaticValidator validator,
                                       sandbox::SandboxExecutor executor,
                                       std::chrono::milliseconds deadline)
    : validator_(std::move(validator)), executor_(std::move(executor)), deadline_(deadline) {}

SolveResult SubmissionPipeline::Solve(const std::string& code,
                                      const std::string& entry_point,
                                      const nlohmann::json& args) const {
    const auto verdict = validator_.Validate(code);
    if (!verdict.accepted) {
        utils::Log(utils::LogLevel::kInfo, "pipeline", "submission rejected",
                   {{"rule", validator::ToString(verdict.rule)},
                    {"construct", verdict.offending_construct},
                    {"line", std::to_string(verdict.line)}});
        if (verdict.rule == validator::RuleKind::kSyntax) {
            return SolveResult::Error(ErrorKind::kSyntaxError, verdict.reason + ": " + verdict.offending_construct);
        }
        return SolveResult::Error(ErrorKind::kSecurityViolation, verdict.reason);
    }

    const auto outcome = executor_.Execute(code, entry_point, deadline_, args);
    switch (outcome.kind) {
        case sandbox::OutcomeKind::kValue:
            return SolveResult::Ok(outcome.value, outcome.display);
        case sandbox::OutcomeKind::kTimedOut:
            utils::Log(utils::LogLevel::kInfo, "pipeline", "submission timed out",
                       {{"entry_point", entry_point}, {"reason", outcome.message}});
            return SolveResult::Error(ErrorKind::kTimeout, outcome.message);
        case sandbox::OutcomeKind::kRuntimeFailure:
            utils::Log(utils::LogLevel::kInfo, "pipeline", "submission failed",
                       {{"entry_point", entry_point}, {"error", utils::Truncate(outcome.message, 256)}});
            return SolveResult::Error(ErrorKind::kExecutionFailed, outcome.message);
    }
    return SolveResult::Error(ErrorKind::kExecutionFailed, outcome.message);
}

std::unique_ptr<SubmissionPipeline> CreatePipeline(const config::Config& config) {
    validator::ValidatorOptions validator_options;
    validator_options.max_source_bytes = config.validator.max_source_bytes;
    validator_options.max_function_depth = config.validator.max_function_depth;

    sandbox::SandboxOptions sandbox_options;
    sandbox_options.worker_path = config::ResolveWorkerPath(config.sandbox);
    sandbox_options.limits.max_steps = config.sandbox.max_steps;
    sandbox_options.limits.max_recursion_depth = config.sandbox.max_recursion_depth;
    sandbox_options.limits.max_collection_size = config.sandbox.max_collection_size;
    sandbox_options.limits.memory_limit_bytes = config.sandbox.memory_limit_bytes;
    sandbox_options.limits.max_output_bytes = config.sandbox.max_output_bytes;

    return std::make_unique<SubmissionPipeline>(
        validator::StaticValidator(catalog::CapabilityCatalog::Default(), validator_options),
        sandbox::SandboxExecutor(std::move(sandbox_options)),
        std::chrono::milliseconds(config.sandbox.timeout_ms));
}

}  // namespace mathguard::pipeline
