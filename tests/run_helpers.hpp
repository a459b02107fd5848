#pragma once

#include <cstdint>
#include <string>

#include <gtest/gtest.h>

#include "sandbox/worker_runner.hpp"

namespace mathguard::testing {

// Runs a submission in-process, without a worker, validator or deadline.
inline sandbox::WorkerResponse RunCode(const std::string& code,
                                       const std::string& entry_point = "solve",
                                       nlohmann::json args = nlohmann::json::array(),
                                       std::uint64_t max_steps = 5'000'000) {
    sandbox::WorkerRequest request;
    request.code = code;
    request.entry_point = entry_point;
    request.args = std::move(args);
    request.limits.max_steps = max_steps;
    return sandbox::RunRequest(request);
}

// repr() of `expression` evaluated inside solve() after `prelude` (imports).
inline std::string Eval(const std::string& expression, const std::string& prelude = "") {
    const auto response = RunCode(prelude + "def solve():\n    return " + expression + "\n");
    if (response.status != sandbox::WorkerStatus::kValue) {
        ADD_FAILURE() << expression << " -> " << response.error_type << ": " << response.message;
        return {};
    }
    return response.display;
}

// "Type: message" of the error `expression` raises.
inline std::string EvalError(const std::string& expression, const std::string& prelude = "") {
    const auto response = RunCode(prelude + "def solve():\n    return " + expression + "\n");
    if (response.status != sandbox::WorkerStatus::kError) {
        ADD_FAILURE() << expression << " did not fail, got " << response.display;
        return {};
    }
    return response.error_type + ": " + response.message;
}

}  // namespace mathguard::testing
