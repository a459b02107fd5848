#include <cstdio>
#include <iostream>
#include <iterator>
#include <new>
#include <stdexcept>
#include <string>

#include <sys/resource.h>

#include <nlohmann/json.hpp>

#include "sandbox/worker_protocol.hpp"
#include "sandbox/worker_runner.hpp"
#include "utils/logging.hpp"

namespace {

// Exit status for requests the worker could not even read.
constexpr int kProtocolFailure = 3;

bool SetLimit(int resource, rlim_t value) {
    struct rlimit limit {};
    limit.rlim_cur = value;
    limit.rlim_max = value;
    return ::setrlimit(resource, &limit) == 0;
}

void ApplyLimits(const mathguard::sandbox::WorkerLimits& limits) {
    bool ok = true;
    if (limits.memory_limit_bytes > 0) {
        ok = SetLimit(RLIMIT_AS, static_cast<rlim_t>(limits.memory_limit_bytes)) && ok;
    }
    if (limits.cpu_seconds > 0) {
        // The soft limit raises SIGXCPU; the hard limit one second later is
        // the fallback SIGKILL.
        struct rlimit cpu {};
        cpu.rlim_cur = static_cast<rlim_t>(limits.cpu_seconds);
        cpu.rlim_max = static_cast<rlim_t>(limits.cpu_seconds) + 1;
        ok = ::setrlimit(RLIMIT_CPU, &cpu) == 0 && ok;
    }
    ok = SetLimit(RLIMIT_FSIZE, static_cast<rlim_t>(limits.max_output_bytes)) && ok;
    ok = SetLimit(RLIMIT_CORE, 0) && ok;
    ok = SetLimit(RLIMIT_NOFILE, 16) && ok;
    ok = SetLimit(RLIMIT_NPROC, 0) && ok;
    if (!ok) {
        mathguard::utils::Log(mathguard::utils::LogLevel::kWarn, "worker", "failed to apply some resource limits");
    }
}

void Respond(const mathguard::sandbox::WorkerResponse& response) {
    std::cout << mathguard::sandbox::ToJson(response).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
}

}  // namespace

int main() {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    mathguard::sandbox::WorkerRequest request;
    try {
        request = mathguard::sandbox::ParseRequest(nlohmann::json::parse(input));
    } catch (const nlohmann::json::exception& ex) {
        mathguard::utils::Log(mathguard::utils::LogLevel::kError, "worker", "unreadable request",
                              {{"error", ex.what()}});
        return kProtocolFailure;
    } catch (const std::invalid_argument& ex) {
        mathguard::utils::Log(mathguard::utils::LogLevel::kError, "worker", "malformed request",
                              {{"error", ex.what()}});
        return kProtocolFailure;
    }
    input.clear();
    input.shrink_to_fit();

    ApplyLimits(request.limits);
    try {
        Respond(mathguard::sandbox::RunRequest(request));
    } catch (const std::bad_alloc&) {
        Respond(mathguard::sandbox::WorkerResponse::Error("MemoryError", "out of memory"));
    }
    return 0;
}
