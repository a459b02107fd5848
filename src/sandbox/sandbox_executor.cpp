#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace mathguard::sandbox {
namespace bp = boost::process;
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr std::size_t kLoggedStderrBytes = 2048;

// The request, stdout and stderr files of one execution, inside a per-call
// directory that mkdtemp creates with mode 0700.
class TempFiles {
public:
    TempFiles() {
        std::string pattern = (std::filesystem::temp_directory_path() / "mathguard_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            return;
        }
        dir = pattern;
        request = dir / "request.json";
        stdout_path = dir / "stdout.log";
        stderr_path = dir / "stderr.log";
    }

    ~TempFiles() {
        if (!dir.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
        }
    }

    TempFiles(const TempFiles&) = delete;
    TempFiles& operator=(const TempFiles&) = delete;

    bool ok() const { return !dir.empty(); }

    std::filesystem::path dir;
    std::filesystem::path request;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
};

double CpuSeconds(const struct rusage& usage) {
    return static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
        static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
}

std::string ReadFile(const std::filesystem::path& path, std::size_t limit) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string content(limit, '\0');
    input.read(&content[0], static_cast<std::streamsize>(limit));
    content.resize(static_cast<std::size_t>(input.gcount()));
    return content;
}

ExecutionOutcome FromResponse(const WorkerResponse& response) {
    switch (response.status) {
        case WorkerStatus::kValue:
            return ExecutionOutcome::Value(response.value, response.display);
        case WorkerStatus::kBudgetExceeded:
            return ExecutionOutcome::TimedOut(response.message);
        case WorkerStatus::kError:
            break;
    }
    return ExecutionOutcome::RuntimeFailure(response.error_type + ": " + response.message);
}

}  // namespace

const char* ToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::kValue: return "value";
        case OutcomeKind::kTimedOut: return "timed_out";
        case OutcomeKind::kRuntimeFailure: return "runtime_failure";
    }
    return "runtime_failure";
}

ExecutionOutcome ExecutionOutcome::Value(nlohmann::json value, std::string display) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kValue;
    outcome.value = std::move(value);
    outcome.display = std::move(display);
    return outcome;
}

ExecutionOutcome ExecutionOutcome::TimedOut(std::string message) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kTimedOut;
    outcome.message = std::move(message);
    return outcome;
}

ExecutionOutcome ExecutionOutcome::RuntimeFailure(std::string message) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kRuntimeFailure;
    outcome.message = std::move(message);
    return outcome;
}

SandboxExecutor::SandboxExecutor(SandboxOptions options) : options_(std::move(options)) {}

ExecutionOutcome SandboxExecutor::Execute(const std::string& code,
                                          const std::string& entry_point,
                                          std::chrono::milliseconds deadline,
                                          const nlohmann::json& args) const {
    WorkerRequest request;
    request.code = code;
    request.entry_point = entry_point;
    request.args = args;
    request.limits = options_.limits;
    const auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(deadline).count();
    request.limits.cpu_seconds = static_cast<int>(whole_seconds) + 1;

    TempFiles files;
    if (!files.ok()) {
        utils::Log(utils::LogLevel::kError, "sandbox", "cannot create a private temporary directory",
                   {{"dir", std::filesystem::temp_directory_path().string()}});
        return ExecutionOutcome::RuntimeFailure("SandboxError: cannot create temporary directory");
    }
    {
        std::ofstream output(files.request, std::ios::trunc);
        if (!output.is_open()) {
            utils::Log(utils::LogLevel::kError, "sandbox", "cannot write worker request",
                       {{"path", files.request.string()}});
            return ExecutionOutcome::RuntimeFailure("SandboxError: cannot write worker request");
        }
        output << ToJson(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    int status = 0;
    struct rusage usage {};
    bool finished = false;
    bool timed_out = false;
    bool lost = false;
    const auto started = std::chrono::steady_clock::now();
    try {
        bp::environment env;
        env.clear();
        bp::child child_process(
            bp::exe = options_.worker_path,
            env,
            bp::std_in < files.request.string(),
            bp::std_out > files.stdout_path.string(),
            bp::std_err > files.stderr_path.string());

        const pid_t pid = child_process.id();
        utils::Log(utils::LogLevel::kDebug, "sandbox", "worker started",
                   {{"pid", std::to_string(pid)}, {"entry_point", entry_point}});
        const auto stop_at = started + deadline;
        while (std::chrono::steady_clock::now() < stop_at) {
            const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                lost = true;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        if (!finished && !lost) {
            timed_out = true;
            ::kill(pid, SIGKILL);
            ::wait4(pid, &status, 0, &usage);
        }
    } catch (const bp::process_error& ex) {
        utils::Log(utils::LogLevel::kError, "sandbox", "worker spawn failed",
                   {{"worker", options_.worker_path}, {"error", ex.what()}});
        return ExecutionOutcome::RuntimeFailure(std::string("SandboxError: cannot start worker: ") + ex.what());
    }

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (timed_out) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "worker killed at deadline",
                   {{"deadline_ms", std::to_string(deadline.count())}});
        return ExecutionOutcome::TimedOut("execution exceeded " + std::to_string(deadline.count()) + " ms");
    }
    if (lost) {
        utils::Log(utils::LogLevel::kError, "sandbox", "waiting for the worker failed",
                   {{"error", std::strerror(errno)}});
        return ExecutionOutcome::RuntimeFailure("SandboxError: lost track of the worker process");
    }
    if (WIFSIGNALED(status)) {
        const int signal_number = WTERMSIG(status);
        // SIGXCPU is the soft CPU limit; the hard limit one second later is a
        // SIGKILL, told apart from other kills by the CPU time actually used.
        const bool cpu_limit = signal_number == SIGXCPU ||
            (signal_number == SIGKILL && CpuSeconds(usage) >= static_cast<double>(request.limits.cpu_seconds));
        if (cpu_limit) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "worker hit its CPU limit",
                       {{"signal", std::to_string(signal_number)}});
            return ExecutionOutcome::TimedOut("CPU time limit exceeded");
        }
        utils::Log(utils::LogLevel::kWarn, "sandbox", "worker crashed",
                   {{"signal", std::to_string(signal_number)},
                    {"stderr", ReadFile(files.stderr_path, kLoggedStderrBytes)}});
        return ExecutionOutcome::RuntimeFailure("SandboxError: worker terminated by signal " +
                                                std::to_string(signal_number));
    }
    const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code != 0) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "worker failed",
                   {{"exit_code", std::to_string(exit_code)},
                    {"stderr", ReadFile(files.stderr_path, kLoggedStderrBytes)}});
        return ExecutionOutcome::RuntimeFailure("SandboxError: worker exited with status " +
                                                std::to_string(exit_code));
    }

    const std::string output = ReadFile(files.stdout_path, options_.limits.max_output_bytes);
    try {
        const ExecutionOutcome outcome = FromResponse(ParseResponse(nlohmann::json::parse(output)));
        utils::Log(utils::LogLevel::kDebug, "sandbox", "worker finished",
                   {{"outcome", ToString(outcome.kind)}, {"elapsed_ms", std::to_string(elapsed_ms)}});
        return outcome;
    } catch (const nlohmann::json::exception& ex) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "unparseable worker output",
                   {{"error", ex.what()}, {"output", utils::Truncate(output, 256)}});
    } catch (const std::invalid_argument& ex) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "malformed worker response", {{"error", ex.what()}});
    }
    return ExecutionOutcome::RuntimeFailure("SandboxError: worker produced unreadable output");
}

}  // namespace mathguard::sandbox
