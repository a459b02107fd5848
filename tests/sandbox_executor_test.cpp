#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <thread>
#include <vector>

#include "sandbox/sandbox_executor.hpp"

using namespace mathguard::sandbox;
using namespace std::chrono_literals;

namespace {

SandboxExecutor MakeExecutor() {
    SandboxOptions options;
    options.worker_path = MATHGUARD_WORKER_BINARY;
    return SandboxExecutor(options);
}

// An executable shell script standing in for the worker binary.
class ScriptWorker {
public:
    explicit ScriptWorker(const std::string& body) {
        std::string pattern = (std::filesystem::temp_directory_path() / "mathguard_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) != nullptr) {
            dir_ = pattern;
            path_ = dir_ / "worker.sh";
            std::ofstream(path_) << "#!/bin/sh\n" << body << "\n";
            std::filesystem::permissions(path_, std::filesystem::perms::owner_all);
        }
    }
    ~ScriptWorker() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path dir_;
    std::filesystem::path path_;
};

}  // namespace

TEST(SandboxExecutorTest, ReturnsTheValue) {
    const auto outcome = MakeExecutor().Execute("def solve():\n    return 2 + 2\n", "solve", 5000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kValue) << outcome.message;
    EXPECT_EQ(outcome.value, 4);
    EXPECT_EQ(outcome.display, "4");
}

TEST(SandboxExecutorTest, PassesArguments) {
    const auto outcome = MakeExecutor().Execute("def solve(xs):\n    return sum(xs)\n", "solve", 5000ms,
                                                nlohmann::json::array({nlohmann::json::array({1, 2, 3})}));
    ASSERT_EQ(outcome.kind, OutcomeKind::kValue) << outcome.message;
    EXPECT_EQ(outcome.value, 6);
}

TEST(SandboxExecutorTest, ScriptErrorsBecomeRuntimeFailures) {
    const auto outcome = MakeExecutor().Execute("import math\ndef solve():\n    return math.sqrt(-1)\n", "solve",
                                                5000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.message, "ValueError: math domain error");
}

TEST(SandboxExecutorTest, DecimalTextWithLeadingZeroRunsToCompletion) {
    const auto outcome = MakeExecutor().Execute(
        "from decimal import Decimal\ndef solve():\n    return str(Decimal('0.9') + Decimal('0.09'))\n", "solve",
        5000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kValue) << outcome.message;
    EXPECT_EQ(outcome.value, "0.99");
}

TEST(SandboxExecutorTest, InfiniteLoopIsKilledAtTheDeadline) {
    SandboxOptions options;
    options.worker_path = MATHGUARD_WORKER_BINARY;
    options.limits.max_steps = std::numeric_limits<std::uint64_t>::max();
    const SandboxExecutor executor(options);

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = executor.Execute("def solve():\n    while True:\n        pass\n", "solve", 500ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(outcome.kind, OutcomeKind::kTimedOut);
    EXPECT_LT(elapsed, 5s);
}

TEST(SandboxExecutorTest, StepBudgetIsReportedAsTimeout) {
    SandboxOptions options;
    options.worker_path = MATHGUARD_WORKER_BINARY;
    options.limits.max_steps = 10000;
    const auto outcome = SandboxExecutor(options).Execute("def solve():\n    while True:\n        pass\n", "solve",
                                                          5000ms);
    EXPECT_EQ(outcome.kind, OutcomeKind::kTimedOut);
}

TEST(SandboxExecutorTest, MissingWorkerIsAFailure) {
    SandboxOptions options;
    options.worker_path = "/nonexistent/mathguard_worker";
    const auto outcome = SandboxExecutor(options).Execute("def solve():\n    return 1\n", "solve", 1000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.message.rfind("SandboxError", 0), 0u) << outcome.message;
}

TEST(SandboxExecutorTest, KilledWorkerWithoutCpuUseIsACrash) {
    const ScriptWorker worker("kill -9 $$");
    ASSERT_FALSE(worker.path().empty());
    SandboxOptions options;
    options.worker_path = worker.path();
    const auto outcome = SandboxExecutor(options).Execute("def solve():\n    return 1\n", "solve", 5000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure) << outcome.message;
    EXPECT_EQ(outcome.message, "SandboxError: worker terminated by signal 9");
}

TEST(SandboxExecutorTest, UnreadableWorkerOutputIsAFailure) {
    const ScriptWorker worker("echo not-json");
    ASSERT_FALSE(worker.path().empty());
    SandboxOptions options;
    options.worker_path = worker.path();
    const auto outcome = SandboxExecutor(options).Execute("def solve():\n    return 1\n", "solve", 5000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.message, "SandboxError: worker produced unreadable output");
}

TEST(SandboxExecutorTest, RequestLivesInAPrivateDirectory) {
    const ScriptWorker worker(
        "PATH=/usr/bin:/bin\n"
        "dir=$(dirname \"$(readlink /proc/$$/fd/0)\")\n"
        "printf '{\"status\":\"value\",\"value\":\"%s\"}' \"$(stat -c %a \"$dir\")\"");
    ASSERT_FALSE(worker.path().empty());
    SandboxOptions options;
    options.worker_path = worker.path();
    const auto outcome = SandboxExecutor(options).Execute("def solve():\n    return 1\n", "solve", 5000ms);
    ASSERT_EQ(outcome.kind, OutcomeKind::kValue) << outcome.message;
    EXPECT_EQ(outcome.value, "700");
}

TEST(SandboxExecutorTest, ConcurrentExecutionsDoNotInterfere) {
    const SandboxExecutor executor = MakeExecutor();
    std::vector<ExecutionOutcome> outcomes(4);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        threads.emplace_back([&executor, &outcomes, i] {
            outcomes[i] = executor.Execute("def solve(n):\n    return n * n\n", "solve", 5000ms,
                                           nlohmann::json::array({static_cast<int>(i)}));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        ASSERT_EQ(outcomes[i].kind, OutcomeKind::kValue) << outcomes[i].message;
        EXPECT_EQ(outcomes[i].value, static_cast<int>(i * i));
    }
}

TEST(SandboxExecutorTest, OutcomeNames) {
    EXPECT_STREQ(ToString(OutcomeKind::kValue), "value");
    EXPECT_STREQ(ToString(OutcomeKind::kTimedOut), "timed_out");
    EXPECT_STREQ(ToString(OutcomeKind::kRuntimeFailure), "runtime_failure");
}
