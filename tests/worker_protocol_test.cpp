#include <gtest/gtest.h>

#include <stdexcept>

#include "sandbox/worker_protocol.hpp"
#include "sandbox/worker_runner.hpp"

using namespace mathguard::sandbox;

TEST(WorkerProtocolTest, RequestRoundTrip) {
    WorkerRequest request;
    request.code = "def solve(a):\n    return a\n";
    request.entry_point = "solve";
    request.args = nlohmann::json::array({1, "two"});
    request.limits.max_steps = 1234;
    request.limits.cpu_seconds = 3;

    const nlohmann::json wire = ToJson(request);
    EXPECT_EQ(wire["limits"]["max_steps"], 1234);
    EXPECT_EQ(wire["limits"]["cpu_seconds"], 3);

    const WorkerRequest parsed = ParseRequest(wire);
    EXPECT_EQ(parsed.code, request.code);
    EXPECT_EQ(parsed.entry_point, "solve");
    EXPECT_EQ(parsed.args, request.args);
    EXPECT_EQ(parsed.limits.max_steps, 1234u);
    EXPECT_EQ(parsed.limits.cpu_seconds, 3);
}

TEST(WorkerProtocolTest, RequestDefaults) {
    const auto parsed = ParseRequest(nlohmann::json::parse(R"({"code": "x = 1", "entry_point": "f"})"));
    EXPECT_TRUE(parsed.args.is_array());
    EXPECT_TRUE(parsed.args.empty());
    EXPECT_EQ(parsed.limits.max_recursion_depth, WorkerLimits{}.max_recursion_depth);
}

TEST(WorkerProtocolTest, MalformedRequests) {
    EXPECT_THROW(ParseRequest(nlohmann::json::parse(R"({"entry_point": "f"})")), std::invalid_argument);
    EXPECT_THROW(ParseRequest(nlohmann::json::parse(R"({"code": 1, "entry_point": "f"})")), std::invalid_argument);
    EXPECT_THROW(ParseRequest(nlohmann::json::parse(R"({"code": "", "entry_point": "f", "args": {}})")),
                 std::invalid_argument);
    EXPECT_THROW(ParseRequest(nlohmann::json::parse("[]")), std::invalid_argument);
}

TEST(WorkerProtocolTest, ResponseShapes) {
    const auto value = ToJson(WorkerResponse::Value(4, "4"));
    EXPECT_EQ(value, nlohmann::json::parse(R"({"status": "value", "value": 4, "display": "4"})"));

    const auto error = ToJson(WorkerResponse::Error("ValueError", "math domain error"));
    EXPECT_EQ(error, nlohmann::json::parse(
                         R"({"status": "error", "error_type": "ValueError", "message": "math domain error"})"));

    const auto budget = ToJson(WorkerResponse::BudgetExceeded("step budget exhausted"));
    EXPECT_EQ(budget["status"], "budget_exceeded");
}

TEST(WorkerProtocolTest, ResponseParsing) {
    const auto value = ParseResponse(nlohmann::json::parse(R"({"status": "value", "value": [1, 2], "display": "[1, 2]"})"));
    EXPECT_EQ(value.status, WorkerStatus::kValue);
    EXPECT_EQ(value.value, nlohmann::json::parse("[1, 2]"));

    const auto error = ParseResponse(nlohmann::json::parse(R"({"status": "error", "error_type": "E", "message": "m"})"));
    EXPECT_EQ(error.status, WorkerStatus::kError);
    EXPECT_EQ(error.error_type, "E");

    EXPECT_THROW(ParseResponse(nlohmann::json::parse(R"({"status": "weird"})")), std::invalid_argument);
    EXPECT_THROW(ParseResponse(nlohmann::json::parse(R"({"status": "value"})")), std::invalid_argument);
    EXPECT_THROW(ParseResponse(nlohmann::json::parse(R"({"status": "error", "message": "m"})")),
                 std::invalid_argument);
}

TEST(WorkerRunnerTest, RunsTheEntryPoint) {
    WorkerRequest request;
    request.code = "def solve(a, b):\n    return a * b\n";
    request.entry_point = "solve";
    request.args = nlohmann::json::array({6, 7});
    const auto response = RunRequest(request);
    ASSERT_EQ(response.status, WorkerStatus::kValue);
    EXPECT_EQ(response.value, 42);
    EXPECT_EQ(response.display, "42");
}

TEST(WorkerRunnerTest, NestedNoneIsNull) {
    WorkerRequest request;
    request.code = "def solve():\n    d = {'a': 1}\n    return [1, None], d.get('zz'), {'k': None}\n";
    request.entry_point = "solve";
    const auto response = RunRequest(request);
    ASSERT_EQ(response.status, WorkerStatus::kValue) << response.message;
    EXPECT_EQ(response.value, nlohmann::json::parse("[[1, null], null, {\"k\": null}]"));
    EXPECT_EQ(response.display, "([1, None], None, {'k': None})");
}

TEST(WorkerRunnerTest, TopLevelNoneIsAnError) {
    WorkerRequest request;
    request.code = "def solve():\n    return {}.get('missing')\n";
    request.entry_point = "solve";
    const auto response = RunRequest(request);
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "TypeError");
    EXPECT_EQ(response.message, "the entry point returned None");
}

TEST(WorkerRunnerTest, StepBudgetBecomesBudgetExceeded) {
    WorkerRequest request;
    request.code = "def solve():\n    n = 0\n    while True:\n        n += 1\n";
    request.entry_point = "solve";
    request.limits.max_steps = 1000;
    EXPECT_EQ(RunRequest(request).status, WorkerStatus::kBudgetExceeded);
}

TEST(WorkerRunnerTest, CollectionLimitBecomesMemoryError) {
    WorkerRequest request;
    request.code = "def solve():\n    return len([0] * 10 ** 9)\n";
    request.entry_point = "solve";
    request.limits.max_collection_size = 1000;
    const auto response = RunRequest(request);
    ASSERT_EQ(response.status, WorkerStatus::kError);
    EXPECT_EQ(response.error_type, "MemoryError");
}
