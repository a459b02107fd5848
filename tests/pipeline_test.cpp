#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "pipeline/submission_pipeline.hpp"

using namespace mathguard;
using pipeline::ErrorKind;
using pipeline::SubmissionPipeline;

namespace {

SubmissionPipeline MakePipeline(std::chrono::milliseconds deadline = std::chrono::milliseconds(5000)) {
    sandbox::SandboxOptions options;
    options.worker_path = MATHGUARD_WORKER_BINARY;
    return SubmissionPipeline(validator::StaticValidator(), sandbox::SandboxExecutor(options), deadline);
}

}  // namespace

TEST(PipelineTest, SimpleArithmetic) {
    const auto result = MakePipeline().Solve("def solve():\n    return 2 + 2\n", "solve");
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value, 4);
    EXPECT_EQ(result.display, "4");
}

TEST(PipelineTest, ForbiddenImportIsASecurityViolation) {
    const auto result = MakePipeline().Solve("import os\ndef solve():\n    return os.getcwd()\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kSecurityViolation);
    EXPECT_NE(result.message.find("os"), std::string::npos) << result.message;
}

TEST(PipelineTest, DomainErrorIsAnExecutionFailure) {
    const auto result = MakePipeline().Solve("import math\ndef solve():\n    return math.sqrt(-1)\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kExecutionFailed);
    EXPECT_EQ(result.message, "ValueError: math domain error");
}

TEST(PipelineTest, ReflectionEscapesAreSecurityViolations) {
    const auto pipeline = MakePipeline();
    const char* attempts[] = {
        "def solve():\n    return getattr(1, '__class__')\n",
        "def solve():\n    return (1).__class__.__bases__[0].__subclasses__()\n",
        "def solve():\n    return [c for c in ().__class__.__base__.__subclasses__()]\n",
        "def solve():\n    return __import__('os').system('true')\n",
        "def solve():\n    f = lambda: 0\n    return f.__globals__\n",
    };
    for (const char* code : attempts) {
        const auto result = pipeline.Solve(code, "solve");
        ASSERT_FALSE(result.ok) << code;
        EXPECT_EQ(result.error, ErrorKind::kSecurityViolation) << code;
    }
}

TEST(PipelineTest, InfiniteLoopTimesOut) {
    const auto result = MakePipeline(std::chrono::milliseconds(1000)).Solve(
        "def solve():\n    while True:\n        pass\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kTimeout);
}

TEST(PipelineTest, SyntaxErrorsAreReportedSeparately) {
    const auto result = MakePipeline().Solve("def solve(:\n    return 1\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kSyntaxError);
    EXPECT_EQ(result.message.rfind("syntax error", 0), 0u) << result.message;
}

TEST(PipelineTest, ArgumentsAndStructuredResults) {
    const auto result = MakePipeline().Solve(
        "from fractions import Fraction\n"
        "def solve(n):\n"
        "    return {'n': n, 'half': Fraction(n, 2), 'squares': [i * i for i in range(n)]}\n",
        "solve", nlohmann::json::array({3}));
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value, nlohmann::json::parse(R"({"n": 3, "half": "3/2", "squares": [0, 1, 4]})"));
}

TEST(PipelineTest, MissingEntryPointFails) {
    const auto result = MakePipeline().Solve("def other():\n    return 1\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kExecutionFailed);
    EXPECT_EQ(result.message.rfind("NameError", 0), 0u) << result.message;
}

TEST(PipelineTest, NoneResultFails) {
    const auto result = MakePipeline().Solve("def solve():\n    x = 1\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kExecutionFailed);
}

TEST(PipelineTest, CreatePipelineHonoursConfiguration) {
    config::Config config;
    config.sandbox.worker_path = MATHGUARD_WORKER_BINARY;
    config.sandbox.timeout_ms = 1500;
    const auto created = pipeline::CreatePipeline(config);
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->deadline(), std::chrono::milliseconds(1500));
    const auto result = created->Solve("def solve():\n    return 6 * 7\n", "solve");
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value, 42);
}

TEST(PipelineTest, ErrorKindNames) {
    EXPECT_STREQ(pipeline::ToString(ErrorKind::kSecurityViolation), "security_violation");
    EXPECT_STREQ(pipeline::ToString(ErrorKind::kTimeout), "timeout");
}

TEST(PipelineTest, RepeatedSolvesGiveTheSameOutcome) {
    const SubmissionPipeline pipeline = MakePipeline(std::chrono::milliseconds(1000));
    const std::string cases[][2] = {
        {"def solve():\n    return sum(range(10))\n", "solve"},
        {"import os\ndef solve():\n    return 1\n", "solve"},
        {"def solve(:\n    return 1\n", "solve"},
        {"import math\ndef solve():\n    return math.log(0)\n", "solve"},
        {"def solve():\n    while True:\n        pass\n", "solve"},
    };
    for (const auto& [code, entry_point] : cases) {
        const auto first = pipeline.Solve(code, entry_point);
        for (int i = 0; i < 2; ++i) {
            const auto again = pipeline.Solve(code, entry_point);
            EXPECT_EQ(again.ok, first.ok) << code;
            EXPECT_EQ(again.error, first.error) << code;
            EXPECT_EQ(again.value, first.value) << code;
        }
    }
}

TEST(PipelineTest, LongOperatorChainIsASyntaxError) {
    std::string code = "def solve():\n    return 1";
    for (int i = 0; i < 30000; ++i) {
        code += "+1";
    }
    const auto result = MakePipeline().Solve(code + "\n", "solve");
    ASSERT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::kSyntaxError);
}

TEST(PipelineTest, LeadingZeroFractionText) {
    const auto result = MakePipeline().Solve(
        "from fractions import Fraction\ndef solve():\n    return Fraction('0.10') + Fraction('0.9')\n", "solve");
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.value, "1");
    EXPECT_EQ(result.display, "Fraction(1, 1)");
}
