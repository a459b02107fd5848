#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "tools/safe_execute_code.hpp"
#include "tools/tool_registry.hpp"

using namespace mathguard;

namespace {

class EchoTool : public tools::Tool {
public:
    std::string Name() const override { return "echo"; }
    std::string Description() const override { return "Echo the text parameter."; }
    std::string ParametersJson() const override {
        return R"({"type":"object","properties":{"text":{"type":"string"}}})";
    }
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override {
        auto it = params.find("text");
        return it == params.end() ? "" : it->second;
    }
};

class SafeExecuteCodeToolTest : public ::testing::Test {
protected:
    SafeExecuteCodeToolTest()
        : pipeline_(validator::StaticValidator(),
                    sandbox::SandboxExecutor(sandbox::SandboxOptions{MATHGUARD_WORKER_BINARY, {}}),
                    std::chrono::milliseconds(1000)),
          tool_(pipeline_) {}

    nlohmann::json Run(const std::unordered_map<std::string, std::string>& params) {
        return nlohmann::json::parse(tool_.Execute(params));
    }

    pipeline::SubmissionPipeline pipeline_;
    tools::SafeExecuteCodeTool tool_;
};

}  // namespace

TEST(ToolRegistryTest, RegisterLookupAndExecute) {
    tools::ToolRegistry registry;
    registry.Register(std::make_unique<EchoTool>());
    EXPECT_TRUE(registry.Has("echo"));
    EXPECT_FALSE(registry.Has("missing"));
    ASSERT_NE(registry.Get("echo"), nullptr);
    EXPECT_EQ(registry.Execute("echo", {{"text", "hello"}}), "hello");
    EXPECT_EQ(registry.Execute("missing", {}), "Error: Tool 'missing' not found");
    EXPECT_EQ(registry.List(), std::vector<std::string>{"echo"});
}

TEST(ToolRegistryTest, DefinitionsDescribeEveryTool) {
    tools::ToolRegistry registry;
    registry.Register(std::make_unique<EchoTool>());
    const auto defs = registry.GetDefinitions();
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].name, "echo");
    EXPECT_EQ(defs[0].description, "Echo the text parameter.");
    EXPECT_NO_THROW(nlohmann::json::parse(defs[0].parameters_json));
}

TEST_F(SafeExecuteCodeToolTest, DescribesItself) {
    EXPECT_EQ(tool_.Name(), "safe_execute_code");
    const auto schema = nlohmann::json::parse(tool_.ParametersJson());
    EXPECT_TRUE(schema["properties"].contains("code_string"));
    EXPECT_TRUE(schema["properties"].contains("function_name"));
    EXPECT_TRUE(schema["properties"].contains("args"));
}

TEST_F(SafeExecuteCodeToolTest, ReturnsTheValue) {
    const auto reply = Run({{"code_string", "def add(a, b):\n    return a + b\n"},
                            {"function_name", "add"},
                            {"args", "[2, 3]"}});
    EXPECT_EQ(reply["ok"], true);
    EXPECT_EQ(reply["value"], 5);
    EXPECT_EQ(reply["display"], "5");
}

TEST_F(SafeExecuteCodeToolTest, ReportsTimeouts) {
    const auto reply = Run({{"code_string", "def spin():\n    while True:\n        pass\n"},
                            {"function_name", "spin"}});
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["error"], "timeout");
    EXPECT_TRUE(reply["message"].is_string());
}

TEST_F(SafeExecuteCodeToolTest, ReportsSecurityViolations) {
    const auto reply = Run({{"code_string", "import os\ndef f():\n    return 1\n"}, {"function_name", "f"}});
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["error"], "security_violation");
}

TEST_F(SafeExecuteCodeToolTest, ReportsExecutionFailures) {
    const auto reply = Run({{"code_string", "def f():\n    return 1 // 0\n"}, {"function_name", "f"}});
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["error"], "execution_failed");
    EXPECT_EQ(reply["message"], "ZeroDivisionError: integer division or modulo by zero");
}

TEST_F(SafeExecuteCodeToolTest, RejectsMalformedParameters) {
    EXPECT_EQ(Run({{"function_name", "f"}})["error"], "invalid_arguments");
    EXPECT_EQ(Run({{"code_string", "x = 1"}})["error"], "invalid_arguments");
    EXPECT_EQ(Run({{"code_string", "x = 1"}, {"function_name", "f"}, {"args", "not json"}})["error"],
              "invalid_arguments");
    EXPECT_EQ(Run({{"code_string", "x = 1"}, {"function_name", "f"}, {"args", "{\"a\": 1}"}})["error"],
              "invalid_arguments");
    EXPECT_EQ(Run({{"code_string", "x = 1"}, {"function_name", "f"}, {"args", "[[1]]"}})["error"],
              "invalid_arguments");
}

TEST_F(SafeExecuteCodeToolTest, WorksThroughTheRegistry) {
    tools::ToolRegistry registry;
    registry.Register(std::make_unique<tools::SafeExecuteCodeTool>(pipeline_));
    const auto reply = nlohmann::json::parse(registry.Execute(
        "safe_execute_code", {{"code_string", "def f():\n    return 'ok'\n"}, {"function_name", "f"}}));
    EXPECT_EQ(reply["ok"], true);
    EXPECT_EQ(reply["value"], "ok");
}
