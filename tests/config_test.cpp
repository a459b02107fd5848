#include <gtest/gtest.h>

#include <cstdlib>

#include "config/config_loader.hpp"

using namespace mathguard::config;

namespace {

// Points HOME at a directory without a config file and clears overrides.
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* home = std::getenv("HOME");
        saved_home_ = home ? home : "";
        ::setenv("HOME", "/nonexistent-mathguard-home", 1);
        for (const char* name : kOverrides) {
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        ::setenv("HOME", saved_home_.c_str(), 1);
        for (const char* name : kOverrides) {
            ::unsetenv(name);
        }
    }

    static constexpr const char* kOverrides[] = {
        "MATHGUARD_SANDBOX__TIMEOUT_MS", "MATHGUARD_SANDBOX_TIMEOUT_MS",
        "MATHGUARD_SANDBOX__WORKER_PATH", "MATHGUARD_SANDBOX__MAX_STEPS",
        "MATHGUARD_VALIDATOR__MAX_FUNCTION_DEPTH", "MATHGUARD_LOGGING__LEVEL", "MATHGUARD_LOG_LEVEL"};

    std::string saved_home_;
};

}  // namespace

TEST_F(ConfigTest, Defaults) {
    const Config config = LoadConfig();
    EXPECT_EQ(config.sandbox.timeout_ms, 10000);
    EXPECT_EQ(config.sandbox.memory_limit_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(config.validator.max_function_depth, 2);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.sandbox.worker_path.empty());
}

TEST_F(ConfigTest, JsonOverlay) {
    Config config;
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "sandbox": {"timeoutMs": 2500, "workerPath": "/opt/worker", "maxSteps": 99, "memoryLimitBytes": -5},
        "validator": {"maxFunctionDepth": 3},
        "logging": {"level": "debug"},
        "unknown": true
    })"));
    EXPECT_EQ(config.sandbox.timeout_ms, 2500);
    EXPECT_EQ(config.sandbox.worker_path, "/opt/worker");
    EXPECT_EQ(config.sandbox.max_steps, 99u);
    EXPECT_EQ(config.sandbox.memory_limit_bytes, 256ull * 1024 * 1024);
    EXPECT_EQ(config.validator.max_function_depth, 3);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, WrongTypesAreIgnored) {
    Config config;
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"timeoutMs": "fast"}, "validator": 7})"));
    EXPECT_EQ(config.sandbox.timeout_ms, 10000);
    ApplyConfigFromJson(config, nlohmann::json::parse("[1, 2]"));
    EXPECT_EQ(config.sandbox.timeout_ms, 10000);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    ::setenv("MATHGUARD_SANDBOX__TIMEOUT_MS", "750", 1);
    ::setenv("MATHGUARD_SANDBOX__WORKER_PATH", "/tmp/worker", 1);
    ::setenv("MATHGUARD_VALIDATOR__MAX_FUNCTION_DEPTH", "4", 1);
    ::setenv("MATHGUARD_LOG_LEVEL", "warn", 1);
    const Config config = LoadConfig();
    EXPECT_EQ(config.sandbox.timeout_ms, 750);
    EXPECT_EQ(config.sandbox.worker_path, "/tmp/worker");
    EXPECT_EQ(config.validator.max_function_depth, 4);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigTest, InvalidEnvironmentValuesAreIgnored) {
    ::setenv("MATHGUARD_SANDBOX__TIMEOUT_MS", "soon", 1);
    ::setenv("MATHGUARD_SANDBOX__MAX_STEPS", "-3", 1);
    const Config config = LoadConfig();
    EXPECT_EQ(config.sandbox.timeout_ms, 10000);
    EXPECT_EQ(config.sandbox.max_steps, SandboxConfig{}.max_steps);
}

TEST_F(ConfigTest, DoubleUnderscoreNameWins) {
    ::setenv("MATHGUARD_SANDBOX__TIMEOUT_MS", "100", 1);
    ::setenv("MATHGUARD_SANDBOX_TIMEOUT_MS", "200", 1);
    EXPECT_EQ(LoadConfig().sandbox.timeout_ms, 100);
}

TEST(WorkerPathTest, ExplicitPathIsKept) {
    SandboxConfig sandbox;
    sandbox.worker_path = "/usr/libexec/mathguard_worker";
    EXPECT_EQ(ResolveWorkerPath(sandbox), "/usr/libexec/mathguard_worker");
}

TEST(WorkerPathTest, DefaultsToTheExecutableDirectory) {
    const std::string resolved = ResolveWorkerPath(SandboxConfig{});
    const std::string suffix = "/mathguard_worker";
    ASSERT_GE(resolved.size(), suffix.size());
    EXPECT_EQ(resolved.substr(resolved.size() - suffix.size()), suffix);
}

TEST(ConfigPathTest, LivesUnderHome) {
    EXPECT_EQ(GetConfigPath().filename(), "config.json");
    EXPECT_EQ(GetConfigPath().parent_path().filename(), ".mathguard");
}
