#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "config/config_loader.hpp"

namespace evalbox::config {
namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("evalbox_config_test_" + std::to_string(::getpid()) + ".json");
        ::setenv("EVALBOX_CONFIG", path_.c_str(), 1);
    }

    void TearDown() override {
        for (const auto* name : kVariables) {
            ::unsetenv(name);
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void WriteConfig(const std::string& text) const {
        std::ofstream out(path_);
        out << text;
    }

    static constexpr const char* kVariables[] = {
        "EVALBOX_CONFIG",
        "EVALBOX_SANDBOX__ISOLATION",
        "EVALBOX_SANDBOX_ISOLATION",
        "EVALBOX_SANDBOX__TIMEOUT_MS",
        "EVALBOX_LIMITS__MAX_CALL_DEPTH",
        "EVALBOX_CACHE__ENABLED",
        "EVALBOX_LOG_LEVEL",
    };

    std::filesystem::path path_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFile) {
    const auto config = LoadConfig();
    EXPECT_EQ(config.sandbox.isolation, "thread");
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 256);
    EXPECT_EQ(config.limits.max_call_depth, 200);
    EXPECT_FALSE(config.cache.enabled);
    EXPECT_EQ(config.log.level, utils::LogLevel::kInfo);
    EXPECT_FALSE(config.sandbox.worker_path.empty());
}

TEST_F(ConfigLoaderTest, ReadsFile) {
    WriteConfig(R"({
        "sandbox": {"isolation": "process", "timeoutMs": 2000, "workerPath": "/opt/evalbox-worker"},
        "limits": {"maxCallDepth": 50, "maxOutputBytes": 1024},
        "cache": {"enabled": true, "capacity": 16},
        "log": {"level": "debug"}
    })");
    const auto config = LoadConfig();
    EXPECT_EQ(config.sandbox.isolation, "process");
    EXPECT_EQ(config.sandbox.timeout_ms, 2000);
    EXPECT_EQ(config.sandbox.worker_path, "/opt/evalbox-worker");
    EXPECT_EQ(config.limits.max_call_depth, 50);
    EXPECT_EQ(config.limits.max_output_bytes, 1024);
    EXPECT_TRUE(config.cache.enabled);
    EXPECT_EQ(config.cache.capacity, 16);
    EXPECT_EQ(config.log.level, utils::LogLevel::kDebug);
}

TEST_F(ConfigLoaderTest, IgnoresInvalidValues) {
    WriteConfig(R"({
        "sandbox": {"isolation": "container", "timeoutMs": -5},
        "limits": {"maxCallDepth": "deep"},
        "log": {"level": "verbose"}
    })");
    const auto config = LoadConfig();
    EXPECT_EQ(config.sandbox.isolation, "thread");
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
    EXPECT_EQ(config.limits.max_call_depth, 200);
    EXPECT_EQ(config.log.level, utils::LogLevel::kInfo);
}

TEST_F(ConfigLoaderTest, MalformedFileFallsBackToDefaults) {
    WriteConfig(R"({"sandbox": {"timeoutMs": 10)");
    const auto config = LoadConfig();
    EXPECT_EQ(config.sandbox.timeout_ms, 5000);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    WriteConfig(R"({"sandbox": {"isolation": "process", "timeoutMs": 2000}})");
    ::setenv("EVALBOX_SANDBOX__ISOLATION", "thread", 1);
    ::setenv("EVALBOX_SANDBOX__TIMEOUT_MS", "750", 1);
    ::setenv("EVALBOX_LIMITS__MAX_CALL_DEPTH", "not-a-number", 1);
    ::setenv("EVALBOX_CACHE__ENABLED", "yes", 1);
    ::setenv("EVALBOX_LOG_LEVEL", "warning", 1);
    const auto config = LoadConfig();
    EXPECT_EQ(config.sandbox.isolation, "thread");
    EXPECT_EQ(config.sandbox.timeout_ms, 750);
    EXPECT_EQ(config.limits.max_call_depth, 200);
    EXPECT_TRUE(config.cache.enabled);
    EXPECT_EQ(config.log.level, utils::LogLevel::kWarn);
}

TEST_F(ConfigLoaderTest, SingleUnderscoreSpellingIsAccepted) {
    ::setenv("EVALBOX_SANDBOX_ISOLATION", "process", 1);
    EXPECT_EQ(LoadConfig().sandbox.isolation, "process");
}

TEST_F(ConfigLoaderTest, ConfigPathFollowsEnvironment) {
    EXPECT_EQ(GetConfigPath(), path_);
    ::unsetenv("EVALBOX_CONFIG");
    EXPECT_EQ(GetConfigPath().filename(), "config.json");
    EXPECT_EQ(GetConfigPath().parent_path().filename(), ".evalbox");
}

}  // namespace
}  // namespace evalbox::config
