#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "config/config_loader.hpp"

namespace remindbot::config {
namespace {

const char* const kEnvVars[] = {
    "REMINDBOT_SERVER__HOST", "REMINDBOT_SERVER_HOST",
    "REMINDBOT_SERVER__PORT", "REMINDBOT_SERVER_PORT",
    "REMINDBOT_STORE__PATH", "REMINDBOT_STORE_PATH",
    "REMINDBOT_STORE__PAGE_SIZE", "REMINDBOT_STORE_PAGE_SIZE",
    "REMINDBOT_SCHEDULER__TIMEZONE", "REMINDBOT_SCHEDULER_TIMEZONE",
    "REMINDBOT_SCHEDULER__WORKER_THREADS", "REMINDBOT_SCHEDULER_WORKER_THREADS",
    "REMINDBOT_NOTIFIER__BASE_URL", "WA_API_URL",
    "REMINDBOT_NOTIFIER__API_KEY", "REMINDBOT_NOTIFIER_API_KEY",
    "REMINDBOT_NOTIFIER__TIMEOUT_S", "REMINDBOT_NOTIFIER_TIMEOUT_S",
    "REMINDBOT_LOG_LEVEL",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto* name : kEnvVars) {
            ::unsetenv(name);
        }
        dir_ = std::filesystem::temp_directory_path() / ("remindbot_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "config.json";
    }

    void TearDown() override {
        for (const auto* name : kEnvVars) {
            ::unsetenv(name);
        }
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void WriteConfig(const std::string& text) {
        std::ofstream output(path_, std::ios::trunc);
        output << text;
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

TEST_F(ConfigLoaderTest, MissingFileGivesDefaults) {
    const auto config = LoadConfig(dir_ / "absent.json");
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 18790);
    EXPECT_EQ(config.store.page_size, 10);
    EXPECT_EQ(config.scheduler.timezone, "UTC");
    EXPECT_EQ(config.scheduler.worker_threads, 4);
    EXPECT_EQ(config.notifier.timeout_s, 30);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.store.path, (GetHomePath() / ".remindbot/reminders.db").string());
}

TEST_F(ConfigLoaderTest, ReadsJsonFile) {
    WriteConfig(R"({
        "server": {"host": "0.0.0.0", "port": 9000},
        "store": {"path": "/tmp/r.db", "pageSize": 5},
        "scheduler": {"timezone": "Europe/Amsterdam", "workerThreads": 2},
        "notifier": {"baseUrl": "http://agents.local/api", "apiKey": "secret", "timeoutS": 5},
        "logLevel": "debug"
    })");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.store.path, "/tmp/r.db");
    EXPECT_EQ(config.store.page_size, 5);
    EXPECT_EQ(config.scheduler.timezone, "Europe/Amsterdam");
    EXPECT_EQ(config.scheduler.worker_threads, 2);
    EXPECT_EQ(config.notifier.base_url, "http://agents.local/api");
    EXPECT_EQ(config.notifier.api_key, "secret");
    EXPECT_EQ(config.notifier.timeout_s, 5);
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    WriteConfig(R"({"server": {"port": 9000}, "notifier": {"baseUrl": "http://file"}})");
    ::setenv("REMINDBOT_SERVER__PORT", "9100", 1);
    ::setenv("REMINDBOT_NOTIFIER__BASE_URL", "http://env", 1);
    ::setenv("REMINDBOT_SCHEDULER_TIMEZONE", "America/New_York", 1);
    ::setenv("REMINDBOT_LOG_LEVEL", "warn", 1);
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.port, 9100);
    EXPECT_EQ(config.notifier.base_url, "http://env");
    EXPECT_EQ(config.scheduler.timezone, "America/New_York");
    EXPECT_EQ(config.log_level, "warn");
}

TEST_F(ConfigLoaderTest, LegacyNotifierUrlVariable) {
    ::setenv("WA_API_URL", "http://legacy:8283", 1);
    EXPECT_EQ(LoadConfig(path_).notifier.base_url, "http://legacy:8283");
}

TEST_F(ConfigLoaderTest, InvalidJsonKeepsDefaults) {
    WriteConfig("{ not json");
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.server.port, 18790);
}

TEST_F(ConfigLoaderTest, OutOfRangeValuesAreSanitized) {
    WriteConfig(R"({"store": {"pageSize": 0, "path": "~/data/r.db"}, "scheduler": {"workerThreads": -3}})");
    ::setenv("REMINDBOT_SERVER__PORT", "not-a-port", 1);
    const auto config = LoadConfig(path_);
    EXPECT_EQ(config.store.page_size, 10);
    EXPECT_EQ(config.scheduler.worker_threads, 1);
    EXPECT_EQ(config.server.port, 18790);
    EXPECT_EQ(config.store.path, (GetHomePath() / "data/r.db").string());
}

}  // namespace
}  // namespace remindbot::config
