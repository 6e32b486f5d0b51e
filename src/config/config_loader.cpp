#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace remindbot::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        if (server.contains("port") && server["port"].is_number_integer()) {
            config.server.port = server["port"].get<int>();
        }
    }

    if (data.contains("store") && data["store"].is_object()) {
        const auto& store = data["store"];
        if (store.contains("path") && store["path"].is_string()) {
            config.store.path = store["path"].get<std::string>();
        }
        if (store.contains("pageSize") && store["pageSize"].is_number_integer()) {
            config.store.page_size = store["pageSize"].get<int>();
        }
    }

    if (data.contains("scheduler") && data["scheduler"].is_object()) {
        const auto& scheduler = data["scheduler"];
        if (scheduler.contains("timezone") && scheduler["timezone"].is_string()) {
            config.scheduler.timezone = scheduler["timezone"].get<std::string>();
        }
        if (scheduler.contains("workerThreads") && scheduler["workerThreads"].is_number_integer()) {
            config.scheduler.worker_threads = scheduler["workerThreads"].get<int>();
        }
    }

    if (data.contains("notifier") && data["notifier"].is_object()) {
        const auto& notifier = data["notifier"];
        if (notifier.contains("baseUrl") && notifier["baseUrl"].is_string()) {
            config.notifier.base_url = notifier["baseUrl"].get<std::string>();
        }
        if (notifier.contains("apiKey") && notifier["apiKey"].is_string()) {
            config.notifier.api_key = notifier["apiKey"].get<std::string>();
        }
        if (notifier.contains("timeoutS") && notifier["timeoutS"].is_number_integer()) {
            config.notifier.timeout_s = notifier["timeoutS"].get<int>();
        }
    }

    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        config.log_level = data["logLevel"].get<std::string>();
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".remindbot" / "config.json";
}

std::string ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            // Keep defaults on parse errors
            remindbot::utils::Log("config", remindbot::utils::LogLevel::kWarn,
                                  "ignoring " + config_path.string() + ": " + ex.what());
        }
    }

    const auto host = GetEnvFallback("REMINDBOT_SERVER__HOST", "REMINDBOT_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("REMINDBOT_SERVER__PORT", "REMINDBOT_SERVER_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto store_path = GetEnvFallback("REMINDBOT_STORE__PATH", "REMINDBOT_STORE_PATH");
    if (!store_path.empty()) {
        config.store.path = store_path;
    }

    const auto page_size = GetEnvFallback("REMINDBOT_STORE__PAGE_SIZE", "REMINDBOT_STORE_PAGE_SIZE");
    if (!page_size.empty()) {
        config.store.page_size = ParseInt(page_size, config.store.page_size);
    }

    const auto timezone = GetEnvFallback("REMINDBOT_SCHEDULER__TIMEZONE", "REMINDBOT_SCHEDULER_TIMEZONE");
    if (!timezone.empty()) {
        config.scheduler.timezone = timezone;
    }

    const auto worker_threads = GetEnvFallback(
        "REMINDBOT_SCHEDULER__WORKER_THREADS",
        "REMINDBOT_SCHEDULER_WORKER_THREADS");
    if (!worker_threads.empty()) {
        config.scheduler.worker_threads = ParseInt(worker_threads, config.scheduler.worker_threads);
    }

    const auto base_url = GetEnvFallback("REMINDBOT_NOTIFIER__BASE_URL", "WA_API_URL");
    if (!base_url.empty()) {
        config.notifier.base_url = base_url;
    }

    const auto api_key = GetEnvFallback("REMINDBOT_NOTIFIER__API_KEY", "REMINDBOT_NOTIFIER_API_KEY");
    if (!api_key.empty()) {
        config.notifier.api_key = api_key;
    }

    const auto timeout = GetEnvFallback("REMINDBOT_NOTIFIER__TIMEOUT_S", "REMINDBOT_NOTIFIER_TIMEOUT_S");
    if (!timeout.empty()) {
        config.notifier.timeout_s = ParseInt(timeout, config.notifier.timeout_s);
    }

    const auto log_level = GetEnv("REMINDBOT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    if (config.store.page_size <= 0) {
        config.store.page_size = 10;
    }
    if (config.scheduler.worker_threads <= 0) {
        config.scheduler.worker_threads = 1;
    }
    config.store.path = ExpandHome(config.store.path);
    return config;
}

}  // namespace remindbot::config
