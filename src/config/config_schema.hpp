#pragma once

#include <string>

namespace remindbot::config {

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct StoreConfig {
    std::string path = "~/.remindbot/reminders.db";
    int page_size = 10;
};

struct SchedulerConfig {
    // IANA zone all rules, timestamps and listings are evaluated in.
    std::string timezone = "UTC";
    int worker_threads = 4;
};

struct NotifierConfig {
    std::string base_url;
    std::string api_key;
    int timeout_s = 30;
};

struct Config {
    ServerConfig server;
    StoreConfig store;
    SchedulerConfig scheduler;
    NotifierConfig notifier;
    std::string log_level = "info";
};

}  // namespace remindbot::config
