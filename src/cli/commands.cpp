#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "config/config_loader.hpp"
#include "notifier/notifier.hpp"
#include "reminder/recurrence.hpp"
#include "reminder/reminder_service.hpp"
#include "reminder/reminder_store.hpp"
#include "reminder/scheduler_engine.hpp"
#include "server/reminder_http_server.hpp"
#include "utils/logging.hpp"

namespace {

using remindbot::utils::LogLevel;

volatile std::sig_atomic_t g_pending_signal = 0;

void OnSignal(int signal) {
    g_pending_signal = signal;
}

bool Alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

// ~/.remindbot/gateway.pid. A claimed file is removed when the object goes away.
class PidFile {
public:
    PidFile()
        : path_(remindbot::config::GetHomePath() / ".remindbot" / "gateway.pid") {}

    ~PidFile() {
        if (owned_) {
            Remove();
        }
    }

    PidFile(const PidFile&) = delete;
    PidFile& operator=(const PidFile&) = delete;

    // The pid recorded in the file, if that process is still alive.
    std::optional<pid_t> RunningPid() const {
        std::ifstream in(path_);
        pid_t pid = 0;
        if (!(in >> pid) || !Alive(pid)) {
            return std::nullopt;
        }
        return pid;
    }

    bool Claim() {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        std::ofstream out(path_, std::ios::trunc);
        if (!(out << ::getpid())) {
            return false;
        }
        owned_ = true;
        return true;
    }

    void Remove() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        owned_ = false;
    }

private:
    std::filesystem::path path_;
    bool owned_ = false;
};

bool WaitUntilGone(pid_t pid, std::chrono::seconds timeout) {
    const auto give_up = std::chrono::steady_clock::now() + timeout;
    while (Alive(pid)) {
        if (std::chrono::steady_clock::now() >= give_up) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return true;
}

int ExecGateway(const std::string& self) {
    const char* args[] = {self.c_str(), "gateway", nullptr};
    ::execv(self.c_str(), const_cast<char* const*>(args));
    std::cout << "Failed to restart gateway: " << std::strerror(errno) << std::endl;
    return 1;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = OnSignal;
    sigemptyset(&action.sa_mask);
    for (int signal : {SIGINT, SIGTERM, SIGHUP}) {
        sigaction(signal, &action, nullptr);
    }
}

// Loads config and applies the log level and reference timezone shared by every command.
std::optional<remindbot::config::Config> LoadSettings() {
    auto config = remindbot::config::LoadConfig();
    remindbot::utils::LogConfig log_config{};
    log_config.min_level = remindbot::utils::LogLevelFromString(config.log_level, LogLevel::kInfo);
    remindbot::utils::Configure(log_config);
    if (!remindbot::reminder::SetReferenceTimeZone(config.scheduler.timezone)) {
        std::cout << "Unknown timezone: " << config.scheduler.timezone << std::endl;
        return std::nullopt;
    }
    return config;
}

int Gateway(const std::vector<std::string>& args) {
    const auto config = LoadSettings();
    if (!config) {
        return 1;
    }
    if (config->notifier.base_url.empty()) {
        remindbot::utils::Log("config", LogLevel::kWarn,
                              "notifier.baseUrl is empty; reminders will fail to deliver");
    }

    PidFile pid_file;
    if (const auto other = pid_file.RunningPid()) {
        std::cout << "remindbot gateway already running (pid=" << *other << ")" << std::endl;
        return 1;
    }

    remindbot::reminder::SqliteReminderStore store(config->store.path);
    if (!store.IsOpen()) {
        std::cout << "Failed to open reminder store at " << config->store.path << std::endl;
        return 1;
    }
    auto notifier = remindbot::notifier::CreateNotifier(*config);
    remindbot::reminder::SchedulerEngine engine(config->scheduler.worker_threads);
    remindbot::reminder::ReminderService reminders(store, engine, *notifier, config->store.page_size);
    remindbot::server::ReminderHttpServer http_server(reminders, engine);

    if (!pid_file.Claim()) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }
    InstallSignalHandlers();

    reminders.Restore();
    engine.Start();

    const auto host = config->server.host;
    const auto port = config->server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&]() {
        if (!http_server.Listen(host, port)) {
            listen_failed.store(true);
        }
    });
    std::cout << "remindbot gateway started on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;

    int received = 0;
    while (received == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        received = g_pending_signal;
    }
    if (received != 0) {
        // Hard stop if a timer or request hangs the shutdown.
        std::thread([] {
            std::this_thread::sleep_for(std::chrono::seconds(10));
            std::_Exit(130);
        }).detach();
    }

    http_server.Stop();
    http_thread.join();
    engine.Stop();
    pid_file.Remove();
    if (listen_failed.load()) {
        return 1;
    }
    if (received == SIGHUP) {
        return ExecGateway(args.front());
    }
    return 0;
}

int Restart(const std::vector<std::string>& args) {
    PidFile pid_file;
    if (const auto pid = pid_file.RunningPid()) {
        ::kill(*pid, SIGTERM);
        if (!WaitUntilGone(*pid, std::chrono::seconds(12))) {
            std::cout << "remindbot gateway (pid=" << *pid << ") did not stop." << std::endl;
            return 1;
        }
    }
    pid_file.Remove();
    return ExecGateway(args.front());
}

int Hup(const std::vector<std::string>&) {
    const auto pid = PidFile().RunningPid();
    if (!pid) {
        std::cout << "remindbot gateway not running." << std::endl;
        return 1;
    }
    ::kill(*pid, SIGHUP);
    return 0;
}

// remindbot next "<RRULE>" [count]: upcoming occurrences of a rule anchored at now.
int Next(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cout << "Usage: remindbot next \"RRULE\" [count]" << std::endl;
        return 1;
    }
    int count = 5;
    if (args.size() >= 4) {
        try {
            count = std::stoi(args[3]);
        } catch (const std::logic_error&) {
            std::cout << "count must be an integer" << std::endl;
            return 1;
        }
    }
    if (!LoadSettings()) {
        return 1;
    }
    try {
        const auto rule = remindbot::reminder::ParseRecurrenceRule(args[2]);
        const auto anchor = remindbot::utils::Now();
        auto cursor = anchor;
        for (int i = 0; i < count; ++i) {
            const auto next = remindbot::reminder::NextAfter(rule, anchor, cursor);
            if (!next) {
                std::cout << "(no further occurrences)" << std::endl;
                break;
            }
            std::cout << remindbot::utils::FormatLocalTime(*next) << std::endl;
            cursor = *next;
        }
    } catch (const remindbot::reminder::ScheduleError& ex) {
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);
    const std::map<std::string, std::function<int(const std::vector<std::string>&)>> commands{
        {"gateway", Gateway},
        {"restart", Restart},
        {"hup", Hup},
        {"next", Next},
    };
    if (args.size() >= 2) {
        auto it = commands.find(args[1]);
        if (it != commands.end()) {
            return it->second(args);
        }
    }
    std::cout << "Usage: remindbot gateway | remindbot restart | remindbot hup | remindbot next \"RRULE\" [count]"
              << std::endl;
    return 1;
}
