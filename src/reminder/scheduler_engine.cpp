#include "reminder/scheduler_engine.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "utils/logging.hpp"

namespace remindbot::reminder {
namespace {

using remindbot::utils::LogLevel;

}  // namespace

SchedulerEngine::SchedulerEngine(std::size_t worker_threads, JobHandler on_fire)
    : on_fire_(std::move(on_fire))
    , worker_count_(worker_threads == 0 ? 1 : worker_threads) {}

SchedulerEngine::~SchedulerEngine() {
    Stop();
}

void SchedulerEngine::SetJobHandler(JobHandler on_fire) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_fire_ = std::move(on_fire);
}

void SchedulerEngine::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    timer_thread_ = std::thread([this]() { RunTimerLoop(); });
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { RunWorker(); });
    }
    remindbot::utils::Log("scheduler", remindbot::utils::LogMessage{
        LogLevel::kInfo, "started", {{"workers", std::to_string(worker_count_)},
                                     {"pending", std::to_string(PendingCount())}}});
}

void SchedulerEngine::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    timer_cv_.notify_all();
    ready_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    remindbot::utils::Log("scheduler", LogLevel::kInfo, "stopped");
}

void SchedulerEngine::Schedule(const ReminderJob& job, TimePoint fire_at) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto generation = next_generation_++;
        const bool replaced = !table_.insert_or_assign(job.key, Entry{fire_at, generation, job}).second;
        timers_.push(Timer{fire_at, generation, job.key});
        if (replaced) {
            RetireTimer();
        }
    }
    remindbot::utils::Log("scheduler", remindbot::utils::LogMessage{
        LogLevel::kDebug, "scheduled", {{"key", job.key.ToString()},
                                        {"fire_at", remindbot::utils::FormatLocalTime(fire_at)}}});
    timer_cv_.notify_all();
}

bool SchedulerEngine::Cancel(const ReminderKey& key) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = table_.erase(key) > 0;
        if (removed) {
            RetireTimer();
        }
    }
    if (removed) {
        remindbot::utils::Log("scheduler", LogLevel::kDebug, "cancelled " + key.ToString());
        timer_cv_.notify_all();
    }
    return removed;
}

bool SchedulerEngine::IsScheduled(const ReminderKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.find(key) != table_.end();
}

std::optional<TimePoint> SchedulerEngine::NextFireAt(const ReminderKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(key);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second.fire_at;
}

std::size_t SchedulerEngine::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}

std::size_t SchedulerEngine::TimerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

// Caller holds mutex_. Rebuilds the heap from the table once dead entries outnumber live ones.
void SchedulerEngine::RetireTimer() {
    if (++stale_timers_ <= table_.size()) {
        return;
    }
    std::vector<Timer> live;
    live.reserve(table_.size());
    for (const auto& [key, entry] : table_) {
        live.push_back(Timer{entry.fire_at, entry.generation, key});
    }
    timers_ = decltype(timers_)(std::greater<Timer>(), std::move(live));
    stale_timers_ = 0;
}

SchedulerEngine::Status SchedulerEngine::GetStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Status status{};
    status.running = running_;
    status.pending = table_.size();
    for (const auto& [key, entry] : table_) {
        if (!status.next_wake_at.has_value() || entry.fire_at < *status.next_wake_at) {
            status.next_wake_at = entry.fire_at;
        }
    }
    return status;
}

void SchedulerEngine::RunTimerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (timers_.empty()) {
            timer_cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
            continue;
        }
        const auto next = timers_.top();
        auto it = table_.find(next.key);
        if (it == table_.end() || it->second.generation != next.generation) {
            // Cancelled or superseded.
            timers_.pop();
            if (stale_timers_ > 0) {
                --stale_timers_;
            }
            continue;
        }
        if (std::chrono::system_clock::now() < next.fire_at) {
            timer_cv_.wait_until(lock, next.fire_at);
            continue;
        }
        timers_.pop();
        ready_.push(std::move(it->second.job));
        table_.erase(it);
        ready_cv_.notify_one();
    }
}

void SchedulerEngine::RunWorker() {
    while (true) {
        ReminderJob job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_cv_.wait(lock, [this] { return !ready_.empty() || !running_; });
            if (ready_.empty()) {
                return;
            }
            job = std::move(ready_.front());
            ready_.pop();
        }
        if (!on_fire_) {
            continue;
        }
        try {
            on_fire_(job);
        } catch (const std::exception& ex) {
            remindbot::utils::Log("scheduler", remindbot::utils::LogMessage{
                LogLevel::kError, "fire handler failed", {{"key", job.key.ToString()}, {"error", ex.what()}}});
        }
    }
}

}  // namespace remindbot::reminder
