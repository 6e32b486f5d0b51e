#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

#include "reminder/reminder_types.hpp"

namespace remindbot::reminder {

// Process-wide timer table. One registration per reminder key; a timer thread hands due jobs
// to a worker pool so a slow handler never delays other reminders.
class SchedulerEngine {
public:
    struct Status {
        bool running = false;
        std::size_t pending = 0;
        std::optional<TimePoint> next_wake_at;
    };

    using JobHandler = std::function<void(const ReminderJob&)>;

    explicit SchedulerEngine(std::size_t worker_threads = 4, JobHandler on_fire = {});
    ~SchedulerEngine();

    SchedulerEngine(const SchedulerEngine&) = delete;
    SchedulerEngine& operator=(const SchedulerEngine&) = delete;

    // Must be called before Start.
    void SetJobHandler(JobHandler on_fire);

    void Start();
    // Stops the timer thread, lets workers finish jobs already handed to them, joins everything.
    void Stop();

    // Replaces any registration for job.key; the superseded one never fires.
    void Schedule(const ReminderJob& job, TimePoint fire_at);
    // Returns false when nothing was registered for the key.
    bool Cancel(const ReminderKey& key);

    bool IsScheduled(const ReminderKey& key) const;
    std::optional<TimePoint> NextFireAt(const ReminderKey& key) const;
    std::size_t PendingCount() const;
    // Heap entries, live and superseded.
    std::size_t TimerCount() const;
    Status GetStatus() const;

private:
    struct Entry {
        TimePoint fire_at;
        std::uint64_t generation = 0;
        ReminderJob job;
    };

    struct Timer {
        TimePoint fire_at;
        std::uint64_t generation = 0;
        ReminderKey key;

        bool operator>(const Timer& other) const {
            if (fire_at != other.fire_at) {
                return fire_at > other.fire_at;
            }
            return generation > other.generation;
        }
    };

    void RetireTimer();
    void RunTimerLoop();
    void RunWorker();

    JobHandler on_fire_;
    std::size_t worker_count_;
    std::map<ReminderKey, Entry> table_;
    std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
    std::queue<ReminderJob> ready_;
    std::uint64_t next_generation_ = 1;
    std::size_t stale_timers_ = 0;
    bool running_ = false;
    mutable std::mutex mutex_;
    std::condition_variable timer_cv_;
    std::condition_variable ready_cv_;
    std::thread timer_thread_;
    std::vector<std::thread> workers_;
};

}  // namespace remindbot::reminder
