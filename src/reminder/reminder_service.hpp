#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "notifier/notifier.hpp"
#include "reminder/reminder_store.hpp"
#include "reminder/scheduler_engine.hpp"

namespace remindbot::reminder {

// Ties the store, the scheduler engine and the notifier together. Every mutation of a reminder
// (create, fire, delete) runs under a per-key lock so a fire never races a delete of the same key.
class ReminderService {
public:
    using Clock = std::function<TimePoint()>;

    ReminderService(ReminderStore& store,
                    SchedulerEngine& engine,
                    remindbot::notifier::Notifier& notifier,
                    std::size_t page_size = 10,
                    Clock clock = remindbot::utils::Now);

    ReminderService(const ReminderService&) = delete;
    ReminderService& operator=(const ReminderService&) = delete;

    ReminderResult Create(const std::string& agent_id,
                          const std::string& description,
                          const ScheduleRequest& request);
    // Matches by id first, then by description.
    ReminderResult Delete(const std::string& agent_id,
                          std::optional<long long> id,
                          const std::optional<std::string>& description);
    // page is 0-based.
    ReminderPage List(const std::string& agent_id, std::size_t page);

    // Text responses handed back to the agent.
    std::string CreateReminder(const std::string& agent_id,
                               const std::string& description,
                               const ScheduleRequest& request);
    std::string DeleteReminder(const std::string& agent_id,
                               std::optional<long long> id,
                               const std::optional<std::string>& description);
    std::string ListReminders(const std::string& agent_id, std::size_t page);

    // Re-registers every persisted reminder. Overdue ones fire right away. Returns how many were
    // scheduled.
    std::size_t Restore();

    // Fire handler installed on the engine.
    void HandleFire(const ReminderJob& job);

    std::size_t PageSize() const { return page_size_; }

    static std::string CreateMessage(const ReminderResult& result);
    static std::string DeleteMessage(const ReminderResult& result);
    static std::string FormatNotification(TimePoint now, const std::string& description);
    static std::string FormatListLine(const Reminder& reminder);

private:
    std::shared_ptr<std::mutex> LockFor(const ReminderKey& key);
    ReminderResult DeleteLocked(const ReminderKey& key, const std::optional<std::string>& description);
    static ReminderResult StoreFailed(const std::string& what,
                                      const std::string& subject,
                                      const ReminderResult& result);
    static ReminderJob MakeJob(const Reminder& reminder);

    ReminderStore& store_;
    SchedulerEngine& engine_;
    remindbot::notifier::Notifier& notifier_;
    std::size_t page_size_;
    Clock clock_;
    std::mutex locks_mutex_;
    std::map<ReminderKey, std::weak_ptr<std::mutex>> key_locks_;
};

}  // namespace remindbot::reminder
