#include "reminder/reminder_service.hpp"

#include <chrono>
#include <sstream>
#include <utility>

#include "reminder/recurrence.hpp"
#include "utils/logging.hpp"

namespace remindbot::reminder {
namespace {

using remindbot::utils::LogLevel;
using remindbot::utils::LogMessage;

constexpr int kDescriptionRetries = 3;
constexpr auto kStoreRetryDelay = std::chrono::minutes(1);

}  // namespace

ReminderService::ReminderService(ReminderStore& store,
                                 SchedulerEngine& engine,
                                 remindbot::notifier::Notifier& notifier,
                                 std::size_t page_size,
                                 Clock clock)
    : store_(store)
    , engine_(engine)
    , notifier_(notifier)
    , page_size_(page_size == 0 ? 10 : page_size)
    , clock_(clock ? std::move(clock) : Clock(remindbot::utils::Now)) {
    engine_.SetJobHandler([this](const ReminderJob& job) { HandleFire(job); });
}

ReminderResult ReminderService::Create(const std::string& agent_id,
                                       const std::string& description,
                                       const ScheduleRequest& request) {
    if (remindbot::utils::Trim(agent_id).empty()) {
        return ReminderResult::Fail(ReminderStatus::kInvalidRequest, "agent id is required");
    }
    if (remindbot::utils::Trim(description).empty()) {
        return ReminderResult::Fail(ReminderStatus::kInvalidRequest, "description is required");
    }

    const auto now = clock_();
    TimePoint first{};
    try {
        first = FirstOccurrence(request, now);
    } catch (const ScheduleError& ex) {
        remindbot::utils::Log("scheduler", LogMessage{
            LogLevel::kWarn, "rejected schedule", {{"agent", agent_id}, {"error", ex.what()}}});
        return ReminderResult::Fail(ReminderStatus::kInvalidSchedule, ex.what());
    }

    // A timestamp or delay makes the reminder one-shot; the rule only drives recurring ones.
    std::optional<std::string> rule;
    if (!request.timestamp.has_value() && !request.delay_minutes.has_value()) {
        rule = request.recurrence_rule;
    }

    auto created = store_.Create(agent_id, description, rule, first, now);
    if (!created.ok()) {
        if (created.status == ReminderStatus::kStoreFailure) {
            remindbot::utils::Log("store", LogMessage{
                LogLevel::kError, "create failed", {{"agent", agent_id}, {"error", created.detail}}});
        }
        return created;
    }

    const auto key = created.reminder.Key();
    {
        auto key_lock = LockFor(key);
        std::lock_guard<std::mutex> guard(*key_lock);
        // A delete may have landed between the insert and taking the lock.
        if (store_.Get(key).status == ReminderStatus::kNotFound) {
            return created;
        }
        engine_.Schedule(MakeJob(created.reminder), first);
    }
    remindbot::utils::Log("scheduler", LogMessage{
        LogLevel::kInfo, "reminder created", {{"key", key.ToString()},
                                              {"next", remindbot::utils::FormatLocalTime(first)}}});
    return created;
}

ReminderResult ReminderService::Delete(const std::string& agent_id,
                                       std::optional<long long> id,
                                       const std::optional<std::string>& description) {
    const bool has_description = description.has_value() && !remindbot::utils::Trim(*description).empty();
    if (!id.has_value() && !has_description) {
        return ReminderResult::Fail(ReminderStatus::kInvalidRequest, "reminder id or description is required");
    }

    if (id.has_value()) {
        const ReminderKey key{agent_id, *id};
        auto key_lock = LockFor(key);
        std::lock_guard<std::mutex> guard(*key_lock);
        const auto existing = store_.Get(key);
        if (existing.ok()) {
            return DeleteLocked(key, std::nullopt);
        }
        if (existing.status == ReminderStatus::kStoreFailure) {
            return StoreFailed("delete failed", key.ToString(), existing);
        }
    }
    if (!has_description) {
        return ReminderResult::Fail(ReminderStatus::kNotFound, "Reminder not found.");
    }

    for (int attempt = 0; attempt < kDescriptionRetries; ++attempt) {
        const auto found = store_.GetByDescription(agent_id, *description);
        if (found.status == ReminderStatus::kStoreFailure) {
            return StoreFailed("delete failed", agent_id, found);
        }
        if (!found.ok()) {
            break;
        }
        const auto key = found.reminder.Key();
        auto key_lock = LockFor(key);
        std::lock_guard<std::mutex> guard(*key_lock);
        const auto current = store_.GetByDescription(agent_id, *description);
        if (current.status == ReminderStatus::kStoreFailure) {
            return StoreFailed("delete failed", key.ToString(), current);
        }
        if (current.ok() && current.reminder.id == key.id) {
            return DeleteLocked(key, description);
        }
        // Replaced between lookup and lock; look again.
    }
    return ReminderResult::Fail(ReminderStatus::kNotFound, "Reminder not found.");
}

ReminderResult ReminderService::DeleteLocked(const ReminderKey& key, const std::optional<std::string>& description) {
    engine_.Cancel(key);
    auto result = description.has_value() ? store_.DeleteByDescription(key.agent_id, *description)
                                          : store_.Delete(key);
    if (result.ok()) {
        remindbot::utils::Log("scheduler", LogMessage{
            LogLevel::kInfo, "reminder deleted", {{"key", key.ToString()}}});
    } else if (result.status == ReminderStatus::kStoreFailure) {
        return StoreFailed("delete failed", key.ToString(), result);
    }
    return result;
}

ReminderResult ReminderService::StoreFailed(const std::string& what,
                                            const std::string& subject,
                                            const ReminderResult& result) {
    remindbot::utils::Log("store", LogMessage{
        LogLevel::kError, what, {{"key", subject}, {"error", result.detail}}});
    return result;
}

ReminderPage ReminderService::List(const std::string& agent_id, std::size_t page) {
    auto listing = store_.List(agent_id, page, page_size_);
    if (!listing.ok()) {
        remindbot::utils::Log("store", LogMessage{
            LogLevel::kError, "list failed", {{"agent", agent_id}, {"error", listing.detail}}});
    }
    return listing;
}

std::string ReminderService::CreateReminder(const std::string& agent_id,
                                            const std::string& description,
                                            const ScheduleRequest& request) {
    return CreateMessage(Create(agent_id, description, request));
}

std::string ReminderService::DeleteReminder(const std::string& agent_id,
                                            std::optional<long long> id,
                                            const std::optional<std::string>& description) {
    return DeleteMessage(Delete(agent_id, id, description));
}

std::string ReminderService::CreateMessage(const ReminderResult& result) {
    switch (result.status) {
        case ReminderStatus::kOk: {
            std::ostringstream oss;
            oss << "Reminder created (ID: " << result.reminder.id << "). Next occurrence: "
                << remindbot::utils::FormatLocalTime(result.reminder.next_fire_at.value_or(result.reminder.created_at))
                << ".";
            return oss.str();
        }
        case ReminderStatus::kDuplicateDescription:
            return result.detail;
        default:
            return "Error: " + result.detail;
    }
}

std::string ReminderService::DeleteMessage(const ReminderResult& result) {
    switch (result.status) {
        case ReminderStatus::kOk:
            return "Reminder " + std::to_string(result.reminder.id) + " deleted: " + result.reminder.description;
        case ReminderStatus::kNotFound:
            return "Reminder not found.";
        default:
            return "Error: " + result.detail;
    }
}

std::string ReminderService::ListReminders(const std::string& agent_id, std::size_t page) {
    const auto listing = List(agent_id, page);
    if (!listing.ok()) {
        return "Error: " + listing.detail;
    }
    if (listing.items.empty()) {
        return "No reminders found.";
    }
    std::ostringstream oss;
    oss << "Showing " << listing.items.size() << " of " << listing.total << " reminders (page "
        << listing.page + 1 << "/" << listing.total_pages << "):";
    for (const auto& reminder : listing.items) {
        oss << "\n" << FormatListLine(reminder);
    }
    return oss.str();
}

std::size_t ReminderService::Restore() {
    const auto now = clock_();
    std::size_t restored = 0;
    const auto all = store_.ListAll();
    if (!all.ok()) {
        remindbot::utils::Log("store", LogMessage{LogLevel::kError, "restore failed", {{"error", all.detail}}});
        return 0;
    }
    for (const auto& reminder : all.items) {
        const auto key = reminder.Key();
        auto key_lock = LockFor(key);
        std::lock_guard<std::mutex> guard(*key_lock);

        auto fire_at = reminder.next_fire_at;
        if (!fire_at.has_value() && reminder.recurrence_rule.has_value()) {
            try {
                fire_at = NextAfter(*reminder.recurrence_rule, reminder.created_at, now);
            } catch (const ScheduleError& ex) {
                remindbot::utils::Log("recurrence", LogMessage{
                    LogLevel::kError, "stored rule is invalid", {{"key", key.ToString()}, {"error", ex.what()}}});
            }
        }
        if (!fire_at.has_value()) {
            const auto removed = store_.Delete(key);
            if (!removed.ok()) {
                remindbot::utils::Log("store", LogMessage{
                    LogLevel::kError, "retire failed", {{"key", key.ToString()}, {"error", removed.detail}}});
            }
            continue;
        }
        engine_.Schedule(MakeJob(reminder), *fire_at);
        ++restored;
    }
    remindbot::utils::Log("scheduler", LogMessage{
        LogLevel::kInfo, "restored reminders", {{"count", std::to_string(restored)}}});
    return restored;
}

void ReminderService::HandleFire(const ReminderJob& job) {
    auto key_lock = LockFor(job.key);
    std::lock_guard<std::mutex> guard(*key_lock);

    const auto now = clock_();
    const auto current = store_.Get(job.key);
    if (current.status == ReminderStatus::kNotFound) {
        remindbot::utils::Log("scheduler", LogLevel::kDebug, "dropped fire for deleted " + job.key.ToString());
        return;
    }
    if (!current.ok()) {
        // The record may still be live; try again later instead of losing the series.
        const auto retry_at = now + kStoreRetryDelay;
        remindbot::utils::Log("store", LogMessage{
            LogLevel::kError, "fire lookup failed, retrying", {{"key", job.key.ToString()},
                                                               {"error", current.detail},
                                                               {"retry", remindbot::utils::FormatLocalTime(retry_at)}}});
        engine_.Schedule(job, retry_at);
        return;
    }

    const auto delivery = notifier_.Notify(job.key.agent_id, FormatNotification(now, job.description));
    if (!delivery.ok) {
        remindbot::utils::Log("notifier", LogMessage{
            LogLevel::kWarn, "delivery failed", {{"key", job.key.ToString()},
                                                 {"status", std::to_string(delivery.http_status)},
                                                 {"error", delivery.error}}});
    }

    std::optional<TimePoint> next;
    if (job.recurrence_rule.has_value()) {
        try {
            next = NextAfter(*job.recurrence_rule, job.anchor, now);
        } catch (const ScheduleError& ex) {
            remindbot::utils::Log("recurrence", LogMessage{
                LogLevel::kError, "rule no longer parses", {{"key", job.key.ToString()}, {"error", ex.what()}}});
        }
    }

    if (next.has_value()) {
        engine_.Schedule(job, *next);
        const auto updated = store_.UpdateSchedule(job.key, next, now);
        if (!updated.ok()) {
            remindbot::utils::Log("store", LogMessage{
                LogLevel::kError, "reschedule not persisted", {{"key", job.key.ToString()}, {"error", updated.detail}}});
        }
        return;
    }

    engine_.Cancel(job.key);
    const auto removed = store_.Delete(job.key);
    if (!removed.ok()) {
        remindbot::utils::Log("store", LogMessage{
            LogLevel::kError, "retire failed", {{"key", job.key.ToString()}, {"error", removed.detail}}});
        return;
    }
    remindbot::utils::Log("scheduler", LogLevel::kInfo, "reminder retired " + job.key.ToString());
}

std::string ReminderService::FormatNotification(TimePoint now, const std::string& description) {
    return "[Reminder] It is now " + remindbot::utils::FormatLocalTime(now) + ". Reminder: " + description;
}

std::string ReminderService::FormatListLine(const Reminder& reminder) {
    std::ostringstream oss;
    oss << "ID: " << reminder.id
        << ", Description: " << reminder.description
        << ", Recurrence Rule: " << reminder.recurrence_rule.value_or("None")
        << ", Created At: " << remindbot::utils::FormatLocalTime(reminder.created_at)
        << ", Modified At: " << remindbot::utils::FormatLocalTime(reminder.modified_at);
    return oss.str();
}

std::shared_ptr<std::mutex> ReminderService::LockFor(const ReminderKey& key) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = key_locks_.find(key);
    if (it != key_locks_.end()) {
        if (auto existing = it->second.lock()) {
            return existing;
        }
    }
    // Drop entries nobody holds any more.
    for (auto stale = key_locks_.begin(); stale != key_locks_.end();) {
        if (stale->second.expired()) {
            stale = key_locks_.erase(stale);
        } else {
            ++stale;
        }
    }
    auto created = std::make_shared<std::mutex>();
    key_locks_[key] = created;
    return created;
}

ReminderJob ReminderService::MakeJob(const Reminder& reminder) {
    return ReminderJob{reminder.Key(), reminder.description, reminder.recurrence_rule, reminder.created_at};
}

}  // namespace remindbot::reminder
