#pragma once

#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "utils/common.hpp"

namespace remindbot::reminder {

using TimePoint = remindbot::utils::TimePoint;

struct ReminderKey {
    std::string agent_id;
    long long id = 0;

    std::string ToString() const {
        return agent_id + ":" + std::to_string(id);
    }

    bool operator==(const ReminderKey& other) const {
        return agent_id == other.agent_id && id == other.id;
    }
    bool operator<(const ReminderKey& other) const {
        return std::tie(agent_id, id) < std::tie(other.agent_id, other.id);
    }
};

struct Reminder {
    long long id = 0;
    std::string agent_id;
    std::string description;
    std::optional<std::string> recurrence_rule;
    std::optional<TimePoint> next_fire_at;
    TimePoint created_at;
    TimePoint modified_at;

    ReminderKey Key() const { return ReminderKey{agent_id, id}; }
};

enum class ReminderStatus {
    kOk,
    kInvalidRequest,
    kInvalidSchedule,
    kDuplicateDescription,
    kNotFound,
    kDeliveryFailure,
    kStoreFailure
};

inline const char* ToString(ReminderStatus status) {
    switch (status) {
        case ReminderStatus::kOk: return "ok";
        case ReminderStatus::kInvalidRequest: return "invalid_request";
        case ReminderStatus::kInvalidSchedule: return "invalid_schedule";
        case ReminderStatus::kDuplicateDescription: return "duplicate_description";
        case ReminderStatus::kNotFound: return "not_found";
        case ReminderStatus::kDeliveryFailure: return "delivery_failure";
        case ReminderStatus::kStoreFailure: return "store_failure";
    }
    return "unknown";
}

struct ReminderResult {
    ReminderStatus status = ReminderStatus::kOk;
    Reminder reminder;
    std::string detail;

    bool ok() const { return status == ReminderStatus::kOk; }

    static ReminderResult Ok(Reminder reminder) {
        return ReminderResult{ReminderStatus::kOk, std::move(reminder), {}};
    }
    static ReminderResult Fail(ReminderStatus status, std::string detail = {}) {
        return ReminderResult{status, Reminder{}, std::move(detail)};
    }
};

// A slice of one agent's reminders. A failed read carries kStoreFailure and no items.
struct ReminderPage {
    ReminderStatus status = ReminderStatus::kOk;
    std::string detail;
    std::vector<Reminder> items;
    std::size_t total = 0;
    std::size_t page = 0;
    std::size_t page_size = 10;
    std::size_t total_pages = 0;

    bool ok() const { return status == ReminderStatus::kOk; }
};

// Scheduling inputs of a create request. Precedence: timestamp, then delay_minutes, then rule.
struct ScheduleRequest {
    std::optional<std::string> recurrence_rule;
    std::optional<std::string> timestamp;
    std::optional<long long> delay_minutes;
};

// Value passed to the fire handler. Captures everything a fire needs so nothing is read from
// shared state at fire time.
struct ReminderJob {
    ReminderKey key;
    std::string description;
    std::optional<std::string> recurrence_rule;
    TimePoint anchor;
};

}  // namespace remindbot::reminder
