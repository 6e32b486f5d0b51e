#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "reminder/reminder_types.hpp"

namespace remindbot::reminder {

enum class Frequency {
    kYearly,
    kMonthly,
    kWeekly,
    kDaily,
    kHourly,
    kMinutely
};

// Weekdays are numbered from Monday (0) to Sunday (6).
struct WeekdaySelector {
    int weekday = 0;
    int ordinal = 0;  // 0 selects every matching weekday, +n/-n the n-th from start/end.
};

// Parsed iCalendar RRULE subset.
struct RecurrenceRule {
    Frequency freq = Frequency::kDaily;
    int interval = 1;
    std::optional<int> count;
    std::optional<TimePoint> until;
    std::vector<int> by_month;
    std::vector<int> by_month_day;
    std::vector<WeekdaySelector> by_day;
    std::vector<int> by_hour;
    std::vector<int> by_minute;
    std::vector<int> by_second;
    int week_start = 0;
};

class ScheduleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Sets the process-wide reference timezone (an IANA name such as "Europe/Amsterdam") used by
// every civil time conversion. Empty keeps the system default. Returns false for unknown zones.
bool SetReferenceTimeZone(const std::string& tz);

// Throws ScheduleError on malformed input.
RecurrenceRule ParseRecurrenceRule(const std::string& text);

// Occurrences of a rule are the matching instants strictly after `anchor`, limited by COUNT and
// UNTIL. Returns the earliest one strictly after `instant`, or nullopt once exhausted.
std::optional<TimePoint> NextAfter(const RecurrenceRule& rule, TimePoint anchor, TimePoint instant);
std::optional<TimePoint> NextAfter(const std::string& rule, TimePoint anchor, TimePoint instant);

// Resolves the first fire instant of a create request. A timestamp wins over a delay, which wins
// over a rule; rules are anchored at `reference`. Throws ScheduleError when nothing usable is
// given or the rule has no occurrence left.
TimePoint FirstOccurrence(const ScheduleRequest& request, TimePoint reference);

}  // namespace remindbot::reminder
