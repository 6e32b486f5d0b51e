#include "reminder/recurrence.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <regex>
#include <sstream>

#include "utils/logging.hpp"

namespace remindbot::reminder {
namespace {

using remindbot::utils::LogLevel;

constexpr long long kMaxPeriodsScanned = 1000000;
constexpr long long kHorizonYears = 400;
constexpr long long kMaxDelayMinutes = 100LL * 366 * 24 * 60;
constexpr const char* kWeekdayNames[] = {"MO", "TU", "WE", "TH", "FR", "SA", "SU"};

struct CivilTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

long long FloorDiv(long long a, long long b) {
    return a / b - ((a % b != 0) && ((a < 0) != (b < 0)) ? 1 : 0);
}

long long FloorMod(long long a, long long b) {
    return a - FloorDiv(a, b) * b;
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
long long DaysFromCivil(long long y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilTime CivilFromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    CivilTime civil;
    civil.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    civil.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    civil.year = static_cast<int>(yoe + era * 400 + (civil.month <= 2 ? 1 : 0));
    return civil;
}

// 1970-01-01 was a Thursday.
int WeekdayFromDays(long long days) {
    return static_cast<int>(FloorMod(days + 3, 7));
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

CivilTime ToCivil(TimePoint tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm local_time{};
    localtime_r(&time, &local_time);
    CivilTime civil;
    civil.year = local_time.tm_year + 1900;
    civil.month = local_time.tm_mon + 1;
    civil.day = local_time.tm_mday;
    civil.hour = local_time.tm_hour;
    civil.minute = local_time.tm_min;
    civil.second = local_time.tm_sec;
    return civil;
}

std::optional<TimePoint> FromCivil(const CivilTime& civil) {
    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = civil.month - 1;
    tm.tm_mday = civil.day;
    tm.tm_hour = civil.hour;
    tm.tm_min = civil.minute;
    tm.tm_sec = civil.second;
    tm.tm_isdst = -1;
    const auto seconds = std::mktime(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

bool Contains(const std::vector<int>& values, int value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

std::vector<int> OrDefault(const std::vector<int>& values, int fallback) {
    if (values.empty()) {
        return {fallback};
    }
    return values;
}

void SortUnique(std::vector<long long>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

// Days in [first, first + length) picked by BYDAY, ordinals counted inside that range.
std::vector<long long> ExpandWeekdays(const std::vector<WeekdaySelector>& selectors,
                                      long long first,
                                      long long length) {
    std::vector<long long> days;
    for (const auto& selector : selectors) {
        std::vector<long long> matches;
        const auto offset = FloorMod(selector.weekday - WeekdayFromDays(first), 7);
        for (auto day = first + offset; day < first + length; day += 7) {
            matches.push_back(day);
        }
        const auto size = static_cast<int>(matches.size());
        if (selector.ordinal == 0) {
            days.insert(days.end(), matches.begin(), matches.end());
        } else if (selector.ordinal > 0 && selector.ordinal <= size) {
            days.push_back(matches[selector.ordinal - 1]);
        } else if (selector.ordinal < 0 && -selector.ordinal <= size) {
            days.push_back(matches[size + selector.ordinal]);
        }
    }
    SortUnique(days);
    return days;
}

std::vector<long long> MonthDays(const RecurrenceRule& rule, int year, int month, const CivilTime& anchor) {
    const auto first = DaysFromCivil(year, month, 1);
    const int length = DaysInMonth(year, month);
    std::vector<long long> days;
    if (!rule.by_month_day.empty()) {
        for (const int month_day : rule.by_month_day) {
            const int day = month_day > 0 ? month_day : length + month_day + 1;
            if (day >= 1 && day <= length) {
                days.push_back(first + day - 1);
            }
        }
        if (!rule.by_day.empty()) {
            const auto allowed = ExpandWeekdays(rule.by_day, first, length);
            days.erase(std::remove_if(days.begin(), days.end(), [&](long long day) {
                return !std::binary_search(allowed.begin(), allowed.end(), day);
            }), days.end());
        }
    } else if (!rule.by_day.empty()) {
        days = ExpandWeekdays(rule.by_day, first, length);
    } else if (anchor.day <= length) {
        days.push_back(first + anchor.day - 1);
    }
    SortUnique(days);
    return days;
}

// BYMONTH, BYMONTHDAY and BYDAY used as filters on a single day.
bool DayMatches(const RecurrenceRule& rule, long long days) {
    const auto civil = CivilFromDays(days);
    if (!rule.by_month.empty() && !Contains(rule.by_month, civil.month)) {
        return false;
    }
    if (!rule.by_month_day.empty()) {
        const int length = DaysInMonth(civil.year, civil.month);
        const bool hit = std::any_of(rule.by_month_day.begin(), rule.by_month_day.end(), [&](int month_day) {
            return (month_day > 0 ? month_day : length + month_day + 1) == civil.day;
        });
        if (!hit) {
            return false;
        }
    }
    if (!rule.by_day.empty()) {
        const int weekday = WeekdayFromDays(days);
        const bool hit = std::any_of(rule.by_day.begin(), rule.by_day.end(), [&](const WeekdaySelector& selector) {
            return selector.weekday == weekday;
        });
        if (!hit) {
            return false;
        }
    }
    return true;
}

long long PeriodOf(const RecurrenceRule& rule, const CivilTime& civil) {
    const auto days = DaysFromCivil(civil.year, civil.month, civil.day);
    switch (rule.freq) {
        case Frequency::kYearly:
            return civil.year;
        case Frequency::kMonthly:
            return static_cast<long long>(civil.year) * 12 + (civil.month - 1);
        case Frequency::kWeekly: {
            const auto into_week = FloorMod(WeekdayFromDays(days) - rule.week_start, 7);
            return FloorDiv(days - into_week, 7);
        }
        case Frequency::kDaily:
            return days;
        case Frequency::kHourly:
            return days * 24 + civil.hour;
        case Frequency::kMinutely:
            return (days * 24 + civil.hour) * 60 + civil.minute;
    }
    return days;
}

long long PeriodsPerHorizon(Frequency freq) {
    switch (freq) {
        case Frequency::kYearly: return kHorizonYears;
        case Frequency::kMonthly: return kHorizonYears * 12;
        case Frequency::kWeekly: return kHorizonYears * 53;
        case Frequency::kDaily: return kHorizonYears * 366;
        case Frequency::kHourly: return kHorizonYears * 366 * 24;
        case Frequency::kMinutely: return kHorizonYears * 366 * 24 * 60;
    }
    return kMaxPeriodsScanned;
}

std::vector<CivilTime> ExpandPeriod(const RecurrenceRule& rule, const CivilTime& anchor, long long period) {
    std::vector<long long> days;
    auto hours = OrDefault(rule.by_hour, anchor.hour);
    auto minutes = OrDefault(rule.by_minute, anchor.minute);
    const auto seconds = OrDefault(rule.by_second, anchor.second);

    switch (rule.freq) {
        case Frequency::kYearly: {
            const int year = static_cast<int>(period);
            if (rule.by_month.empty() && rule.by_month_day.empty() && !rule.by_day.empty()) {
                days = ExpandWeekdays(rule.by_day, DaysFromCivil(year, 1, 1), IsLeapYear(year) ? 366 : 365);
                break;
            }
            std::vector<int> months = rule.by_month;
            if (months.empty()) {
                if (rule.by_month_day.empty()) {
                    months.push_back(anchor.month);
                } else {
                    for (int month = 1; month <= 12; ++month) {
                        months.push_back(month);
                    }
                }
            }
            for (const int month : months) {
                const auto month_days = MonthDays(rule, year, month, anchor);
                days.insert(days.end(), month_days.begin(), month_days.end());
            }
            break;
        }
        case Frequency::kMonthly: {
            const int year = static_cast<int>(FloorDiv(period, 12));
            const int month = static_cast<int>(FloorMod(period, 12)) + 1;
            if (rule.by_month.empty() || Contains(rule.by_month, month)) {
                days = MonthDays(rule, year, month, anchor);
            }
            break;
        }
        case Frequency::kWeekly: {
            const auto start = period * 7 + FloorMod(rule.week_start - 3, 7);
            const int anchor_weekday = WeekdayFromDays(DaysFromCivil(anchor.year, anchor.month, anchor.day));
            for (auto day = start; day < start + 7; ++day) {
                if (rule.by_day.empty() && WeekdayFromDays(day) != anchor_weekday) {
                    continue;
                }
                if (DayMatches(rule, day)) {
                    days.push_back(day);
                }
            }
            break;
        }
        case Frequency::kDaily:
            if (DayMatches(rule, period)) {
                days.push_back(period);
            }
            break;
        case Frequency::kHourly: {
            const auto day = FloorDiv(period, 24);
            const int hour = static_cast<int>(FloorMod(period, 24));
            if (DayMatches(rule, day) && (rule.by_hour.empty() || Contains(rule.by_hour, hour))) {
                days.push_back(day);
                hours = {hour};
            }
            break;
        }
        case Frequency::kMinutely: {
            const auto hour_index = FloorDiv(period, 60);
            const auto day = FloorDiv(hour_index, 24);
            const int hour = static_cast<int>(FloorMod(hour_index, 24));
            const int minute = static_cast<int>(FloorMod(period, 60));
            if (DayMatches(rule, day) &&
                (rule.by_hour.empty() || Contains(rule.by_hour, hour)) &&
                (rule.by_minute.empty() || Contains(rule.by_minute, minute))) {
                days.push_back(day);
                hours = {hour};
                minutes = {minute};
            }
            break;
        }
    }

    std::vector<CivilTime> result;
    for (const auto day : days) {
        auto civil = CivilFromDays(day);
        for (const int hour : hours) {
            for (const int minute : minutes) {
                for (const int second : seconds) {
                    civil.hour = hour;
                    civil.minute = minute;
                    civil.second = second;
                    result.push_back(civil);
                }
            }
        }
    }
    return result;
}

// Smallest value in `values` above `current`, if any. `values` is sorted.
std::optional<int> NextListed(const std::vector<int>& values, int current) {
    const auto it = std::upper_bound(values.begin(), values.end(), current);
    if (it == values.end()) {
        return std::nullopt;
    }
    return *it;
}

// For HOURLY and MINUTELY periods that produced nothing: the first period, unaligned to INTERVAL,
// that could match again. Whole days, hours and minutes ruled out by the filters are stepped over.
long long NextCandidatePeriod(const RecurrenceRule& rule, long long period) {
    if (rule.freq == Frequency::kHourly) {
        const auto day = FloorDiv(period, 24);
        const int hour = static_cast<int>(FloorMod(period, 24));
        if (!DayMatches(rule, day)) {
            return (day + 1) * 24;
        }
        if (!rule.by_hour.empty() && !Contains(rule.by_hour, hour)) {
            const auto next_hour = NextListed(rule.by_hour, hour);
            return next_hour ? day * 24 + *next_hour : (day + 1) * 24;
        }
        return period + 1;
    }
    if (rule.freq == Frequency::kMinutely) {
        const auto hour_index = FloorDiv(period, 60);
        const auto day = FloorDiv(hour_index, 24);
        const int hour = static_cast<int>(FloorMod(hour_index, 24));
        const int minute = static_cast<int>(FloorMod(period, 60));
        if (!DayMatches(rule, day)) {
            return (day + 1) * 24 * 60;
        }
        if (!rule.by_hour.empty() && !Contains(rule.by_hour, hour)) {
            const auto next_hour = NextListed(rule.by_hour, hour);
            return next_hour ? (day * 24 + *next_hour) * 60 : (day + 1) * 24 * 60;
        }
        if (!rule.by_minute.empty() && !Contains(rule.by_minute, minute)) {
            const auto next_minute = NextListed(rule.by_minute, minute);
            return next_minute ? hour_index * 60 + *next_minute : (hour_index + 1) * 60;
        }
    }
    return period + 1;
}

std::vector<std::string> Split(const std::string& value, char delimiter) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        items.push_back(remindbot::utils::Trim(item));
    }
    return items;
}

std::optional<int> ToInt(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int ParseBounded(const std::string& key, const std::string& value, int min, int max) {
    const auto parsed = ToInt(value);
    if (!parsed.has_value() || *parsed < min || *parsed > max) {
        throw ScheduleError("invalid " + key + " value '" + value + "'");
    }
    return *parsed;
}

std::vector<int> ParseIntList(const std::string& key, const std::string& value, int min, int max,
                              bool allow_negative = false) {
    std::vector<int> values;
    for (const auto& item : Split(value, ',')) {
        const int parsed = allow_negative ? ParseBounded(key, item, -max, max) : ParseBounded(key, item, min, max);
        if (parsed == 0 && min > 0) {
            throw ScheduleError("invalid " + key + " value '" + item + "'");
        }
        values.push_back(parsed);
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

int ParseWeekdayName(const std::string& value) {
    for (int i = 0; i < 7; ++i) {
        if (value == kWeekdayNames[i]) {
            return i;
        }
    }
    throw ScheduleError("invalid weekday '" + value + "'");
}

std::vector<WeekdaySelector> ParseByDay(const std::string& value) {
    static const std::regex kPattern(R"(^([+-]?[0-9]{1,2})?(MO|TU|WE|TH|FR|SA|SU)$)");
    std::vector<WeekdaySelector> selectors;
    for (const auto& item : Split(value, ',')) {
        std::smatch match;
        if (!std::regex_match(item, match, kPattern)) {
            throw ScheduleError("invalid BYDAY value '" + item + "'");
        }
        WeekdaySelector selector;
        selector.weekday = ParseWeekdayName(match[2].str());
        if (match[1].matched) {
            selector.ordinal = ParseBounded("BYDAY ordinal", match[1].str(), -53, 53);
            if (selector.ordinal == 0) {
                throw ScheduleError("invalid BYDAY value '" + item + "'");
            }
        }
        selectors.push_back(selector);
    }
    return selectors;
}

Frequency ParseFrequency(const std::string& value) {
    if (value == "YEARLY") {
        return Frequency::kYearly;
    }
    if (value == "MONTHLY") {
        return Frequency::kMonthly;
    }
    if (value == "WEEKLY") {
        return Frequency::kWeekly;
    }
    if (value == "DAILY") {
        return Frequency::kDaily;
    }
    if (value == "HOURLY") {
        return Frequency::kHourly;
    }
    if (value == "MINUTELY") {
        return Frequency::kMinutely;
    }
    throw ScheduleError("unsupported FREQ '" + value + "'");
}

// UNTIL is YYYYMMDD (end of that local day) or YYYYMMDDTHHMMSS with an optional Z for UTC.
TimePoint ParseUntil(const std::string& value) {
    static const std::regex kPattern(R"(^([0-9]{4})([0-9]{2})([0-9]{2})(T([0-9]{2})([0-9]{2})([0-9]{2})(Z)?)?$)");
    std::smatch match;
    if (!std::regex_match(value, match, kPattern)) {
        throw ScheduleError("invalid UNTIL value '" + value + "'");
    }
    CivilTime civil;
    civil.year = std::stoi(match[1].str());
    civil.month = std::stoi(match[2].str());
    civil.day = std::stoi(match[3].str());
    if (civil.month < 1 || civil.month > 12 || civil.day < 1 || civil.day > DaysInMonth(civil.year, civil.month)) {
        throw ScheduleError("invalid UNTIL value '" + value + "'");
    }
    if (match[4].matched) {
        civil.hour = std::stoi(match[5].str());
        civil.minute = std::stoi(match[6].str());
        civil.second = std::stoi(match[7].str());
        if (civil.hour > 23 || civil.minute > 59 || civil.second > 59) {
            throw ScheduleError("invalid UNTIL value '" + value + "'");
        }
    } else {
        civil.hour = 23;
        civil.minute = 59;
        civil.second = 59;
    }
    if (match[8].matched) {
        const auto days = DaysFromCivil(civil.year, civil.month, civil.day);
        const auto seconds = days * 86400 + civil.hour * 3600 + civil.minute * 60 + civil.second;
        return TimePoint(std::chrono::seconds(seconds));
    }
    const auto local = FromCivil(civil);
    if (!local.has_value()) {
        throw ScheduleError("invalid UNTIL value '" + value + "'");
    }
    return *local;
}

}  // namespace

bool SetReferenceTimeZone(const std::string& tz) {
    if (tz.empty()) {
        return true;
    }
    const bool known = tz == "UTC" ||
        std::filesystem::exists(std::filesystem::path("/usr/share/zoneinfo") / tz);
    if (!known) {
        remindbot::utils::Log("recurrence", LogLevel::kWarn, "unknown timezone " + tz + ", keeping system default");
        return false;
    }
    ::setenv("TZ", tz.c_str(), 1);
    ::tzset();
    remindbot::utils::Log("recurrence", LogLevel::kDebug, "reference timezone " + tz);
    return true;
}

RecurrenceRule ParseRecurrenceRule(const std::string& text) {
    auto body = remindbot::utils::ToUpper(remindbot::utils::Trim(text));
    if (body.rfind("RRULE:", 0) == 0) {
        body = body.substr(6);
    }
    if (body.empty()) {
        throw ScheduleError("empty recurrence rule");
    }

    RecurrenceRule rule;
    bool has_freq = false;
    for (const auto& part : Split(body, ';')) {
        if (part.empty()) {
            continue;
        }
        const auto eq = part.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == part.size()) {
            throw ScheduleError("malformed rule part '" + part + "'");
        }
        const auto key = part.substr(0, eq);
        const auto value = part.substr(eq + 1);
        if (key == "FREQ") {
            rule.freq = ParseFrequency(value);
            has_freq = true;
        } else if (key == "INTERVAL") {
            rule.interval = ParseBounded(key, value, 1, 10000);
        } else if (key == "COUNT") {
            rule.count = ParseBounded(key, value, 1, 100000);
        } else if (key == "UNTIL") {
            rule.until = ParseUntil(value);
        } else if (key == "BYMONTH") {
            rule.by_month = ParseIntList(key, value, 1, 12);
        } else if (key == "BYMONTHDAY") {
            rule.by_month_day = ParseIntList(key, value, 1, 31, true);
        } else if (key == "BYDAY") {
            rule.by_day = ParseByDay(value);
        } else if (key == "BYHOUR") {
            rule.by_hour = ParseIntList(key, value, 0, 23);
        } else if (key == "BYMINUTE") {
            rule.by_minute = ParseIntList(key, value, 0, 59);
        } else if (key == "BYSECOND") {
            rule.by_second = ParseIntList(key, value, 0, 59);
        } else if (key == "WKST") {
            rule.week_start = ParseWeekdayName(value);
        } else {
            throw ScheduleError("unsupported rule part '" + key + "'");
        }
    }
    if (!has_freq) {
        throw ScheduleError("FREQ is required");
    }
    if (rule.freq != Frequency::kMonthly && rule.freq != Frequency::kYearly) {
        for (const auto& selector : rule.by_day) {
            if (selector.ordinal != 0) {
                throw ScheduleError("BYDAY ordinals need FREQ=MONTHLY or FREQ=YEARLY");
            }
        }
    }
    return rule;
}

std::optional<TimePoint> NextAfter(const RecurrenceRule& rule, TimePoint anchor, TimePoint instant) {
    const auto anchor_civil = ToCivil(anchor);
    const auto first_period = PeriodOf(rule, anchor_civil);
    auto period = first_period;
    // Without COUNT, earlier periods cannot affect the answer, so jump close to `instant`.
    if (!rule.count.has_value() && instant > anchor) {
        const auto target = PeriodOf(rule, ToCivil(instant));
        const auto steps = FloorDiv(target - first_period, rule.interval);
        if (steps > 0) {
            period = first_period + steps * rule.interval;
        }
    }

    const bool sub_daily = rule.freq == Frequency::kHourly || rule.freq == Frequency::kMinutely;
    const auto horizon_end = period + PeriodsPerHorizon(rule.freq);
    int emitted = 0;
    for (long long scanned = 0; scanned < kMaxPeriodsScanned && period <= horizon_end; ++scanned) {
        std::vector<TimePoint> instants;
        for (const auto& civil : ExpandPeriod(rule, anchor_civil, period)) {
            const auto tp = FromCivil(civil);
            if (tp.has_value()) {
                instants.push_back(*tp);
            }
        }
        std::sort(instants.begin(), instants.end());
        instants.erase(std::unique(instants.begin(), instants.end()), instants.end());
        for (const auto& tp : instants) {
            if (tp <= anchor) {
                continue;
            }
            if (rule.until.has_value() && tp > *rule.until) {
                return std::nullopt;
            }
            if (rule.count.has_value() && ++emitted > *rule.count) {
                return std::nullopt;
            }
            if (tp > instant) {
                return tp;
            }
        }
        if (instants.empty() && sub_daily) {
            // Next period on the INTERVAL grid at or after the first one that can match.
            const auto target = NextCandidatePeriod(rule, period);
            const auto steps = std::max<long long>(1, (target - period + rule.interval - 1) / rule.interval);
            period += steps * rule.interval;
        } else {
            period += rule.interval;
        }
    }
    return std::nullopt;
}

std::optional<TimePoint> NextAfter(const std::string& rule, TimePoint anchor, TimePoint instant) {
    return NextAfter(ParseRecurrenceRule(rule), anchor, instant);
}

TimePoint FirstOccurrence(const ScheduleRequest& request, TimePoint reference) {
    if (request.timestamp.has_value()) {
        const auto parsed = remindbot::utils::ParseLocalTime(*request.timestamp);
        if (!parsed.has_value()) {
            throw ScheduleError("timestamp must use the format YYYY-MM-DD HH:MM:SS");
        }
        return *parsed;
    }
    if (request.delay_minutes.has_value()) {
        if (*request.delay_minutes < 0) {
            throw ScheduleError("delay_minutes must not be negative");
        }
        if (*request.delay_minutes > kMaxDelayMinutes) {
            throw ScheduleError("delay_minutes must be at most " + std::to_string(kMaxDelayMinutes));
        }
        return reference + std::chrono::minutes(*request.delay_minutes);
    }
    if (request.recurrence_rule.has_value()) {
        const auto next = NextAfter(*request.recurrence_rule, reference, reference);
        if (!next.has_value()) {
            throw ScheduleError("recurrence rule has no upcoming occurrence");
        }
        return *next;
    }
    throw ScheduleError("one of recurrence_rule, timestamp or delay_minutes is required");
}

}  // namespace remindbot::reminder
