#include "cron_schedule.hpp"
#include "time_format.hpp"
#include <charconv>
#include <format>
#include <sstream>
#include <utility>
#include <vector>

namespace {

struct FieldSpec {
    const char* name;
    int min;
    int max;
};

constexpr FieldSpec kMinuteField{"minute", 0, 59};
constexpr FieldSpec kHourField{"hour", 0, 23};
constexpr FieldSpec kDayOfMonthField{"day-of-month", 1, 31};
constexpr FieldSpec kMonthField{"month", 1, 12};
constexpr FieldSpec kDayOfWeekField{"day-of-week", 0, 7};

// Eight years always contains a Feb 29 and every weekday/day-of-month pairing.
constexpr int kSearchDays = 366 * 8;

std::unexpected<BackupError> invalid(const std::string& expression, const std::string& detail) {
    return std::unexpected(BackupError{BackupErrorKind::InvalidExpression,
                                       std::format("Invalid cron expression '{}': {}", expression, detail)});
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        parts.push_back(text.substr(start, pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

std::optional<int> parseNumber(const std::string& text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool hasBit(std::uint64_t mask, int bit) {
    return (mask >> bit) & 1U;
}

// Parses one comma-separated field into a bit mask of allowed values.
std::expected<std::uint64_t, BackupError> parseField(const std::string& expression,
                                                     const std::string& text,
                                                     const FieldSpec& spec) {
    std::uint64_t mask = 0;
    for (const auto& item : split(text, ',')) {
        auto slash = split(item, '/');
        if (slash.size() > 2 || slash[0].empty()) {
            return invalid(expression, std::format("malformed {} field '{}'", spec.name, text));
        }

        int low = spec.min;
        int high = spec.max;
        const std::string& base = slash[0];
        if (base != "*") {
            auto dash = split(base, '-');
            if (dash.size() > 2) {
                return invalid(expression, std::format("malformed {} range '{}'", spec.name, base));
            }
            auto first = parseNumber(dash[0]);
            auto last = dash.size() == 2 ? parseNumber(dash[1]) : first;
            if (!first || !last) {
                return invalid(expression, std::format("non-numeric {} value '{}'", spec.name, base));
            }
            low = *first;
            // "a/N" steps from a to the end of the field.
            high = (dash.size() == 1 && slash.size() == 2) ? spec.max : *last;
            if (low < spec.min || low > spec.max || high < spec.min || high > spec.max) {
                return invalid(expression, std::format("{} value '{}' out of range {}-{}", spec.name, base, spec.min,
                                                       spec.max));
            }
            if (low > high) {
                return invalid(expression, std::format("reversed {} range '{}'", spec.name, base));
            }
        }

        int step = 1;
        if (slash.size() == 2) {
            auto parsedStep = parseNumber(slash[1]);
            if (!parsedStep || *parsedStep < 1) {
                return invalid(expression, std::format("invalid {} step '{}'", spec.name, slash[1]));
            }
            step = *parsedStep;
        }

        for (int value = low; value <= high; value += step) {
            mask |= std::uint64_t{1} << value;
        }
    }
    return mask;
}

} // namespace

std::expected<CronSchedule, BackupError> CronSchedule::parse(const std::string& expression) {
    std::istringstream stream(expression);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return invalid(expression, std::format("expected 5 fields, got {}", fields.size()));
    }

    CronSchedule schedule;
    schedule.expression_ = expression;

    const FieldSpec* specs[] = {&kMinuteField, &kHourField, &kDayOfMonthField, &kMonthField, &kDayOfWeekField};
    std::uint64_t* masks[] = {&schedule.minutes_, &schedule.hours_, &schedule.daysOfMonth_,
                              &schedule.months_, &schedule.daysOfWeek_};
    for (std::size_t i = 0; i < fields.size(); ++i) {
        auto mask = parseField(expression, fields[i], *specs[i]);
        if (!mask) {
            return std::unexpected(mask.error());
        }
        *masks[i] = *mask;
    }

    // 7 is an alias for Sunday.
    if (hasBit(schedule.daysOfWeek_, 7)) {
        schedule.daysOfWeek_ |= 1U;
        schedule.daysOfWeek_ &= ~(std::uint64_t{1} << 7);
    }

    schedule.dayOfMonthRestricted_ = fields[2][0] != '*';
    schedule.dayOfWeekRestricted_ = fields[4][0] != '*';
    return schedule;
}

bool CronSchedule::dayMatches(int dayOfMonth, int month, int dayOfWeek) const {
    if (!hasBit(months_, month)) {
        return false;
    }
    bool domMatch = hasBit(daysOfMonth_, dayOfMonth);
    bool dowMatch = hasBit(daysOfWeek_, dayOfWeek);
    if (dayOfMonthRestricted_ && dayOfWeekRestricted_) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

bool CronSchedule::matches(const std::tm& localTime) const {
    return hasBit(minutes_, localTime.tm_min) &&
           hasBit(hours_, localTime.tm_hour) &&
           dayMatches(localTime.tm_mday, localTime.tm_mon + 1, localTime.tm_wday);
}

std::optional<CronSchedule::TimePoint> CronSchedule::nextTrigger(TimePoint from) const {
    std::tm start = toLocalTm(from);
    start.tm_sec = 0;
    start.tm_min += 1;
    start = toLocalTm(fromLocalTm(start));

    for (int offset = 0; offset < kSearchDays; ++offset) {
        std::tm day{};
        day.tm_year = start.tm_year;
        day.tm_mon = start.tm_mon;
        day.tm_mday = start.tm_mday + offset;
        day.tm_hour = 12;
        day = toLocalTm(fromLocalTm(day));
        if (!dayMatches(day.tm_mday, day.tm_mon + 1, day.tm_wday)) {
            continue;
        }

        int firstHour = offset == 0 ? start.tm_hour : 0;
        for (int hour = firstHour; hour < 24; ++hour) {
            if (!hasBit(hours_, hour)) {
                continue;
            }
            int firstMinute = (offset == 0 && hour == start.tm_hour) ? start.tm_min : 0;
            for (int minute = firstMinute; minute < 60; ++minute) {
                if (!hasBit(minutes_, minute)) {
                    continue;
                }
                std::tm candidate = day;
                candidate.tm_hour = hour;
                candidate.tm_min = minute;
                candidate.tm_sec = 0;
                return fromLocalTm(candidate);
            }
        }
    }
    return std::nullopt;
}

bool CronSchedule::isDue(std::optional<TimePoint> lastRun, TimePoint now) const {
    if (!matches(toLocalTm(now))) {
        return false;
    }
    if (!lastRun) {
        return true;
    }
    return std::chrono::floor<std::chrono::minutes>(*lastRun) <
           std::chrono::floor<std::chrono::minutes>(now);
}

ScheduleState::ScheduleState(CronSchedule schedule, TimePoint now)
    : schedule_(std::move(schedule)), lastEvaluated_(now), nextTrigger_(schedule_.nextTrigger(now)) {}

bool ScheduleState::poll(TimePoint now) {
    lastEvaluated_ = now;
    if (!nextTrigger_ || now < *nextTrigger_) {
        return false;
    }
    nextTrigger_ = schedule_.nextTrigger(now);
    return true;
}
