/**
 * @file cron_schedule.hpp
 * @brief Five-field cron expressions and the recurring-trigger state built on them.
 *
 * Supported field syntax: `*`, a literal, a step over the whole field (a star
 * followed by `/N`), ranges `a-b`, stepped ranges `a-b/N` and comma-separated lists
 * of those. Day-of-week accepts 0-7 with both 0
 * and 7 meaning Sunday. When both day fields are restricted a day matches if either
 * matches, as in conventional cron.
 */

#ifndef CRON_SCHEDULE_HPP
#define CRON_SCHEDULE_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <expected>
#include <optional>
#include <string>
#include "backup_error.hpp"

/**
 * @brief A parsed cron expression, evaluated against local time at minute resolution.
 */
class CronSchedule {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Parses a five-field cron expression.
     *
     * @param expression Expression of five whitespace-separated fields.
     * @return std::expected<CronSchedule, BackupError> The compiled schedule, or an
     *         InvalidExpression error for a wrong field count, bad syntax, a zero step
     *         or a value out of range for its field.
     */
    static std::expected<CronSchedule, BackupError> parse(const std::string& expression);

    /**
     * @brief Tells whether the given local calendar minute matches every field.
     */
    bool matches(const std::tm& localTime) const;

    /**
     * @brief Computes the first matching minute strictly after the minute of @p from.
     *
     * @return std::optional<TimePoint> The trigger time, or std::nullopt when no minute
     *         matches within eight years (e.g. "0 0 30 2 *").
     */
    std::optional<TimePoint> nextTrigger(TimePoint from) const;

    /**
     * @brief Tells whether a run is due at @p now.
     *
     * True when now's minute matches and no run happened earlier in that same minute,
     * so repeated checks within one matching minute fire once.
     *
     * @param lastRun Time of the previous run, if any.
     * @param now Current time.
     */
    bool isDue(std::optional<TimePoint> lastRun, TimePoint now) const;

    const std::string& expression() const { return expression_; }

private:
    CronSchedule() = default;

    bool dayMatches(int dayOfMonth, int month, int dayOfWeek) const;

    std::string expression_;
    std::uint64_t minutes_ = 0;
    std::uint64_t hours_ = 0;
    std::uint64_t daysOfMonth_ = 0;
    std::uint64_t months_ = 0;
    std::uint64_t daysOfWeek_ = 0;
    bool dayOfMonthRestricted_ = false;
    bool dayOfWeekRestricted_ = false;
};

/**
 * @brief Lazily advanced trigger state for a periodic check loop.
 */
class ScheduleState {
public:
    using TimePoint = CronSchedule::TimePoint;

    /**
     * @brief Creates the state and computes the first trigger after @p now.
     */
    ScheduleState(CronSchedule schedule, TimePoint now);

    /**
     * @brief Fires once when @p now has reached the stored trigger, then advances it.
     *
     * @return bool True if a run should start now.
     */
    bool poll(TimePoint now);

    std::optional<TimePoint> nextTrigger() const { return nextTrigger_; }
    TimePoint lastEvaluated() const { return lastEvaluated_; }

private:
    CronSchedule schedule_;
    TimePoint lastEvaluated_;
    std::optional<TimePoint> nextTrigger_;
};

#endif // CRON_SCHEDULE_HPP
