#pragma once

#include <bitset>
#include <chrono>
#include <string>

namespace sitewatch::scheduler {

// Five-field cron schedule: minute, hour, day-of-month, month, day-of-week.
// When both day fields are restricted a day matches if either of them does.
class CronExpression {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Throws std::invalid_argument naming the offending field.
    static CronExpression parse(const std::string& text);

    // First matching minute strictly after `after`, in UTC. Throws
    // std::runtime_error when nothing matches within five years (e.g. "0 0 30 2 *").
    TimePoint nextAfter(TimePoint after) const;

    bool matches(TimePoint time) const;

    const std::string& text() const { return text_; }

private:
    CronExpression() = default;

    bool dayMatches(int dayOfMonth, int dayOfWeek) const;

    std::string text_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    bool dayOfMonthRestricted_ = false;
    bool dayOfWeekRestricted_ = false;
};

} // namespace sitewatch::scheduler
