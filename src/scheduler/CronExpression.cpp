#include "../../include/sitewatch/scheduler/CronExpression.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace sitewatch::scheduler {

namespace {

const char* const kMonthNames[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                   "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
const char* const kDayNames[] = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

struct FieldSpec {
    const char* name;
    int min;
    int max;
    const char* const* names;   // optional symbolic names, index 0 maps to `min`
    int nameCount;
};

const FieldSpec kMinuteField{"minute", 0, 59, nullptr, 0};
const FieldSpec kHourField{"hour", 0, 23, nullptr, 0};
const FieldSpec kDayOfMonthField{"day-of-month", 1, 31, nullptr, 0};
const FieldSpec kMonthField{"month", 1, 12, kMonthNames, 12};
// 7 is accepted and folded onto Sunday after parsing
const FieldSpec kDayOfWeekField{"day-of-week", 0, 7, kDayNames, 7};

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

int parseValue(const std::string& token, const FieldSpec& field) {
    if (token.empty()) {
        throw std::invalid_argument(std::string("Empty value in ") + field.name + " field");
    }

    if (std::isalpha(static_cast<unsigned char>(token[0]))) {
        std::string upper = token;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        for (int i = 0; i < field.nameCount; ++i) {
            if (upper == field.names[i]) {
                return field.min + i;
            }
        }
        throw std::invalid_argument("Unknown name '" + token + "' in " + field.name + " field");
    }

    int value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid value '" + token + "' in " + field.name + " field");
        }
        value = value * 10 + (c - '0');
        if (value > 1000) {
            break;
        }
    }
    if (value < field.min || value > field.max) {
        throw std::invalid_argument("Value " + token + " out of range " + std::to_string(field.min) +
                                    "-" + std::to_string(field.max) + " in " + field.name + " field");
    }
    return value;
}

// Returns the set of values selected by one field, indexed by value.
std::vector<bool> parseField(const std::string& text, const FieldSpec& field) {
    std::vector<bool> selected(field.max + 1, false);

    for (const auto& item : split(text, ',')) {
        if (item.empty()) {
            throw std::invalid_argument(std::string("Empty list item in ") + field.name + " field");
        }

        std::string range = item;
        int step = 1;
        auto slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            std::string stepText = item.substr(slash + 1);
            if (stepText.empty() || !std::all_of(stepText.begin(), stepText.end(),
                                                 [](unsigned char c) { return std::isdigit(c); })) {
                throw std::invalid_argument("Invalid step '" + stepText + "' in " + field.name + " field");
            }
            step = std::stoi(stepText);
            if (step <= 0 || step > field.max) {
                throw std::invalid_argument("Step " + stepText + " out of range in " + field.name + " field");
            }
        }

        int first = field.min;
        int last = field.max;
        if (range == "*") {
            // full range
        } else {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                first = parseValue(range.substr(0, dash), field);
                last = parseValue(range.substr(dash + 1), field);
                if (first > last) {
                    throw std::invalid_argument("Descending range '" + range + "' in " + field.name + " field");
                }
            } else {
                first = parseValue(range, field);
                // "a/n" runs from a to the end of the field
                last = slash != std::string::npos ? field.max : first;
            }
        }

        for (int value = first; value <= last; value += step) {
            selected[value] = true;
        }
    }
    return selected;
}

template <size_t N>
std::bitset<N> toBits(const std::vector<bool>& selected, int offset = 0) {
    std::bitset<N> bits;
    for (size_t value = 0; value < selected.size(); ++value) {
        if (selected[value]) {
            bits.set((value + offset) % N);
        }
    }
    return bits;
}

bool isUnrestricted(const std::string& field) {
    return !field.empty() && field[0] == '*';
}

void normalize(std::tm& tm) {
    std::time_t t = timegm(&tm);
    gmtime_r(&t, &tm);
}

} // namespace

CronExpression CronExpression::parse(const std::string& text) {
    std::istringstream stream(text);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        throw std::invalid_argument("Cron expression must have 5 fields, got " +
                                    std::to_string(fields.size()) + ": '" + text + "'");
    }

    CronExpression cron;
    cron.text_ = fields[0] + " " + fields[1] + " " + fields[2] + " " + fields[3] + " " + fields[4];
    cron.minutes_ = toBits<60>(parseField(fields[0], kMinuteField));
    cron.hours_ = toBits<24>(parseField(fields[1], kHourField));
    cron.daysOfMonth_ = toBits<32>(parseField(fields[2], kDayOfMonthField));
    cron.months_ = toBits<13>(parseField(fields[3], kMonthField));
    cron.daysOfWeek_ = toBits<7>(parseField(fields[4], kDayOfWeekField));
    cron.dayOfMonthRestricted_ = !isUnrestricted(fields[2]);
    cron.dayOfWeekRestricted_ = !isUnrestricted(fields[4]);
    return cron;
}

bool CronExpression::dayMatches(int dayOfMonth, int dayOfWeek) const {
    bool domMatch = daysOfMonth_.test(dayOfMonth);
    bool dowMatch = daysOfWeek_.test(dayOfWeek);
    if (dayOfMonthRestricted_ && dayOfWeekRestricted_) {
        return domMatch || dowMatch;
    }
    return domMatch && dowMatch;
}

bool CronExpression::matches(TimePoint time) const {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return minutes_.test(tm.tm_min) && hours_.test(tm.tm_hour) && months_.test(tm.tm_mon + 1) &&
           dayMatches(tm.tm_mday, tm.tm_wday);
}

CronExpression::TimePoint CronExpression::nextAfter(TimePoint after) const {
    std::time_t t = std::chrono::system_clock::to_time_t(after);
    std::tm tm{};
    gmtime_r(&t, &tm);
    tm.tm_sec = 0;
    tm.tm_min += 1;
    normalize(tm);

    const int yearLimit = tm.tm_year + 5;
    while (tm.tm_year <= yearLimit) {
        if (!months_.test(tm.tm_mon + 1)) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!dayMatches(tm.tm_mday, tm.tm_wday)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!hours_.test(tm.tm_hour)) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!minutes_.test(tm.tm_min)) {
            tm.tm_min += 1;
            normalize(tm);
            continue;
        }
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    throw std::runtime_error("Cron expression '" + text_ + "' has no matching time within 5 years");
}

} // namespace sitewatch::scheduler
