/**
 * @file CalendarDay.hpp
 * @brief Day-granularity calendar date and inclusive date ranges.
 */

#pragma once
#include <string>
#include <optional>
#include <functional>

namespace metriclens::domain {

/**
 * @class CalendarDay
 * @brief A civil calendar date (proleptic Gregorian), stored as days since 1970-01-01.
 *
 * Observations are bucketed per day, so no time-of-day or timezone is kept.
 */
class CalendarDay {
public:
    CalendarDay() = default;

    /**
     * @brief Builds a day from year/month/day.
     * @throws std::invalid_argument if the triple is not a valid date.
     */
    static CalendarDay FromYmd(int year, unsigned month, unsigned day);

    /** @brief Builds a day directly from its serial number (days since epoch). */
    static CalendarDay FromSerial(long serial) { return CalendarDay(serial); }

    /**
     * @brief Parses "YYYY-MM-DD". Trailing time components ("T21:30:00") are ignored.
     * @return The day, or nullopt if the text is not a valid date.
     */
    static std::optional<CalendarDay> Parse(const std::string& text);

    /** @brief Current local date. */
    static CalendarDay Today();

    long serial() const { return m_serial; }
    int year() const;
    unsigned month() const;
    unsigned day() const;

    /** @brief ISO 8601 "YYYY-MM-DD". */
    std::string toString() const;

    CalendarDay operator+(long days) const { return CalendarDay(m_serial + days); }
    CalendarDay operator-(long days) const { return CalendarDay(m_serial - days); }
    long operator-(const CalendarDay& other) const { return m_serial - other.m_serial; }
    CalendarDay& operator++() { ++m_serial; return *this; }

    bool operator==(const CalendarDay& o) const { return m_serial == o.m_serial; }
    bool operator!=(const CalendarDay& o) const { return m_serial != o.m_serial; }
    bool operator<(const CalendarDay& o) const { return m_serial < o.m_serial; }
    bool operator<=(const CalendarDay& o) const { return m_serial <= o.m_serial; }
    bool operator>(const CalendarDay& o) const { return m_serial > o.m_serial; }
    bool operator>=(const CalendarDay& o) const { return m_serial >= o.m_serial; }

private:
    explicit CalendarDay(long serial) : m_serial(serial) {}

    long m_serial = 0;
};

/** @brief Source of "today" for range computations; replaceable in tests. */
using DayClock = std::function<CalendarDay()>;

/**
 * @struct DateRange
 * @brief Inclusive range [first, last]. Empty when last < first.
 */
struct DateRange {
    CalendarDay first;
    CalendarDay last;

    bool empty() const { return last < first; }
    long dayCount() const { return empty() ? 0 : (last - first) + 1; }
    bool contains(const CalendarDay& d) const { return first <= d && d <= last; }

    /** @brief [today - days, today], i.e. days + 1 calendar days. */
    static DateRange LastNDays(const CalendarDay& today, long days) {
        return DateRange{today - days, today};
    }

    std::string toString() const { return first.toString() + ".." + last.toString(); }

    bool operator==(const DateRange& o) const { return first == o.first && last == o.last; }
};

} // namespace metriclens::domain
