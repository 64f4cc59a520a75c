/**
 * @file CalendarDay.cpp
 * @brief Implementation of CalendarDay (civil date <-> serial day conversions).
 */

#include "domain/CalendarDay.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace metriclens::domain {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (era-based algorithm).
long daysFromCivil(long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

struct Civil {
    long year;
    unsigned month;
    unsigned day;
};

Civil civilFromDays(long z) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Civil{y + (m <= 2), m, d};
}

bool isLeap(long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(long y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) return 29;
    return kDays[m - 1];
}

bool parseDigits(const std::string& text, size_t pos, size_t count, long& out) {
    if (pos + count > text.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        out = out * 10 + (text[i] - '0');
    }
    return true;
}

} // namespace

CalendarDay CalendarDay::FromYmd(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return CalendarDay(daysFromCivil(year, month, day));
}

std::optional<CalendarDay> CalendarDay::Parse(const std::string& text) {
    long y = 0, m = 0, d = 0;
    if (!parseDigits(text, 0, 4, y) || text.size() < 10 || text[4] != '-' ||
        !parseDigits(text, 5, 2, m) || text[7] != '-' || !parseDigits(text, 8, 2, d)) {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || static_cast<unsigned>(d) > daysInMonth(y, static_cast<unsigned>(m))) {
        return std::nullopt;
    }
    return CalendarDay(daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d)));
}

CalendarDay CalendarDay::Today() {
    std::time_t tt = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return CalendarDay(daysFromCivil(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                                     static_cast<unsigned>(tm.tm_mday)));
}

int CalendarDay::year() const {
    return static_cast<int>(civilFromDays(m_serial).year);
}

unsigned CalendarDay::month() const {
    return civilFromDays(m_serial).month;
}

unsigned CalendarDay::day() const {
    return civilFromDays(m_serial).day;
}

std::string CalendarDay::toString() const {
    const Civil c = civilFromDays(m_serial);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04ld-%02u-%02u", c.year, c.month, c.day);
    return buf;
}

} // namespace metriclens::domain
