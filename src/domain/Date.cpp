/**
 * @file Date.cpp
 * @brief Implementation of the Date value object.
 */

#include "domain/Date.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace tasksmind::domain {

namespace {

bool IsLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeap(y)) return 29;
    return kDays[m - 1];
}

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

Date::Date(int year, unsigned month, unsigned day)
    : m_year(year), m_month(month), m_day(day) {
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        throw std::invalid_argument("Invalid calendar date");
    }
}

std::optional<Date> Date::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }
    const int y = std::stoi(text.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    if (m < 1 || m > 12 || d < 1 || d > DaysInMonth(y, m)) return std::nullopt;
    return Date(y, m, d);
}

Date Date::Today() {
    const std::tm tm = ToLocalTime(std::time(nullptr));
    return Date(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
}

// Civil-from-days / days-from-civil conversions (H. Hinnant's algorithms).
long Date::toDays() const {
    const int y = m_year - (m_month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = m_month > 2 ? m_month - 3 : m_month + 9;
    const unsigned doy = (153 * mp + 2) / 5 + m_day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

Date Date::FromDays(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const int y = static_cast<int>(static_cast<long>(yoe) + era * 400) + (m <= 2 ? 1 : 0);
    return Date(y, m, d);
}

std::string Date::toIsoString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", m_year, m_month, m_day);
    return buf;
}

} // namespace tasksmind::domain
