/**
 * @file Date.hpp
 * @brief Calendar date value object used for suspense dates.
 */

#pragma once
#include <optional>
#include <string>

namespace tasksmind::domain {

/**
 * @class Date
 * @brief A proleptic Gregorian calendar date without time of day.
 */
class Date {
public:
    Date() = default;
    Date(int year, unsigned month, unsigned day);

    /**
     * @brief Parses an ISO-8601 calendar date ("YYYY-MM-DD").
     * @return The date, or nullopt if the text is not a valid date.
     */
    static std::optional<Date> Parse(const std::string& text);

    /** @brief Current local calendar date. */
    static Date Today();

    /** @brief Builds a date from a count of days since 1970-01-01. */
    static Date FromDays(long days);

    int year() const { return m_year; }
    unsigned month() const { return m_month; }
    unsigned day() const { return m_day; }

    /** @brief Days since 1970-01-01 (negative before the epoch). */
    long toDays() const;

    /** @brief Signed number of days from this date until @p other. */
    long daysUntil(const Date& other) const { return other.toDays() - toDays(); }

    Date addDays(long days) const { return FromDays(toDays() + days); }

    /** @brief Formats as "YYYY-MM-DD". */
    std::string toIsoString() const;

    bool operator==(const Date& o) const { return toDays() == o.toDays(); }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const { return toDays() < o.toDays(); }
    bool operator<=(const Date& o) const { return toDays() <= o.toDays(); }

private:
    int m_year = 1970;
    unsigned m_month = 1;
    unsigned m_day = 1;
};

} // namespace tasksmind::domain
