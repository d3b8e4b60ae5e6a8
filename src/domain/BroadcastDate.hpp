/**
 * @file BroadcastDate.hpp
 * @brief Value object identifying which day's evening edition is sought.
 */

#pragma once
#include <ctime>
#include <optional>
#include <string>

namespace newscast::domain {

/**
 * @class BroadcastDate
 * @brief Calendar date without a time component, always rendered as YYYY-MM-DD.
 *
 * Sole lookup key across local cache resolution and remote catalog matching.
 */
class BroadcastDate {
public:
    BroadcastDate() = default;

    /**
     * @brief Parses strict ISO text ("2023-04-21").
     * @return nullopt when the text is not exactly YYYY-MM-DD or names no real day.
     */
    static std::optional<BroadcastDate> Parse(const std::string& text);

    /** @brief Takes the calendar part of a broken-down local time. */
    static BroadcastDate FromLocalTime(const std::tm& localTime);

    /** @brief The calendar day before this one (crosses month and year boundaries). */
    BroadcastDate previousDay() const;

    std::string toString() const;

    int year() const { return m_year; }
    int month() const { return m_month; }
    int day() const { return m_day; }

    bool operator==(const BroadcastDate& other) const;
    bool operator!=(const BroadcastDate& other) const { return !(*this == other); }
    bool operator<(const BroadcastDate& other) const;

    static int DaysInMonth(int year, int month);

private:
    BroadcastDate(int year, int month, int day) : m_year(year), m_month(month), m_day(day) {}

    int m_year = 1970;
    int m_month = 1;
    int m_day = 1;
};

} // namespace newscast::domain
