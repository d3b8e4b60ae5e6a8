/**
 * @file BroadcastDate.cpp
 * @brief Implementation of BroadcastDate.
 */

#include "domain/BroadcastDate.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace newscast::domain {

namespace {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool AllDigits(const std::string& text, size_t pos, size_t count) {
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

int BroadcastDate::DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::optional<BroadcastDate> BroadcastDate::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (!AllDigits(text, 0, 4) || !AllDigits(text, 5, 2) || !AllDigits(text, 8, 2)) {
        return std::nullopt;
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));
    if (month < 1 || month > 12) {
        return std::nullopt;
    }
    if (day < 1 || day > DaysInMonth(year, month)) {
        return std::nullopt;
    }
    return BroadcastDate(year, month, day);
}

BroadcastDate BroadcastDate::FromLocalTime(const std::tm& localTime) {
    return BroadcastDate(localTime.tm_year + 1900, localTime.tm_mon + 1, localTime.tm_mday);
}

BroadcastDate BroadcastDate::previousDay() const {
    if (m_day > 1) {
        return BroadcastDate(m_year, m_month, m_day - 1);
    }
    if (m_month > 1) {
        return BroadcastDate(m_year, m_month - 1, DaysInMonth(m_year, m_month - 1));
    }
    return BroadcastDate(m_year - 1, 12, 31);
}

std::string BroadcastDate::toString() const {
    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << m_year << '-'
       << std::setw(2) << m_month << '-'
       << std::setw(2) << m_day;
    return os.str();
}

bool BroadcastDate::operator==(const BroadcastDate& other) const {
    return m_year == other.m_year && m_month == other.m_month && m_day == other.m_day;
}

bool BroadcastDate::operator<(const BroadcastDate& other) const {
    return std::tie(m_year, m_month, m_day) < std::tie(other.m_year, other.m_month, other.m_day);
}

} // namespace newscast::domain
