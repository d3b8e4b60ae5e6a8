#include <cassert>
#include <iostream>

#include "domain/BroadcastDate.hpp"

using newscast::domain::BroadcastDate;

int main() {
    std::cout << "[Test] Starting BroadcastDate Test..." << std::endl;

    // Strict ISO parsing
    auto d = BroadcastDate::Parse("2023-04-21");
    assert(d && "Plain ISO date should parse.");
    assert(d->year() == 2023 && d->month() == 4 && d->day() == 21);
    assert(d->toString() == "2023-04-21");

    assert(!BroadcastDate::Parse("2023-4-21"));
    assert(!BroadcastDate::Parse("2023-04-21T20:00"));
    assert(!BroadcastDate::Parse("21.04.2023"));
    assert(!BroadcastDate::Parse("2023-13-01"));
    assert(!BroadcastDate::Parse("2023-00-10"));
    assert(!BroadcastDate::Parse("2023-04-31"));
    assert(!BroadcastDate::Parse("2023-02-29"));
    assert(BroadcastDate::Parse("2024-02-29"));
    assert(!BroadcastDate::Parse("1900-02-29"));
    assert(BroadcastDate::Parse("2000-02-29"));
    assert(!BroadcastDate::Parse(""));
    assert(!BroadcastDate::Parse("abcd-ef-gh"));

    // Previous day across boundaries
    assert(BroadcastDate::Parse("2023-04-21")->previousDay().toString() == "2023-04-20");
    assert(BroadcastDate::Parse("2023-05-01")->previousDay().toString() == "2023-04-30");
    assert(BroadcastDate::Parse("2024-03-01")->previousDay().toString() == "2024-02-29");
    assert(BroadcastDate::Parse("2023-03-01")->previousDay().toString() == "2023-02-28");
    assert(BroadcastDate::Parse("2023-01-01")->previousDay().toString() == "2022-12-31");

    // Ordering
    assert(*BroadcastDate::Parse("2022-12-31") < *BroadcastDate::Parse("2023-01-01"));
    assert(*BroadcastDate::Parse("2023-04-20") != *BroadcastDate::Parse("2023-04-21"));

    std::tm tm = {};
    tm.tm_year = 2023 - 1900;
    tm.tm_mon = 3;
    tm.tm_mday = 21;
    tm.tm_hour = 23;
    assert(BroadcastDate::FromLocalTime(tm).toString() == "2023-04-21");

    std::cout << "[PASS] BroadcastDate Test." << std::endl;
    return 0;
}
