#include <cassert>
#include <iostream>

#include "application/DateResolver.hpp"
#include "TestSupport.hpp"

using newscast::application::DateResolver;
using newscast::test::LocalTime;

int main() {
    std::cout << "[Test] Starting DateResolver Test..." << std::endl;

    // Before the cutoff the latest aired edition is yesterday's.
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 4, 21, 19, 59, 59)).toString() == "2023-04-20");
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 4, 21, 0, 0, 0)).toString() == "2023-04-20");
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 4, 21, 12, 30, 0)).toString() == "2023-04-20");

    // At and after the cutoff it is today's.
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 4, 21, 20, 0, 0)).toString() == "2023-04-21");
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 4, 21, 20, 0, 1)).toString() == "2023-04-21");
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 4, 21, 23, 59, 59)).toString() == "2023-04-21");

    // Month, leap-day and year boundaries
    assert(DateResolver::ResolveSearchDate(LocalTime(2024, 3, 1, 8, 0, 0)).toString() == "2024-02-29");
    assert(DateResolver::ResolveSearchDate(LocalTime(2023, 1, 1, 8, 0, 0)).toString() == "2022-12-31");
    assert(DateResolver::ResolveSearchDate(LocalTime(2022, 12, 31, 21, 0, 0)).toString() == "2022-12-31");

    std::cout << "[PASS] DateResolver Test." << std::endl;
    return 0;
}
