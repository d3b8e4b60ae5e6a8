#include "application/DateResolver.hpp"
#include <ctime>

namespace newscast::application {

namespace {

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

domain::BroadcastDate DateResolver::ResolveSearchDate(std::chrono::system_clock::time_point now) {
    const std::tm local = ToLocalTime(std::chrono::system_clock::to_time_t(now));
    const auto today = domain::BroadcastDate::FromLocalTime(local);
    if (local.tm_hour < kCutoffHour) {
        return today.previousDay();
    }
    return today;
}

} // namespace newscast::application
