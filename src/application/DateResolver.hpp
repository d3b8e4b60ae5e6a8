/**
 * @file DateResolver.hpp
 * @brief Picks which evening edition is the latest one already aired.
 */

#pragma once

#include <chrono>
#include "domain/BroadcastDate.hpp"

namespace newscast::application {

class DateResolver {
public:
    /**
     * @brief Before 20:00 local time the latest edition is yesterday's, from 20:00 on it is today's.
     * @param now Injected wall-clock time.
     */
    static domain::BroadcastDate ResolveSearchDate(std::chrono::system_clock::time_point now);

    static constexpr int kCutoffHour = 20;
};

} // namespace newscast::application
