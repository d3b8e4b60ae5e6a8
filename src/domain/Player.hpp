/**
 * @file Player.hpp
 * @brief Interface for handing a local video to the platform's player.
 */

#pragma once
#include <string>

namespace newscast::domain {

class Player {
public:
    virtual ~Player() = default;

    /** @brief Best-effort launch. Returns false when the handler could not be started. */
    virtual bool play(const std::string& path) = 0;
};

} // namespace newscast::domain
