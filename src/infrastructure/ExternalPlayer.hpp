#pragma once

#include "domain/Player.hpp"
#include <string>

namespace newscast::infrastructure {

/**
 * @brief Opens videos with a desktop handler command (xdg-open by default).
 */
class ExternalPlayer : public domain::Player {
public:
    explicit ExternalPlayer(const std::string& command);
    ~ExternalPlayer() override = default;

    bool play(const std::string& path) override;

    /**
     * @brief Builds the shell command line for `path`.
     * Runs in the foreground: desktop handlers such as xdg-open hand the file
     * to the player and return, so their exit status reports the launch.
     */
    std::string commandFor(const std::string& path) const;

private:
    static std::string Quote(const std::string& s);

    std::string m_command;
};

} // namespace newscast::infrastructure
