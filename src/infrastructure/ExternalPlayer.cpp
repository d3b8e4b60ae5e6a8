#include "infrastructure/ExternalPlayer.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace newscast::infrastructure {

ExternalPlayer::ExternalPlayer(const std::string& command)
    : m_command(command)
{}

std::string ExternalPlayer::Quote(const std::string& s) {
    std::ostringstream oss;
    oss << '"';
    for (char c : s) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') oss << '\\';
        oss << c;
    }
    oss << '"';
    return oss.str();
}

std::string ExternalPlayer::commandFor(const std::string& path) const {
    return m_command + " " + Quote(path) + " >/dev/null 2>&1";
}

bool ExternalPlayer::play(const std::string& path) {
    const std::string cmd = commandFor(path);
    std::cout << "[ExternalPlayer] Running: " << cmd << std::endl;

    int result = std::system(cmd.c_str());
    if (result != 0) {
        std::cerr << "[ExternalPlayer] Handler returned non-zero: " << result << std::endl;
        return false;
    }
    return true;
}

} // namespace newscast::infrastructure
