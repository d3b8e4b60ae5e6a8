/**
 * @file Notifier.hpp
 * @brief Narrow reporting capability with one method per severity.
 */

#pragma once
#include <string>

namespace newscast::domain {

/**
 * @class Notifier
 * @brief Receives user-facing outcomes. How they are shown is up to the implementation.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;

    /**
     * @brief Reports a fatal outcome.
     * @param exitCode Process exit status the shell should end with.
     */
    virtual void error(const std::string& message, int exitCode) = 0;
};

} // namespace newscast::domain
