/**
 * @file ConsoleNotifier.hpp
 * @brief Notifier that writes tagged lines to the terminal.
 */

#pragma once

#include <ostream>
#include "domain/Notifier.hpp"

namespace newscast::infrastructure {

class ConsoleNotifier : public domain::Notifier {
public:
    ConsoleNotifier(std::ostream& out, std::ostream& err);

    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message, int exitCode) override;

    /** @brief Exit code of the last error reported, 0 if none. */
    int exitCode() const { return m_exitCode; }

private:
    std::ostream& m_out;
    std::ostream& m_err;
    int m_exitCode = 0;
};

} // namespace newscast::infrastructure
