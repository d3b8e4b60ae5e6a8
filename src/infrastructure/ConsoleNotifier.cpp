#include "infrastructure/ConsoleNotifier.hpp"

namespace newscast::infrastructure {

ConsoleNotifier::ConsoleNotifier(std::ostream& out, std::ostream& err)
    : m_out(out), m_err(err) {}

void ConsoleNotifier::info(const std::string& message) {
    m_out << "[newscast] " << message << std::endl;
}

void ConsoleNotifier::warning(const std::string& message) {
    m_err << "[newscast] Warning: " << message << std::endl;
}

void ConsoleNotifier::error(const std::string& message, int exitCode) {
    m_err << "[newscast] Error: " << message << std::endl;
    m_exitCode = exitCode;
}

} // namespace newscast::infrastructure
