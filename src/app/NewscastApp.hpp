/**
 * @file NewscastApp.hpp
 * @brief Command-line shell around the fetch-or-cache core.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/BroadcastDate.hpp"
#include "infrastructure/AppConfig.hpp"
#include "infrastructure/ConsoleNotifier.hpp"

namespace newscast::app {

/** @brief Process exit codes (sysexits-style categories). */
enum ExitCode {
    kExitOk = 0,
    kExitRuntime = 1,
    kExitUsage = 64,
    kExitInternal = 70,
    kExitCantCreate = 73
};

/**
 * @class NewscastApp
 * @brief Parses arguments, wires the components and maps outcomes to exit codes.
 */
class NewscastApp {
public:
    NewscastApp();

    /**
     * @brief Runs one invocation.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

private:
    enum class Mode { Fetch, List, Purge, Help };

    struct Invocation {
        Mode mode = Mode::Fetch;
        std::optional<domain::BroadcastDate> date;
    };

    /** @brief Fills `out`; returns false and reports a usage error on bad input. */
    bool ParseArguments(const std::vector<std::string>& args, Invocation& out);

    int RunFetch(const std::optional<domain::BroadcastDate>& requested);
    int RunList();
    int RunPurge();
    void PrintUsage() const;

    infrastructure::AppConfig m_config;
    std::shared_ptr<infrastructure::ConsoleNotifier> m_notifier;
};

} // namespace newscast::app
