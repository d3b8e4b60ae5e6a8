// Shared helpers for the standalone test executables.
#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/CatalogSource.hpp"
#include "domain/Downloader.hpp"
#include "domain/Notifier.hpp"
#include "domain/Player.hpp"

namespace newscast::test {

/** @brief Fresh directory under the system temp dir, removed on destruction. */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(ticks));
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> ListNames(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    if (!std::filesystem::exists(dir)) return names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

/** @brief Builds a wall-clock instant from local calendar fields (fake clock). */
inline std::chrono::system_clock::time_point LocalTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

class FakeCatalog : public domain::CatalogSource {
public:
    std::optional<std::vector<domain::CatalogEntry>> response = std::vector<domain::CatalogEntry>{};
    int calls = 0;

    std::optional<std::vector<domain::CatalogEntry>> search() override {
        ++calls;
        return response;
    }
};

class FakeDownloader : public domain::Downloader {
public:
    enum class Behavior { Succeed, FailAfterPartialWrite, Throw };

    Behavior behavior = Behavior::Succeed;
    std::string payload = "video-bytes";
    int calls = 0;
    std::string lastUrl;
    std::string lastDestination;

    bool download(const std::string& url, const std::string& destination) override {
        ++calls;
        lastUrl = url;
        lastDestination = destination;
        switch (behavior) {
            case Behavior::Succeed:
                WriteFile(destination, payload);
                return true;
            case Behavior::FailAfterPartialWrite:
                WriteFile(destination, payload.substr(0, payload.size() / 2));
                return false;
            case Behavior::Throw:
                WriteFile(destination, payload.substr(0, 1));
                throw std::runtime_error("connection reset");
        }
        return false;
    }
};

class FakePlayer : public domain::Player {
public:
    bool succeed = true;
    std::vector<std::string> played;

    bool play(const std::string& path) override {
        played.push_back(path);
        return succeed;
    }
};

class RecordingNotifier : public domain::Notifier {
public:
    std::vector<std::string> infos;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    int exitCode = 0;

    void info(const std::string& message) override { infos.push_back(message); }
    void warning(const std::string& message) override { warnings.push_back(message); }
    void error(const std::string& message, int code) override {
        errors.push_back(message);
        exitCode = code;
    }
};

} // namespace newscast::test
