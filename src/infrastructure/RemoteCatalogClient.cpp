#include "infrastructure/RemoteCatalogClient.hpp"
#include "infrastructure/LocalCacheIndex.hpp"
#include <httplib.h>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace newscast::infrastructure {

using json = nlohmann::json;

namespace {

struct Stamp {
    std::string date;     ///< YYYY-MM-DD, not yet checked against the calendar
    std::string time;     ///< HH:MM
    std::string timezone; ///< +HH:MM / -HH:MM
};

bool ReadDigits(const std::string& s, std::size_t& pos, std::size_t count) {
    for (std::size_t k = 0; k < count; ++k, ++pos) {
        if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) {
            return false;
        }
    }
    return true;
}

// Tail after the minutes: [":SS"[".fff"]] then "Z" or "+HH:MM" / "-HH:MM".
std::optional<std::string> ParseZone(const std::string& tail) {
    std::size_t pos = 0;
    if (pos < tail.size() && tail[pos] == ':') {
        ++pos;
        if (!ReadDigits(tail, pos, 2)) return std::nullopt;
        if (pos < tail.size() && tail[pos] == '.') {
            ++pos;
            const std::size_t fractionStart = pos;
            while (pos < tail.size() && std::isdigit(static_cast<unsigned char>(tail[pos]))) ++pos;
            if (pos == fractionStart) return std::nullopt;
        }
    }
    if (pos + 1 == tail.size() && tail[pos] == 'Z') {
        return std::string("+00:00");
    }
    if (pos < tail.size() && (tail[pos] == '+' || tail[pos] == '-')) {
        const std::size_t zoneStart = pos++;
        if (ReadDigits(tail, pos, 2) && pos < tail.size() && tail[pos++] == ':' &&
            ReadDigits(tail, pos, 2) && pos == tail.size()) {
            return tail.substr(zoneStart);
        }
    }
    return std::nullopt;
}

// "2023-04-21T20:00:00.000+02:00"
Stamp ParseStamp(const std::string& text) {
    std::istringstream in(text);
    std::tm tm = {};
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M");
    if (in.fail()) {
        throw RemoteCatalogClient::MalformedEntry("unexpected date format '" + text + "'");
    }

    std::string tail;
    std::getline(in, tail);
    auto zone = ParseZone(tail);
    if (!zone) {
        throw RemoteCatalogClient::MalformedEntry("no timezone offset in '" + text + "'");
    }

    char date[16];
    char time[8];
    std::snprintf(date, sizeof(date), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    std::snprintf(time, sizeof(time), "%02d:%02d", tm.tm_hour, tm.tm_min);
    return Stamp{date, time, *zone};
}

const json* FindResults(const json& body) {
    if (body.is_array()) {
        return &body;
    }
    if (body.is_object() && body.contains("searchResults") && body["searchResults"].is_array()) {
        return &body["searchResults"];
    }
    return nullptr;
}

} // namespace

RemoteCatalogClient::RemoteCatalogClient(const AppConfig& config)
    : m_config(config) {}

std::optional<domain::CatalogEntry> RemoteCatalogClient::ProjectResult(const json& result,
                                                                       const AppConfig& config) {
    if (!result.is_object() || !result.contains("date") || !result["date"].is_string()) {
        throw MalformedEntry("result has no date string");
    }

    const Stamp stamp = ParseStamp(result["date"].get<std::string>());
    if (stamp.time != config.editionTime) {
        return std::nullopt;
    }

    auto date = domain::BroadcastDate::Parse(stamp.date);
    if (!date) {
        throw MalformedEntry("invalid calendar date " + stamp.date);
    }

    if (!result.contains("streams") || !result["streams"].is_object()) {
        throw MalformedEntry("no stream mapping for " + date->toString());
    }
    const json& streams = result["streams"];
    if (!streams.contains(config.streamVariant) || !streams[config.streamVariant].is_string()) {
        throw MalformedEntry("no '" + config.streamVariant + "' stream for " + date->toString());
    }

    domain::CatalogEntry entry;
    entry.date = *date;
    entry.time = stamp.time;
    entry.timezone = stamp.timezone;
    entry.sourceUrl = streams[config.streamVariant].get<std::string>();
    entry.targetPath = LocalCacheIndex::ArtifactPath(config.cacheDir, config.filePrefix, *date);
    return entry;
}

std::optional<std::vector<domain::CatalogEntry>> RemoteCatalogClient::ParseSearchResponse(const std::string& body,
                                                                                         const AppConfig& config) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        std::cerr << "[RemoteCatalogClient] JSON Parse Error: " << e.what() << std::endl;
        return std::nullopt;
    }

    const json* results = FindResults(parsed);
    if (!results) {
        std::cerr << "[RemoteCatalogClient] Response carries no result list." << std::endl;
        return std::nullopt;
    }

    std::vector<domain::CatalogEntry> entries;
    for (const auto& item : *results) {
        try {
            auto entry = ProjectResult(item, config);
            if (entry) {
                entries.push_back(*entry);
            }
        } catch (const MalformedEntry& e) {
            std::cerr << "[RemoteCatalogClient] Skipping malformed entry: " << e.what() << std::endl;
        } catch (const json::exception& e) {
            std::cerr << "[RemoteCatalogClient] Skipping malformed entry: " << e.what() << std::endl;
        }
    }
    return entries;
}

std::optional<std::vector<domain::CatalogEntry>> RemoteCatalogClient::search() {
    httplib::Client cli(m_config.searchBaseUrl);
    cli.set_connection_timeout(m_config.connectTimeoutSeconds, 0);
    cli.set_read_timeout(m_config.readTimeoutSeconds, 0);
    cli.set_follow_location(true);

    httplib::Params params = {
        {"searchText", m_config.searchText},
        {"pageSize", std::to_string(m_config.pageSize)},
        {"resultPage", "0"}
    };
    httplib::Headers headers = {
        {"Accept", "application/json"}
    };

    // The read timeout only bounds a single read; a trickling server is cut off here.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(m_config.searchTimeoutSeconds);
    bool timedOut = false;
    std::string body;
    auto res = cli.Get(
        m_config.searchPath, params, headers,
        [](const httplib::Response&) { return true; },
        [&](const char* data, size_t length) {
            if (std::chrono::steady_clock::now() > deadline) {
                timedOut = true;
                return false;
            }
            body.append(data, length);
            return true;
        });

    if (timedOut) {
        std::cerr << "[RemoteCatalogClient] Search exceeded " << m_config.searchTimeoutSeconds << "s, giving up." << std::endl;
        return std::nullopt;
    }
    if (!res) {
        std::cerr << "[RemoteCatalogClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[RemoteCatalogClient] HTTP Error " << res->status << " from " << m_config.searchBaseUrl << std::endl;
        return std::nullopt;
    }

    auto entries = ParseSearchResponse(body, m_config);
    if (entries) {
        std::cout << "[RemoteCatalogClient] " << entries->size() << " evening edition(s) listed." << std::endl;
    }
    return entries;
}

} // namespace newscast::infrastructure
