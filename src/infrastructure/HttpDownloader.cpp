/**
 * @file HttpDownloader.cpp
 * @brief Implementation of HttpDownloader.
 */

#include "infrastructure/HttpDownloader.hpp"
#include <httplib.h>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>

namespace newscast::infrastructure {

HttpDownloader::HttpDownloader(const AppConfig& config)
    : m_connectTimeoutSeconds(config.connectTimeoutSeconds)
    , m_readTimeoutSeconds(config.readTimeoutSeconds)
    , m_transferTimeoutSeconds(config.downloadTimeoutSeconds) {}

bool HttpDownloader::SplitUrl(const std::string& url, std::string& origin, std::string& path) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return false;
    }
    auto pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == schemeEnd + 3) {
        return false;
    }
    if (pathStart == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, pathStart);
        path = url.substr(pathStart);
    }
    return true;
}

bool HttpDownloader::download(const std::string& url, const std::string& destination) {
    std::string origin;
    std::string path;
    if (!SplitUrl(url, origin, path)) {
        std::cerr << "[HttpDownloader] Unsupported URL: " << url << std::endl;
        return false;
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[HttpDownloader] Failed to open " << destination << std::endl;
        return false;
    }

    httplib::Client cli(origin);
    cli.set_connection_timeout(m_connectTimeoutSeconds, 0);
    cli.set_read_timeout(m_readTimeoutSeconds, 0);
    cli.set_follow_location(true);

    std::cout << "[HttpDownloader] Fetching " << url << std::endl;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(m_transferTimeoutSeconds);
    bool timedOut = false;
    std::uintmax_t received = 0;
    auto res = cli.Get(
        path,
        [](const httplib::Response& response) {
            return response.status >= 200 && response.status < 300;
        },
        [&](const char* data, size_t length) {
            if (std::chrono::steady_clock::now() > deadline) {
                timedOut = true;
                return false;
            }
            out.write(data, static_cast<std::streamsize>(length));
            received += length;
            return out.good();
        });

    out.close();

    if (timedOut) {
        std::cerr << "[HttpDownloader] Transfer exceeded " << m_transferTimeoutSeconds << "s, giving up." << std::endl;
        return false;
    }
    if (!res) {
        std::cerr << "[HttpDownloader] Transfer failed: " << httplib::to_string(res.error()) << std::endl;
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[HttpDownloader] HTTP Error " << res->status << " for " << url << std::endl;
        return false;
    }
    if (out.fail()) {
        std::cerr << "[HttpDownloader] Write failed during output: " << destination << std::endl;
        return false;
    }
    if (res->has_header("Content-Length")) {
        std::uintmax_t expected = received;
        try {
            expected = std::stoull(res->get_header_value("Content-Length"));
        } catch (const std::exception& e) {
            std::cerr << "[HttpDownloader] Ignoring bad Content-Length: " << e.what() << std::endl;
        }
        if (expected != received) {
            std::cerr << "[HttpDownloader] Truncated body: got " << received << " of " << expected << " bytes" << std::endl;
            return false;
        }
    }

    std::cout << "[HttpDownloader] Received " << received << " bytes." << std::endl;
    return true;
}

} // namespace newscast::infrastructure
