/**
 * @file HttpDownloader.hpp
 * @brief Streams a remote video to disk over HTTP(S).
 */

#pragma once

#include <string>
#include "domain/Downloader.hpp"
#include "infrastructure/AppConfig.hpp"

namespace newscast::infrastructure {

class HttpDownloader : public domain::Downloader {
public:
    explicit HttpDownloader(const AppConfig& config);

    bool download(const std::string& url, const std::string& destination) override;

    /**
     * @brief Splits "https://host:port/a/b?c" into ("https://host:port", "/a/b?c").
     * @return False when the URL has no scheme or host.
     */
    static bool SplitUrl(const std::string& url, std::string& origin, std::string& path);

private:
    int m_connectTimeoutSeconds;
    int m_readTimeoutSeconds;
    int m_transferTimeoutSeconds;
};

} // namespace newscast::infrastructure
