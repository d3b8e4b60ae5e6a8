/**
 * @file Downloader.hpp
 * @brief Interface for fetching a remote file onto local storage.
 */

#pragma once
#include <string>

namespace newscast::domain {

class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * @brief Writes the body behind `url` into `destination`.
     * @return True only when the complete body was received.
     * The caller owns cleanup of `destination` on failure.
     */
    virtual bool download(const std::string& url, const std::string& destination) = 0;
};

} // namespace newscast::domain
