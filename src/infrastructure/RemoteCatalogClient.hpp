/**
 * @file RemoteCatalogClient.hpp
 * @brief HTTP client for the broadcaster's search API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "domain/CatalogSource.hpp"
#include "infrastructure/AppConfig.hpp"

namespace newscast::infrastructure {

/**
 * @class RemoteCatalogClient
 * @brief Runs the fixed evening-edition search and projects results into CatalogEntry records.
 */
class RemoteCatalogClient : public domain::CatalogSource {
public:
    explicit RemoteCatalogClient(const AppConfig& config);

    /** @brief Sends a GET request to the search endpoint and parses the reply. */
    std::optional<std::vector<domain::CatalogEntry>> search() override;

    /**
     * @brief Parses a raw search response body.
     * @return nullopt when the body is not JSON or carries no result collection.
     *         Individual malformed results are skipped and logged.
     */
    static std::optional<std::vector<domain::CatalogEntry>> ParseSearchResponse(const std::string& body,
                                                                                const AppConfig& config);

    /**
     * @brief Projects one raw result.
     * @return nullopt when the result is not at the edition time.
     * @throws MalformedEntry when a result cannot be read.
     */
    static std::optional<domain::CatalogEntry> ProjectResult(const nlohmann::json& result,
                                                             const AppConfig& config);

    /** @brief Raised for a single unreadable search result. */
    class MalformedEntry : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

private:
    AppConfig m_config;
};

} // namespace newscast::infrastructure
