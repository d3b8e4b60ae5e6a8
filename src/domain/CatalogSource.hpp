/**
 * @file CatalogSource.hpp
 * @brief Interface for the remote catalog of published editions.
 */

#pragma once
#include <optional>
#include <vector>
#include "domain/CatalogEntry.hpp"

namespace newscast::domain {

/**
 * @class CatalogSource
 * @brief Abstract source of evening-edition catalog entries.
 */
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    /**
     * @brief Queries the catalog once.
     * @return Entries at the edition time, or nullopt when the remote side is unavailable.
     */
    virtual std::optional<std::vector<CatalogEntry>> search() = 0;
};

} // namespace newscast::domain
