#pragma once

#include "domain/InventorySummary.hpp"
#include "domain/PriceHistoryEntry.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Input Port: сводки остатков и история цен
 */
class IInventoryQueryService {
public:
    virtual ~IInventoryQueryService() = default;

    virtual domain::StoreInventorySummary getStoreSummary(const std::string& storeId) = 0;

    virtual domain::OrganizationInventorySummary getOrganizationSummary(const std::string& orgId) = 0;

    /**
     * @brief История цен и переоценок товара, по возрастанию времени
     */
    virtual std::vector<domain::PriceHistoryEntry> getPriceHistory(
        const std::string& storeId,
        const std::string& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) = 0;
};

} // namespace inventory::ports::input
