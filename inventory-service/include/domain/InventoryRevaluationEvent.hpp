#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Изменение стоимости запаса, не связанное с продажей
 *
 * deltaValue = totalCostAfter - totalCostBefore для правок себестоимости,
 * и -lossAmount для списаний (source "stock_removal_<reason>").
 */
struct InventoryRevaluationEvent {
    std::string id;
    std::string storeId;
    std::string productId;
    std::string source;
    std::optional<std::string> referenceId;
    std::optional<std::string> userId;
    int64_t quantityBefore = 0;
    int64_t quantityAfter = 0;
    int64_t revaluedQuantity = 0;
    Money avgCostBefore;
    Money avgCostAfter;
    Money totalCostBefore;
    Money totalCostAfter;
    Money deltaValue;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp occurredAt;
};

} // namespace inventory::domain
