#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Изменение себестоимости или цены продажи
 */
struct PriceChangeEvent {
    std::string id;
    std::string storeId;
    std::string productId;
    std::optional<Money> oldCost;
    std::optional<Money> newCost;
    std::optional<Money> oldSalePrice;
    std::optional<Money> newSalePrice;
    std::string source;
    std::optional<std::string> referenceId;
    std::optional<std::string> userId;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp occurredAt;
};

} // namespace inventory::domain
