#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Точка истории цен: правка цены или переоценка
 */
struct PriceHistoryEntry {
    enum class Kind { PRICE_CHANGE, REVALUATION };

    Kind kind = Kind::PRICE_CHANGE;
    std::string eventId;
    std::string source;
    Timestamp occurredAt;

    std::optional<Money> oldCost;
    std::optional<Money> newCost;
    std::optional<Money> oldSalePrice;
    std::optional<Money> newSalePrice;

    std::optional<Money> avgCostBefore;
    std::optional<Money> avgCostAfter;
    std::optional<Money> deltaValue;
};

inline std::string toString(PriceHistoryEntry::Kind kind) {
    return kind == PriceHistoryEntry::Kind::PRICE_CHANGE ? "price_change" : "revaluation";
}

} // namespace inventory::domain
