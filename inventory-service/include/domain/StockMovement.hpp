#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/MovementAction.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Запись журнала движения остатков (неизменяемая)
 */
struct StockMovement {
    std::string id;
    std::string storeId;
    std::string productId;
    int64_t quantityBefore = 0;
    int64_t quantityAfter = 0;
    int64_t delta = 0;                  ///< quantityAfter - quantityBefore
    MovementAction actionType = MovementAction::ADJUSTMENT;
    std::string source;
    std::optional<std::string> referenceId;
    std::optional<std::string> userId;
    std::optional<std::string> notes;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp occurredAt;
    int64_t sequence = 0;               ///< порядок вставки, назначается хранилищем
};

/**
 * @brief Фильтр выборки из журнала
 */
struct MovementFilter {
    std::optional<std::string> productId;
    std::optional<MovementAction> actionType;
    std::optional<std::string> userId;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    std::optional<int> limit;
    int offset = 0;

    bool matches(const StockMovement& m) const {
        if (productId && m.productId != *productId) return false;
        if (actionType && m.actionType != *actionType) return false;
        if (userId && (!m.userId || *m.userId != *userId)) return false;
        if (from && m.occurredAt < *from) return false;
        if (to && m.occurredAt > *to) return false;
        return true;
    }
};

} // namespace inventory::domain
