#pragma once

#include "domain/InventoryRevaluationEvent.hpp"
#include "domain/PriceChangeEvent.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Чтение журналов изменения цены и переоценки
 *
 * Запись идёт только через IInventoryUnitOfWork.
 * Окно [from, to): from включительно, to исключительно; отсутствующая граница не ограничивает.
 * Результаты упорядочены по occurredAt по возрастанию.
 */
class IValuationEventRepository {
public:
    virtual ~IValuationEventRepository() = default;

    virtual std::vector<domain::PriceChangeEvent> findPriceChanges(
        const std::string& storeId,
        const std::optional<std::string>& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) = 0;

    virtual std::vector<domain::InventoryRevaluationEvent> findRevaluations(
        const std::string& storeId,
        const std::optional<std::string>& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) = 0;
};

} // namespace inventory::ports::output
