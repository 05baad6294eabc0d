#pragma once

#include "domain/StockMovement.hpp"
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Журнал движения остатков (append-only)
 *
 * Выборки упорядочены по occurredAt по убыванию, при равенстве
 * по порядку вставки по убыванию. limit/offset уже нормализованы вызывающим.
 */
class IStockMovementRepository {
public:
    virtual ~IStockMovementRepository() = default;

    /**
     * @brief Добавить запись
     * @return Запись с назначенным sequence
     * @throws std::exception при ошибке хранилища
     */
    virtual domain::StockMovement append(const domain::StockMovement& movement) = 0;

    virtual std::vector<domain::StockMovement> findByStore(
        const std::string& storeId,
        const domain::MovementFilter& filter) = 0;

    virtual std::vector<domain::StockMovement> findByProduct(
        const std::string& storeId,
        const std::string& productId,
        const domain::MovementFilter& filter) = 0;
};

} // namespace inventory::ports::output
