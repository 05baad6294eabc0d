#pragma once

#include "domain/AlertStateMachine.hpp"
#include "domain/InventoryRecord.hpp"
#include "domain/LowStockAlert.hpp"
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Input Port: алерты по остаткам
 */
class ILowStockAlertService {
public:
    virtual ~ILowStockAlertService() = default;

    /**
     * @brief Привести алерт ключа в соответствие с текущей записью
     *
     * Идемпотентна: повторный вызов без изменений остатка ничего не меняет.
     */
    virtual domain::AlertTransition sync(const std::string& storeId,
                                         const std::string& productId) = 0;

    virtual std::vector<domain::LowStockAlert> listActiveAlerts(const std::string& storeId) = 0;

    /**
     * @brief Закрыть алерт вручную и поставить уведомление resolved
     *
     * Уже закрытый алерт возвращается как есть.
     * @throws domain::NotFoundError если алерта нет
     */
    virtual domain::LowStockAlert resolveAlert(const std::string& alertId) = 0;

    /**
     * @brief Записи магазина в категории low_stock или out_of_stock
     */
    virtual std::vector<domain::InventoryRecord> listLowStockItems(const std::string& storeId) = 0;
};

} // namespace inventory::ports::input
