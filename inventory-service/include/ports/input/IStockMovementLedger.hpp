#pragma once

#include "domain/StockMovement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Input Port: журнал движения остатков
 */
class IStockMovementLedger {
public:
    virtual ~IStockMovementLedger() = default;

    /**
     * @brief Записать движение (fire-and-forget)
     *
     * Ошибка записи логируется и не пробрасывается: изменение остатка,
     * породившее движение, уже зафиксировано.
     * @return Сохранённая запись или std::nullopt при ошибке
     */
    virtual std::optional<domain::StockMovement> append(const domain::StockMovement& movement) = 0;

    /**
     * @brief Движения магазина; limit по умолчанию 50, от 1 до 200
     */
    virtual std::vector<domain::StockMovement> queryByStore(const std::string& storeId,
                                                            const domain::MovementFilter& filter) = 0;

    /**
     * @brief История товара; limit по умолчанию 100, от 1 до 500
     */
    virtual std::vector<domain::StockMovement> queryByProduct(const std::string& storeId,
                                                              const std::string& productId,
                                                              const domain::MovementFilter& filter) = 0;
};

} // namespace inventory::ports::input
