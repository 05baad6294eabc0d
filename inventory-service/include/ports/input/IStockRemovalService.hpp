#pragma once

#include "domain/InventoryRequest.hpp"
#include "domain/InventoryResult.hpp"

namespace inventory::ports::input {

/**
 * @brief Input Port: списание товара с учётом убытка и компенсации
 */
class IStockRemovalService {
public:
    virtual ~IStockRemovalService() = default;

    /**
     * @throws domain::ValidationError при неверных данных
     * @throws domain::InsufficientStockError если quantity больше остатка
     *         (отсутствующая запись считается нулевым остатком)
     */
    virtual domain::StockRemovalResult removeStock(const domain::StockRemovalRequest& request) = 0;
};

} // namespace inventory::ports::input
