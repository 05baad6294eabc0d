#pragma once

#include "domain/InventoryRecord.hpp"
#include "domain/InventoryRequest.hpp"
#include "domain/InventoryResult.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Input Port: изменение остатков
 *
 * Каждая операция над ключом выполняется одной единицей работы: слои, запись,
 * алерт и уведомления фиксируются вместе; движение пишется в журнал
 * после фиксации.
 */
class IInventoryService {
public:
    virtual ~IInventoryService() = default;

    /**
     * @throws domain::ValidationError если запись уже есть или данные неверны
     */
    virtual domain::InventoryRecord create(const domain::CreateInventoryRequest& request) = 0;

    /**
     * @throws domain::NotFoundError если записи нет
     * @throws domain::ValidationError при неверных данных
     */
    virtual domain::InventoryRecord update(const std::string& storeId,
                                           const std::string& productId,
                                           const domain::InventoryPatch& patch) = 0;

    /**
     * @brief Относительное изменение; при delta > 0 и отсутствии записи создаёт её
     * @throws domain::InsufficientStockError если остаток уйдёт в минус
     */
    virtual domain::InventoryRecord adjust(const domain::AdjustmentRequest& request) = 0;

    /**
     * @brief Удалить запись и её слои, закрыть алерт
     * @throws domain::NotFoundError если записи нет
     */
    virtual void remove(const std::string& storeId,
                        const std::string& productId,
                        const std::optional<std::string>& userId) = 0;

    virtual std::optional<domain::InventoryRecord> getRecord(const std::string& storeId,
                                                             const std::string& productId) = 0;

    virtual std::vector<domain::InventoryRecord> listByStore(const std::string& storeId) = 0;

    /**
     * @brief Списать проданное количество по FIFO и вернуть себестоимость продажи
     * @throws domain::InsufficientStockError если товара меньше quantity
     */
    virtual domain::SaleCosting recordSaleConsumption(const std::string& storeId,
                                                      const std::string& productId,
                                                      int64_t quantity,
                                                      const std::string& transactionId,
                                                      const std::optional<std::string>& userId) = 0;

    /**
     * @brief Массовое обновление: каждая позиция независима
     */
    virtual std::vector<domain::BulkUpdateResult> bulkUpdate(const std::string& storeId,
                                                             const std::vector<domain::BulkUpdateItem>& items,
                                                             const std::optional<std::string>& userId) = 0;

    /**
     * @brief Инвентаризация: остаток приводится к пересчитанному количеству
     */
    virtual std::vector<domain::StockCountResult> performStockCount(const std::string& storeId,
                                                                    const std::vector<domain::StockCountItem>& items,
                                                                    const std::optional<std::string>& userId,
                                                                    const std::optional<std::string>& notes) = 0;
};

} // namespace inventory::ports::input
