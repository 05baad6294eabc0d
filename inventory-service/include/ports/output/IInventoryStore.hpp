#pragma once

#include "ports/output/IInventoryUnitOfWork.hpp"
#include "domain/CostLayer.hpp"
#include "domain/InventoryRecord.hpp"
#include "domain/LowStockAlert.hpp"
#include "domain/StockKey.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Хранилище остатков, слоёв и алертов
 *
 * Изменения только через begin(); остальные методы читают
 * зафиксированное состояние.
 *
 * Реализации:
 * - InMemoryInventoryStore - таблица блокировок по ключу
 * - PostgresInventoryStore - транзакция + advisory lock по ключу
 */
class IInventoryStore {
public:
    virtual ~IInventoryStore() = default;

    /**
     * @brief Открыть единицу работы над ключом
     *
     * @param key Ключ (storeId, productId)
     * @param timeout Сколько ждать захвата ключа и каждого запроса к хранилищу
     * @throws domain::RetryableStorageError если ключ не захвачен за timeout
     */
    virtual std::unique_ptr<IInventoryUnitOfWork> begin(
        const domain::StockKey& key,
        std::chrono::milliseconds timeout) = 0;

    virtual std::optional<domain::InventoryRecord> findRecord(const domain::StockKey& key) = 0;

    virtual std::vector<domain::InventoryRecord> findRecordsByStore(const std::string& storeId) = 0;

    /**
     * @brief Слои ключа в FIFO-порядке
     */
    virtual std::vector<domain::CostLayer> findLayers(const domain::StockKey& key) = 0;

    virtual std::optional<domain::LowStockAlert> findActiveAlert(const domain::StockKey& key) = 0;

    virtual std::vector<domain::LowStockAlert> findActiveAlertsByStore(const std::string& storeId) = 0;

    /**
     * @brief Алерт по id, активный или закрытый
     */
    virtual std::optional<domain::LowStockAlert> findAlertById(const std::string& alertId) = 0;
};

} // namespace inventory::ports::output
