#pragma once

#include "domain/CostLayer.hpp"
#include "domain/InventoryRecord.hpp"
#include "domain/InventoryRevaluationEvent.hpp"
#include "domain/LowStockAlert.hpp"
#include "domain/PriceChangeEvent.hpp"
#include "domain/StockKey.hpp"
#include "domain/events/DomainEvent.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Атомарная единица работы над одним ключом (storeId, productId)
 *
 * Пока объект жив, ключ захвачен: другие единицы работы того же ключа ждут.
 * Чтения видят собственные незафиксированные записи.
 * Всё, что записано через единицу работы (запись, слои, алерт,
 * события цены и переоценки, outbox), фиксируется одним commit().
 * Деструктор без commit() откатывает изменения.
 *
 * @throws domain::RetryableStorageError из любого метода при таймауте
 *         или потере соединения; ничего не зафиксировано
 */
class IInventoryUnitOfWork {
public:
    virtual ~IInventoryUnitOfWork() = default;

    virtual const domain::StockKey& key() const = 0;

    // ============================================
    // ЗАПИСЬ ОСТАТКА
    // ============================================

    virtual std::optional<domain::InventoryRecord> record() = 0;

    virtual void saveRecord(const domain::InventoryRecord& record) = 0;

    virtual void deleteRecord() = 0;

    // ============================================
    // СЛОИ СЕБЕСТОИМОСТИ
    // ============================================

    /**
     * @brief Слои ключа в FIFO-порядке (oldest first)
     */
    virtual std::vector<domain::CostLayer> layers() = 0;

    /**
     * @brief Вставить слой; хранилище назначает sequence
     * @return Слой с назначенным sequence
     */
    virtual domain::CostLayer insertLayer(const domain::CostLayer& layer) = 0;

    virtual void updateLayerQuantity(const std::string& layerId, int64_t quantityRemaining) = 0;

    virtual void deleteLayer(const std::string& layerId) = 0;

    // ============================================
    // АЛЕРТ
    // ============================================

    virtual std::optional<domain::LowStockAlert> activeAlert() = 0;

    /**
     * @brief Сохранить алерт (вставка или обновление по id)
     */
    virtual void saveAlert(const domain::LowStockAlert& alert) = 0;

    // ============================================
    // ЖУРНАЛЫ СТОИМОСТИ И OUTBOX
    // ============================================

    virtual void appendPriceChange(const domain::PriceChangeEvent& event) = 0;

    virtual void appendRevaluation(const domain::InventoryRevaluationEvent& event) = 0;

    /**
     * @brief Поставить событие в outbox; доставка только после commit()
     */
    virtual void enqueueNotification(const domain::DomainEvent& event) = 0;

    // ============================================
    // ЗАВЕРШЕНИЕ
    // ============================================

    virtual void commit() = 0;

    virtual void rollback() = 0;
};

} // namespace inventory::ports::output
