#pragma once

#include "domain/InventoryRecord.hpp"
#include "domain/LowStockAlert.hpp"
#include "domain/Timestamp.hpp"
#include "domain/events/InventoryNotificationEvent.hpp"
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Итог синхронизации алерта
 *
 * alert: запись для сохранения (создана, обновлена или закрыта),
 * notification: уведомление для outbox. Пустые поля: менять нечего.
 */
struct AlertTransition {
    AlertStatus previousStatus = AlertStatus::HEALTHY;
    AlertStatus newStatus = AlertStatus::HEALTHY;
    std::optional<LowStockAlert> alert;
    std::optional<InventoryNotificationEvent> notification;

    bool hasChanges() const { return alert.has_value(); }
};

/**
 * @brief Автомат состояний алерта по ключу (storeId, productId)
 *
 * Состояния: healthy, low_stock, out_of_stock, overstocked.
 * 1. Алертная категория без активного алерта: создать алерт и уведомить.
 * 2. Алертная категория с активным алертом: обновить на месте,
 *    уведомить только при смене категории.
 * 3. healthy с активным алертом: закрыть и отправить resolved.
 * 4. healthy без алерта: ничего.
 * Повторный вызов без изменений остатка ничего не меняет и не уведомляет.
 */
class AlertStateMachine {
public:
    /**
     * @param storeId, productId Ключ
     * @param record Текущая запись; std::nullopt, если запись удалена (healthy)
     * @param activeAlert Активный алерт, если есть
     * @param now Метка времени перехода
     */
    static AlertTransition evaluate(const std::string& storeId,
                                    const std::string& productId,
                                    const std::optional<InventoryRecord>& record,
                                    const std::optional<LowStockAlert>& activeAlert,
                                    const Timestamp& now);

    /**
     * @brief Закрыть активный алерт вручную и отправить resolved
     *
     * Остаток не меняется: если категория всё ещё алертная,
     * следующий evaluate() откроет новый алерт.
     */
    static AlertTransition resolveManually(const LowStockAlert& activeAlert,
                                           const std::optional<InventoryRecord>& record,
                                           const Timestamp& now);

    /**
     * @brief Собрать уведомление о категории
     */
    static InventoryNotificationEvent buildNotification(NotificationType type,
                                                        const std::string& storeId,
                                                        const std::string& productId,
                                                        int64_t currentStock,
                                                        const std::optional<int64_t>& minStockLevel,
                                                        const std::optional<int64_t>& maxStockLevel,
                                                        const Timestamp& now);
};

} // namespace inventory::domain
