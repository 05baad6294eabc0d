#pragma once

#include "ports/input/ILowStockAlertService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "application/InventoryMutator.hpp"
#include "settings/InventorySettings.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис алертов по остаткам
 *
 * Мутации остатка синхронизируют алерт сами, внутри своей единицы работы.
 * sync() нужен для явной пересинхронизации ключа (например, после
 * загрузки данных в обход сервиса).
 */
class LowStockAlertService : public ports::input::ILowStockAlertService {
public:
    LowStockAlertService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<settings::InventorySettings> settings
    ) : store_(std::move(store))
      , settings_(std::move(settings))
    {
        std::cout << "[LowStockAlertService] Created" << std::endl;
    }

    domain::AlertTransition sync(const std::string& storeId, const std::string& productId) override {
        InventoryMutator::validateKey(storeId, productId);

        auto uow = store_->begin(domain::StockKey{storeId, productId}, settings_->getLockTimeout());
        auto transition = InventoryMutator::syncAlert(*uow, uow->record(), domain::Timestamp::now());
        if (!transition.hasChanges()) {
            uow->rollback();
            return transition;
        }
        uow->commit();

        std::cout << "[LowStockAlertService] " << storeId << ":" << productId << " "
                  << domain::toString(transition.previousStatus) << " -> "
                  << domain::toString(transition.newStatus) << std::endl;
        return transition;
    }

    std::vector<domain::LowStockAlert> listActiveAlerts(const std::string& storeId) override {
        return store_->findActiveAlertsByStore(storeId);
    }

    domain::LowStockAlert resolveAlert(const std::string& alertId) override {
        if (alertId.empty()) {
            throw domain::ValidationError("alertId is required");
        }

        auto found = store_->findAlertById(alertId);
        if (!found) {
            throw domain::NotFoundError("Alert not found: " + alertId);
        }
        if (found->isResolved) {
            return *found;
        }

        auto uow = store_->begin(domain::StockKey{found->storeId, found->productId},
                                 settings_->getLockTimeout());
        auto active = uow->activeAlert();
        if (!active || active->id != alertId) {
            // Закрыт синхронизацией, пока ждали ключ
            uow->rollback();
            auto current = store_->findAlertById(alertId);
            if (!current) {
                throw domain::NotFoundError("Alert not found: " + alertId);
            }
            return *current;
        }

        auto transition = domain::AlertStateMachine::resolveManually(
            *active, uow->record(), domain::Timestamp::now());
        uow->saveAlert(*transition.alert);
        uow->enqueueNotification(*transition.notification);
        uow->commit();

        std::cout << "[LowStockAlertService] Alert " << alertId << " resolved manually ("
                  << found->storeId << ":" << found->productId << ")" << std::endl;
        return *transition.alert;
    }

    std::vector<domain::InventoryRecord> listLowStockItems(const std::string& storeId) override {
        auto records = store_->findRecordsByStore(storeId);
        records.erase(std::remove_if(records.begin(), records.end(),
            [](const domain::InventoryRecord& r) {
                auto status = r.alertStatus();
                return status != domain::AlertStatus::LOW_STOCK && status != domain::AlertStatus::OUT_OF_STOCK;
            }), records.end());
        return records;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<settings::InventorySettings> settings_;
};

} // namespace inventory::application
