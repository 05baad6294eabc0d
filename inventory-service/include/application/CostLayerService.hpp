#pragma once

#include "ports/input/ICostLayerService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IProductCatalog.hpp"
#include "application/InventoryMutator.hpp"
#include "settings/InventorySettings.hpp"
#include "domain/FifoCostCalculator.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис FIFO-слоёв себестоимости
 *
 * Работает только со слоями: запись остатка не читается для изменения
 * и не сохраняется. Полные операции над остатком идут через InventoryService.
 */
class CostLayerService : public ports::input::ICostLayerService {
public:
    CostLayerService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IProductCatalog> catalog,
        std::shared_ptr<settings::InventorySettings> settings
    ) : store_(std::move(store))
      , mutator_(std::move(catalog))
      , settings_(std::move(settings))
    {
        std::cout << "[CostLayerService] Created" << std::endl;
    }

    domain::CostLayer createLayer(const std::string& storeId,
                                  const std::string& productId,
                                  int64_t quantity,
                                  const domain::Money& unitCost,
                                  const std::string& source,
                                  const std::optional<std::string>& referenceId,
                                  const std::optional<std::string>& notes) override {
        InventoryMutator::validateKey(storeId, productId);
        if (quantity <= 0) {
            throw domain::ValidationError("Layer quantity must be positive");
        }
        if (unitCost.isNegative()) {
            throw domain::ValidationError("Layer unit cost must be >= 0");
        }

        auto uow = store_->begin(domain::StockKey{storeId, productId}, settings_->getLockTimeout());

        domain::CostLayer layer;
        layer.id = utils::UuidGenerator::generate();
        layer.storeId = storeId;
        layer.productId = productId;
        layer.quantityRemaining = quantity;
        layer.unitCost = unitCost;
        layer.source = source;
        layer.referenceId = referenceId;
        layer.notes = notes;
        layer.createdAt = domain::Timestamp::now();

        auto stored = uow->insertLayer(layer);
        uow->commit();

        std::cout << "[CostLayerService] Layer " << stored.id << " created for "
                  << storeId << ":" << productId << " qty=" << quantity
                  << " @" << unitCost.toString() << std::endl;
        return stored;
    }

    domain::CostConsumption consume(const std::string& storeId,
                                    const std::string& productId,
                                    int64_t quantity) override {
        InventoryMutator::validateKey(storeId, productId);

        auto uow = store_->begin(domain::StockKey{storeId, productId}, settings_->getLockTimeout());
        auto layers = uow->layers();
        auto consumption = domain::FifoCostCalculator::preview(
            layers, quantity, mutator_.fallbackFor(uow->record(), productId));
        InventoryMutator::applyConsumption(*uow, layers, consumption);
        uow->commit();

        std::cout << "[CostLayerService] Consumed " << quantity << " of " << storeId << ":" << productId
                  << " cost=" << consumption.totalCost.toString()
                  << " shortfall=" << consumption.shortfallQuantity << std::endl;
        return consumption;
    }

    domain::CostConsumption preview(const std::string& storeId,
                                    const std::string& productId,
                                    int64_t quantity) override {
        domain::StockKey key{storeId, productId};
        return domain::FifoCostCalculator::preview(
            store_->findLayers(key), quantity, mutator_.fallbackFor(store_->findRecord(key), productId));
    }

    std::vector<domain::CostLayer> listLayers(const std::string& storeId,
                                              const std::string& productId) override {
        return store_->findLayers(domain::StockKey{storeId, productId});
    }

    std::optional<domain::CostLayer> backfillLegacyLayer(const std::string& storeId,
                                                         const std::string& productId) override {
        InventoryMutator::validateKey(storeId, productId);

        auto uow = store_->begin(domain::StockKey{storeId, productId}, settings_->getLockTimeout());
        auto record = uow->record();
        if (!record) {
            throw domain::NotFoundError("Inventory not found for " + storeId + ":" + productId);
        }

        auto layers = uow->layers();
        int64_t gap = record->quantity - domain::FifoCostCalculator::totalQuantity(layers);
        if (gap <= 0) {
            uow->rollback();
            return std::nullopt;
        }

        domain::CostLayer layer;
        layer.id = utils::UuidGenerator::generate();
        layer.storeId = storeId;
        layer.productId = productId;
        layer.quantityRemaining = gap;
        layer.unitCost = mutator_.fallbackFor(record, productId)();
        layer.source = "backfill_legacy";
        layer.notes = "Backfilled layer for stock without cost history";
        // Старый остаток списывается первым
        layer.createdAt = record->createdAt;
        if (!layers.empty() && layers.front().createdAt < layer.createdAt) {
            layer.createdAt = layers.front().createdAt;
        }

        auto stored = uow->insertLayer(layer);
        uow->commit();

        std::cout << "[CostLayerService] Backfilled " << gap << " units for "
                  << storeId << ":" << productId << " @" << stored.unitCost.toString() << std::endl;
        return stored;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    InventoryMutator mutator_;
    std::shared_ptr<settings::InventorySettings> settings_;
};

} // namespace inventory::application
