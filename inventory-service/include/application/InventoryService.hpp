#pragma once

#include "ports/input/IInventoryService.hpp"
#include "ports/input/IStockMovementLedger.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IProductCatalog.hpp"
#include "application/InventoryMutator.hpp"
#include "settings/InventorySettings.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>
#include <memory>

namespace inventory::application {

/**
 * @brief Сервис изменения остатков
 *
 * Каждая операция:
 * 1. открывает единицу работы по ключу (storeId, productId);
 * 2. меняет слои, запись, журналы стоимости и алерт;
 * 3. фиксирует единицу работы;
 * 4. пишет движение в журнал, пока ключ ещё захвачен;
 * 5. после освобождения ключа передаёт новые цены в каталог.
 */
class InventoryService : public ports::input::IInventoryService {
public:
    InventoryService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::input::IStockMovementLedger> ledger,
        std::shared_ptr<ports::output::IProductCatalog> catalog,
        std::shared_ptr<settings::InventorySettings> settings
    ) : store_(std::move(store))
      , ledger_(std::move(ledger))
      , catalog_(catalog)
      , mutator_(std::move(catalog))
      , settings_(std::move(settings))
    {
        std::cout << "[InventoryService] Created" << std::endl;
    }

    // ============================================
    // СОЗДАНИЕ
    // ============================================

    domain::InventoryRecord create(const domain::CreateInventoryRequest& request) override {
        InventoryMutator::validateKey(request.storeId, request.productId);
        if (request.initialQuantity < 0) {
            throw domain::ValidationError("initialQuantity must be >= 0");
        }
        InventoryMutator::validateThresholds(request.minStockLevel, request.maxStockLevel, request.reorderLevel);
        InventoryMutator::validateCostUpdate(request.costOverride);

        domain::InventoryRecord record;
        {
            auto uow = begin(request.storeId, request.productId);
            if (uow->record()) {
                throw domain::ValidationError(
                    "Inventory already exists for " + uow->key().toString());
            }

            auto now = domain::Timestamp::now();
            record.id = utils::UuidGenerator::generate();
            record.storeId = request.storeId;
            record.productId = request.productId;
            record.minStockLevel = request.minStockLevel;
            record.maxStockLevel = request.maxStockLevel;
            record.reorderLevel = request.reorderLevel;
            record.createdAt = now;
            record.updatedAt = now;

            std::optional<domain::Money> suppliedCost;
            if (request.costOverride) {
                suppliedCost = request.costOverride->cost;
            }
            auto unitCost = mutator_.knownIncreaseCost(record, suppliedCost);

            if (request.initialQuantity > 0) {
                mutator_.addStock(*uow, record, request.initialQuantity, unitCost,
                                  "initial_inventory", std::nullopt, std::nullopt, now);
            } else if (unitCost) {
                record.avgCost = *unitCost;
            }

            if (request.costOverride && !request.costOverride->empty()) {
                if (suppliedCost) {
                    record.lastCostUpdate = now;
                }
                uow->appendPriceChange(buildPriceChange(
                    record, domain::Money(), *request.costOverride, "inventory_create",
                    std::nullopt, request.userId, now));
            }

            uow->saveRecord(record);
            InventoryMutator::syncAlert(*uow, record, now);
            uow->commit();

            auto movement = InventoryMutator::buildMovement(
                uow->key(), 0, record.quantity, domain::MovementAction::CREATE, "manual", now);
            movement.userId = request.userId;
            movement.notes = "Initial inventory creation";
            movement.metadata = {
                {"initialQuantity", request.initialQuantity},
                {"unitCost", unitCost ? nlohmann::json(unitCost->toString()) : nlohmann::json(nullptr)}
            };
            ledger_->append(movement);
        }

        std::cout << "[InventoryService] Created inventory " << record.key().toString()
                  << " qty=" << record.quantity << std::endl;

        if (request.costOverride) {
            propagatePricing(request.productId, *request.costOverride);
        }
        return record;
    }

    // ============================================
    // ОБНОВЛЕНИЕ
    // ============================================

    domain::InventoryRecord update(const std::string& storeId,
                                   const std::string& productId,
                                   const domain::InventoryPatch& patch) override {
        return applyPatch(storeId, productId, patch).after;
    }

    domain::InventoryRecord adjust(const domain::AdjustmentRequest& request) override {
        InventoryMutator::validateKey(request.storeId, request.productId);
        InventoryMutator::validateCostUpdate(request.costUpdate);
        bool hasCost = request.costUpdate && !request.costUpdate->empty();
        if (request.delta == 0 && !hasCost) {
            throw domain::ValidationError("Adjustment must change quantity or cost");
        }
        if (request.delta == std::numeric_limits<int64_t>::min()) {
            throw domain::ValidationError("Adjustment delta out of range");
        }

        domain::InventoryRecord record;
        {
            auto uow = begin(request.storeId, request.productId);
            auto now = domain::Timestamp::now();
            auto existing = uow->record();

            bool created = false;
            if (!existing) {
                if (request.delta < 0) {
                    throw domain::InsufficientStockError(-request.delta, 0);
                }
                if (request.delta == 0) {
                    throw domain::NotFoundError("Inventory not found for " + uow->key().toString());
                }
                record.id = utils::UuidGenerator::generate();
                record.storeId = request.storeId;
                record.productId = request.productId;
                record.createdAt = now;
                created = true;
            } else {
                record = *existing;
            }
            domain::InventoryRecord before = record;

            std::optional<domain::Money> suppliedCost;
            if (request.costUpdate) {
                suppliedCost = request.costUpdate->cost;
            }

            if (request.delta > 0) {
                mutator_.addStock(*uow, record, request.delta,
                                  mutator_.knownIncreaseCost(record, suppliedCost),
                                  request.source, request.referenceId, request.notes, now);
            } else if (request.delta < 0) {
                mutator_.removeStock(*uow, record, -request.delta);
            } else if (suppliedCost) {
                revalueToCost(*uow, record, *suppliedCost, request.source,
                              request.referenceId, request.userId, now);
            }

            if (hasCost) {
                if (suppliedCost) {
                    record.lastCostUpdate = now;
                }
                uow->appendPriceChange(buildPriceChange(
                    record, before.avgCost, *request.costUpdate, request.source,
                    request.referenceId, request.userId, now));
            }

            record.updatedAt = now;
            uow->saveRecord(record);
            InventoryMutator::syncAlert(*uow, record, now);
            uow->commit();

            auto movement = InventoryMutator::buildMovement(
                uow->key(), before.quantity, record.quantity,
                domain::MovementAction::ADJUSTMENT, request.source, now);
            movement.referenceId = request.referenceId;
            movement.userId = request.userId;
            movement.notes = request.notes;
            movement.metadata = {{"quantityChange", request.delta}};
            if (created) {
                movement.metadata["createdRecord"] = true;
            }
            ledger_->append(movement);
        }

        std::cout << "[InventoryService] Adjusted " << record.key().toString()
                  << " by " << request.delta << " -> " << record.quantity << std::endl;

        if (hasCost) {
            propagatePricing(request.productId, *request.costUpdate);
        }
        return record;
    }

    // ============================================
    // УДАЛЕНИЕ
    // ============================================

    void remove(const std::string& storeId,
                const std::string& productId,
                const std::optional<std::string>& userId) override {
        InventoryMutator::validateKey(storeId, productId);

        auto uow = begin(storeId, productId);
        auto record = uow->record();
        if (!record) {
            throw domain::NotFoundError("Inventory not found for " + uow->key().toString());
        }

        auto now = domain::Timestamp::now();
        auto layers = uow->layers();
        for (const auto& layer : layers) {
            uow->deleteLayer(layer.id);
        }
        uow->deleteRecord();
        InventoryMutator::syncAlert(*uow, std::nullopt, now);
        uow->commit();

        auto movement = InventoryMutator::buildMovement(
            uow->key(), record->quantity, 0, domain::MovementAction::DELETE, "manual", now);
        movement.userId = userId;
        movement.metadata = {
            {"totalCostValue", record->totalCostValue.toString()},
            {"removedLayers", layers.size()}
        };
        ledger_->append(movement);

        std::cout << "[InventoryService] Deleted inventory " << uow->key().toString() << std::endl;
    }

    // ============================================
    // ЧТЕНИЕ
    // ============================================

    std::optional<domain::InventoryRecord> getRecord(const std::string& storeId,
                                                     const std::string& productId) override {
        return store_->findRecord(domain::StockKey{storeId, productId});
    }

    std::vector<domain::InventoryRecord> listByStore(const std::string& storeId) override {
        return store_->findRecordsByStore(storeId);
    }

    // ============================================
    // ПРОДАЖА
    // ============================================

    domain::SaleCosting recordSaleConsumption(const std::string& storeId,
                                              const std::string& productId,
                                              int64_t quantity,
                                              const std::string& transactionId,
                                              const std::optional<std::string>& userId) override {
        InventoryMutator::validateKey(storeId, productId);
        if (quantity <= 0) {
            throw domain::ValidationError("Sale quantity must be positive");
        }

        auto uow = begin(storeId, productId);
        auto existing = uow->record();
        if (!existing) {
            throw domain::InsufficientStockError(quantity, 0);
        }

        auto now = domain::Timestamp::now();
        domain::InventoryRecord record = *existing;
        auto consumption = mutator_.removeStock(*uow, record, quantity);
        record.updatedAt = now;

        uow->saveRecord(record);
        InventoryMutator::syncAlert(*uow, record, now);
        uow->commit();

        auto movement = InventoryMutator::buildMovement(
            uow->key(), existing->quantity, record.quantity,
            domain::MovementAction::ADJUSTMENT, "pos_sale", now);
        movement.referenceId = transactionId;
        movement.userId = userId;
        movement.metadata = {
            {"quantityChange", -quantity},
            {"costOfGoodsSold", consumption.totalCost.toString()},
            {"shortfallQuantity", consumption.shortfallQuantity}
        };
        ledger_->append(movement);

        domain::SaleCosting costing;
        costing.inventory = record;
        costing.quantity = quantity;
        costing.totalCost = consumption.totalCost;
        costing.unitCost = consumption.totalCost.dividedBy(quantity);
        return costing;
    }

    // ============================================
    // МАССОВЫЕ ОПЕРАЦИИ
    // ============================================

    std::vector<domain::BulkUpdateResult> bulkUpdate(const std::string& storeId,
                                                     const std::vector<domain::BulkUpdateItem>& items,
                                                     const std::optional<std::string>& userId) override {
        if (storeId.empty()) {
            throw domain::ValidationError("storeId is required");
        }

        std::vector<domain::BulkUpdateResult> results;
        results.reserve(items.size());

        for (const auto& item : items) {
            domain::BulkUpdateResult result;
            result.productId = item.productId;
            try {
                if (store_->findRecord(domain::StockKey{storeId, item.productId})) {
                    domain::InventoryPatch patch;
                    patch.quantity = item.quantity;
                    patch.minStockLevel = item.minStockLevel;
                    patch.maxStockLevel = item.maxStockLevel;
                    patch.reorderLevel = item.reorderLevel;
                    patch.costUpdate = item.costUpdate;
                    patch.source = "bulk_update";
                    patch.userId = userId;
                    result.record = update(storeId, item.productId, patch);
                } else {
                    domain::CreateInventoryRequest request;
                    request.storeId = storeId;
                    request.productId = item.productId;
                    request.initialQuantity = item.quantity.value_or(0);
                    request.minStockLevel = item.minStockLevel;
                    request.maxStockLevel = item.maxStockLevel;
                    request.reorderLevel = item.reorderLevel;
                    request.costOverride = item.costUpdate;
                    request.userId = userId;
                    result.record = create(request);
                }
                result.success = true;
            } catch (const std::exception& e) {
                std::cerr << "[InventoryService] Bulk item " << item.productId
                          << " failed: " << e.what() << std::endl;
                result.success = false;
                result.error = e.what();
            }
            results.push_back(std::move(result));
        }

        std::cout << "[InventoryService] Bulk update of " << items.size()
                  << " items for store " << storeId << std::endl;
        return results;
    }

    std::vector<domain::StockCountResult> performStockCount(const std::string& storeId,
                                                            const std::vector<domain::StockCountItem>& items,
                                                            const std::optional<std::string>& userId,
                                                            const std::optional<std::string>& notes) override {
        if (storeId.empty()) {
            throw domain::ValidationError("storeId is required");
        }

        std::vector<domain::StockCountResult> results;
        results.reserve(items.size());

        for (const auto& item : items) {
            domain::StockCountResult result;
            result.productId = item.productId;
            result.countedQuantity = item.countedQuantity;
            try {
                if (item.countedQuantity < 0) {
                    throw domain::ValidationError("countedQuantity must be >= 0");
                }

                domain::InventoryPatch patch;
                patch.quantity = item.countedQuantity;
                patch.source = "stock_count";
                patch.notes = notes;
                patch.userId = userId;

                auto outcome = applyPatch(storeId, item.productId, patch);
                result.expectedQuantity = outcome.before.quantity;
                result.variance = item.countedQuantity - outcome.before.quantity;
                result.success = true;
            } catch (const std::exception& e) {
                std::cerr << "[InventoryService] Stock count of " << item.productId
                          << " failed: " << e.what() << std::endl;
                result.success = false;
                result.error = e.what();
            }
            results.push_back(std::move(result));
        }

        std::cout << "[InventoryService] Stock count of " << items.size()
                  << " items for store " << storeId << std::endl;
        return results;
    }

private:
    struct PatchOutcome {
        domain::InventoryRecord before;
        domain::InventoryRecord after;
    };

    std::unique_ptr<ports::output::IInventoryUnitOfWork> begin(const std::string& storeId,
                                                               const std::string& productId) {
        return store_->begin(domain::StockKey{storeId, productId}, settings_->getLockTimeout());
    }

    PatchOutcome applyPatch(const std::string& storeId,
                            const std::string& productId,
                            const domain::InventoryPatch& patch) {
        InventoryMutator::validateKey(storeId, productId);
        if (patch.quantity && *patch.quantity < 0) {
            throw domain::ValidationError("quantity must be >= 0");
        }
        InventoryMutator::validateCostUpdate(patch.costUpdate);

        PatchOutcome outcome;
        bool hasCost = patch.costUpdate && !patch.costUpdate->empty();
        {
            auto uow = begin(storeId, productId);
            auto existing = uow->record();
            if (!existing) {
                throw domain::NotFoundError("Inventory not found for " + uow->key().toString());
            }

            auto now = domain::Timestamp::now();
            outcome.before = *existing;
            domain::InventoryRecord record = *existing;
            nlohmann::json changedFields = nlohmann::json::array();

            if (patch.minStockLevel) {
                record.minStockLevel = patch.minStockLevel;
                changedFields.push_back("minStockLevel");
            }
            if (patch.maxStockLevel) {
                record.maxStockLevel = patch.maxStockLevel;
                changedFields.push_back("maxStockLevel");
            }
            if (patch.reorderLevel) {
                record.reorderLevel = patch.reorderLevel;
                changedFields.push_back("reorderLevel");
            }
            InventoryMutator::validateThresholds(record.minStockLevel, record.maxStockLevel, record.reorderLevel);

            std::optional<domain::Money> suppliedCost;
            if (patch.costUpdate) {
                suppliedCost = patch.costUpdate->cost;
            }

            int64_t diff = patch.quantity ? *patch.quantity - record.quantity : 0;
            if (diff > 0) {
                mutator_.addStock(*uow, record, diff, mutator_.knownIncreaseCost(record, suppliedCost),
                                  patch.source, patch.referenceId, patch.notes, now);
            } else if (diff < 0) {
                mutator_.removeStock(*uow, record, -diff);
            } else if (suppliedCost) {
                revalueToCost(*uow, record, *suppliedCost, patch.source,
                              patch.referenceId, patch.userId, now);
            }
            if (diff != 0) {
                changedFields.push_back("quantity");
            }

            if (hasCost) {
                if (suppliedCost) {
                    record.lastCostUpdate = now;
                    changedFields.push_back("cost");
                }
                if (patch.costUpdate->salePrice) {
                    changedFields.push_back("salePrice");
                }
                uow->appendPriceChange(buildPriceChange(
                    record, outcome.before.avgCost, *patch.costUpdate, patch.source,
                    patch.referenceId, patch.userId, now));
            }

            record.updatedAt = now;
            uow->saveRecord(record);
            InventoryMutator::syncAlert(*uow, record, now);
            uow->commit();

            auto movement = InventoryMutator::buildMovement(
                uow->key(), outcome.before.quantity, record.quantity,
                domain::MovementAction::UPDATE, patch.source, now);
            movement.referenceId = patch.referenceId;
            movement.userId = patch.userId;
            movement.notes = patch.notes;
            movement.metadata = {{"changedFields", changedFields}};
            ledger_->append(movement);

            outcome.after = record;
        }

        std::cout << "[InventoryService] Updated " << outcome.after.key().toString()
                  << " qty " << outcome.before.quantity << " -> " << outcome.after.quantity << std::endl;

        if (hasCost) {
            propagatePricing(productId, *patch.costUpdate);
        }
        return outcome;
    }

    /**
     * @brief Правка себестоимости без изменения количества
     *
     * Слои не переоцениваются: меняется только оценка записи на будущее.
     */
    void revalueToCost(ports::output::IInventoryUnitOfWork& uow,
                       domain::InventoryRecord& record,
                       const domain::Money& cost,
                       const std::string& source,
                       const std::optional<std::string>& referenceId,
                       const std::optional<std::string>& userId,
                       const domain::Timestamp& now) {
        domain::InventoryRecord before = record;
        record.avgCost = cost;
        record.totalCostValue = cost * record.quantity;

        domain::Money delta = record.totalCostValue - before.totalCostValue;
        if (record.quantity <= 0 || delta.isZero()) {
            return;
        }

        domain::InventoryRevaluationEvent event;
        event.id = utils::UuidGenerator::generate();
        event.storeId = record.storeId;
        event.productId = record.productId;
        event.source = "cost_update";
        event.referenceId = referenceId;
        event.userId = userId;
        event.quantityBefore = before.quantity;
        event.quantityAfter = record.quantity;
        event.revaluedQuantity = record.quantity;
        event.avgCostBefore = before.avgCost;
        event.avgCostAfter = record.avgCost;
        event.totalCostBefore = before.totalCostValue;
        event.totalCostAfter = record.totalCostValue;
        event.deltaValue = delta;
        event.metadata = {{"requestSource", source}};
        event.occurredAt = now;
        uow.appendRevaluation(event);
    }

    domain::PriceChangeEvent buildPriceChange(const domain::InventoryRecord& record,
                                              const domain::Money& previousCost,
                                              const domain::CostUpdate& update,
                                              const std::string& source,
                                              const std::optional<std::string>& referenceId,
                                              const std::optional<std::string>& userId,
                                              const domain::Timestamp& now) const {
        domain::PriceChangeEvent event;
        event.id = utils::UuidGenerator::generate();
        event.storeId = record.storeId;
        event.productId = record.productId;
        event.source = source;
        event.referenceId = referenceId;
        event.userId = userId;
        event.occurredAt = now;

        auto product = mutator_.catalogProduct(record.productId);
        if (update.cost) {
            if (previousCost.isPositive()) {
                event.oldCost = previousCost;
            } else if (product) {
                event.oldCost = product->cost;
            }
            event.newCost = update.cost;
        }
        if (update.salePrice) {
            if (product) {
                event.oldSalePrice = product->salePrice;
            }
            event.newSalePrice = update.salePrice;
        }
        event.metadata = {{"quantity", record.quantity}};
        return event;
    }

    void propagatePricing(const std::string& productId, const domain::CostUpdate& update) {
        if (update.empty()) {
            return;
        }
        try {
            if (!catalog_->updatePricing(productId, update.cost, update.salePrice)) {
                std::cerr << "[InventoryService] Product " << productId
                          << " not found in catalog, pricing not propagated" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[InventoryService] Failed to propagate pricing of " << productId
                      << ": " << e.what() << std::endl;
        }
    }

    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::input::IStockMovementLedger> ledger_;
    std::shared_ptr<ports::output::IProductCatalog> catalog_;
    InventoryMutator mutator_;
    std::shared_ptr<settings::InventorySettings> settings_;
};

} // namespace inventory::application
