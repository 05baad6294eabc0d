#pragma once

#include "ports/output/IInventoryUnitOfWork.hpp"
#include "ports/output/IProductCatalog.hpp"
#include "domain/AlertStateMachine.hpp"
#include "domain/FifoCostCalculator.hpp"
#include "domain/InventoryRequest.hpp"
#include "domain/StockMovement.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>

namespace inventory::application {

/**
 * @brief Общие шаги изменения остатка внутри открытой единицы работы
 *
 * Приход создаёт слой (если цена известна) и увеличивает totalCostValue,
 * расход списывает слои по FIFO и уменьшает totalCostValue на их стоимость.
 * Средняя цена пересчитывается из totalCostValue; на нуле totalCostValue
 * обнуляется, а avgCost остаётся оценкой на будущее.
 */
class InventoryMutator {
public:
    explicit InventoryMutator(std::shared_ptr<ports::output::IProductCatalog> catalog)
        : catalog_(std::move(catalog))
    {}

    // ============================================
    // ЦЕНЫ
    // ============================================

    /**
     * @brief Себестоимость из каталога; std::nullopt если товара нет или каталог недоступен
     */
    std::optional<domain::Product> catalogProduct(const std::string& productId) const {
        try {
            return catalog_->findById(productId);
        } catch (const std::exception& e) {
            std::cerr << "[InventoryMutator] Catalog lookup failed for " << productId
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    /**
     * @brief Запасная цена единицы: avgCost > 0, иначе цена каталога, иначе 0
     */
    domain::FallbackCostProvider fallbackFor(const std::optional<domain::InventoryRecord>& record,
                                             const std::string& productId) const {
        domain::Money avgCost = record ? record->avgCost : domain::Money();
        return [this, avgCost, productId]() {
            if (avgCost.isPositive()) {
                return avgCost;
            }
            auto product = catalogProduct(productId);
            if (product && product->cost.isPositive()) {
                return product->cost;
            }
            return domain::Money();
        };
    }

    /**
     * @brief Цена прихода: заданная, иначе avgCost > 0, иначе цена каталога > 0
     */
    std::optional<domain::Money> knownIncreaseCost(const domain::InventoryRecord& record,
                                                   const std::optional<domain::Money>& suppliedCost) const {
        if (suppliedCost) {
            return suppliedCost;
        }
        if (record.avgCost.isPositive()) {
            return record.avgCost;
        }
        auto product = catalogProduct(record.productId);
        if (product && product->cost.isPositive()) {
            return product->cost;
        }
        return std::nullopt;
    }

    // ============================================
    // ПРИХОД И РАСХОД
    // ============================================

    /**
     * @brief Приход quantity единиц; при известной цене создаёт слой
     * @return Созданный слой, если был
     * @throws domain::ValidationError если остаток или его стоимость не помещаются в int64
     */
    std::optional<domain::CostLayer> addStock(ports::output::IInventoryUnitOfWork& uow,
                                              domain::InventoryRecord& record,
                                              int64_t quantity,
                                              const std::optional<domain::Money>& unitCost,
                                              const std::string& source,
                                              const std::optional<std::string>& referenceId,
                                              const std::optional<std::string>& notes,
                                              const domain::Timestamp& now) const {
        if (quantity > std::numeric_limits<int64_t>::max() - record.quantity) {
            throw domain::ValidationError("Quantity out of range: " + std::to_string(record.quantity)
                                          + " + " + std::to_string(quantity));
        }

        std::optional<domain::CostLayer> created;
        if (unitCost) {
            domain::Money addedValue = *unitCost * quantity;
            domain::Money totalValue = record.totalCostValue + addedValue;

            domain::CostLayer layer;
            layer.id = utils::UuidGenerator::generate();
            layer.storeId = record.storeId;
            layer.productId = record.productId;
            layer.quantityRemaining = quantity;
            layer.unitCost = *unitCost;
            layer.source = source;
            layer.referenceId = referenceId;
            layer.notes = notes;
            layer.createdAt = now;
            created = uow.insertLayer(layer);

            record.totalCostValue = totalValue;
        }

        record.quantity += quantity;
        recomputeAverage(record);
        return created;
    }

    /**
     * @brief Расход quantity единиц по FIFO
     * @throws domain::InsufficientStockError если на остатке меньше quantity
     */
    domain::CostConsumption removeStock(ports::output::IInventoryUnitOfWork& uow,
                                        domain::InventoryRecord& record,
                                        int64_t quantity) const {
        if (quantity > record.quantity) {
            throw domain::InsufficientStockError(quantity, record.quantity);
        }

        auto layers = uow.layers();
        auto consumption = domain::FifoCostCalculator::preview(
            layers, quantity, fallbackFor(record, record.productId));
        applyConsumption(uow, layers, consumption);

        record.quantity -= quantity;
        record.totalCostValue -= consumption.totalCost;
        if (record.totalCostValue.isNegative()) {
            record.totalCostValue = domain::Money();
        }
        recomputeAverage(record);
        return consumption;
    }

    /**
     * @brief Записать результат FIFO-списания в слои единицы работы
     */
    static void applyConsumption(ports::output::IInventoryUnitOfWork& uow,
                                 const std::vector<domain::CostLayer>& layers,
                                 const domain::CostConsumption& consumption) {
        for (const auto& slice : consumption.slices) {
            for (const auto& layer : layers) {
                if (layer.id != slice.layerId) {
                    continue;
                }
                int64_t remaining = layer.quantityRemaining - slice.quantity;
                if (remaining <= 0) {
                    uow.deleteLayer(layer.id);
                } else {
                    uow.updateLayerQuantity(layer.id, remaining);
                }
                break;
            }
        }
    }

    static void recomputeAverage(domain::InventoryRecord& record) {
        if (record.quantity > 0) {
            record.avgCost = record.totalCostValue.dividedBy(record.quantity);
        } else {
            record.totalCostValue = domain::Money();
        }
    }

    // ============================================
    // АЛЕРТ
    // ============================================

    /**
     * @brief Синхронизировать алерт ключа и поставить уведомление в outbox
     */
    static domain::AlertTransition syncAlert(ports::output::IInventoryUnitOfWork& uow,
                                             const std::optional<domain::InventoryRecord>& record,
                                             const domain::Timestamp& now) {
        const auto& key = uow.key();
        auto transition = domain::AlertStateMachine::evaluate(
            key.storeId, key.productId, record, uow.activeAlert(), now);

        if (transition.alert) {
            uow.saveAlert(*transition.alert);
        }
        if (transition.notification) {
            uow.enqueueNotification(*transition.notification);
        }
        return transition;
    }

    // ============================================
    // ВАЛИДАЦИЯ
    // ============================================

    static void validateThresholds(const std::optional<int64_t>& minLevel,
                                   const std::optional<int64_t>& maxLevel,
                                   const std::optional<int64_t>& reorderLevel) {
        if (minLevel && *minLevel < 0) {
            throw domain::ValidationError("minStockLevel must be >= 0");
        }
        if (maxLevel && *maxLevel < 0) {
            throw domain::ValidationError("maxStockLevel must be >= 0");
        }
        if (reorderLevel && *reorderLevel < 0) {
            throw domain::ValidationError("reorderLevel must be >= 0");
        }
        if (minLevel && maxLevel && *minLevel > *maxLevel) {
            throw domain::ValidationError("minStockLevel must not exceed maxStockLevel");
        }
    }

    static void validateCostUpdate(const std::optional<domain::CostUpdate>& update) {
        if (!update) {
            return;
        }
        if (update->cost && update->cost->isNegative()) {
            throw domain::ValidationError("cost must be >= 0");
        }
        if (update->salePrice && update->salePrice->isNegative()) {
            throw domain::ValidationError("salePrice must be >= 0");
        }
    }

    static void validateKey(const std::string& storeId, const std::string& productId) {
        if (storeId.empty()) {
            throw domain::ValidationError("storeId is required");
        }
        if (productId.empty()) {
            throw domain::ValidationError("productId is required");
        }
    }

    // ============================================
    // ЖУРНАЛ
    // ============================================

    static domain::StockMovement buildMovement(const domain::StockKey& key,
                                               int64_t quantityBefore,
                                               int64_t quantityAfter,
                                               domain::MovementAction action,
                                               const std::string& source,
                                               const domain::Timestamp& now) {
        domain::StockMovement movement;
        movement.id = utils::UuidGenerator::generate();
        movement.storeId = key.storeId;
        movement.productId = key.productId;
        movement.quantityBefore = quantityBefore;
        movement.quantityAfter = quantityAfter;
        movement.delta = quantityAfter - quantityBefore;
        movement.actionType = action;
        movement.source = source;
        movement.occurredAt = now;
        return movement;
    }

private:
    std::shared_ptr<ports::output::IProductCatalog> catalog_;
};

} // namespace inventory::application
