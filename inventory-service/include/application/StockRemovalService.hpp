#pragma once

#include "ports/input/IStockRemovalService.hpp"
#include "ports/input/IStockMovementLedger.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IProductCatalog.hpp"
#include "application/InventoryMutator.hpp"
#include "settings/InventorySettings.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Списание товара (просрочка, порча, кража, возврат поставщику)
 *
 * Себестоимость списания считается по FIFO. Убыток = max(0, себестоимость - компенсация).
 * Ненулевой убыток пишется событием переоценки "stock_removal_<reason>"
 * с deltaValue = -loss: по нему считается P&L.
 */
class StockRemovalService : public ports::input::IStockRemovalService {
public:
    StockRemovalService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::input::IStockMovementLedger> ledger,
        std::shared_ptr<ports::output::IProductCatalog> catalog,
        std::shared_ptr<settings::InventorySettings> settings
    ) : store_(std::move(store))
      , ledger_(std::move(ledger))
      , mutator_(std::move(catalog))
      , settings_(std::move(settings))
    {
        std::cout << "[StockRemovalService] Created" << std::endl;
    }

    domain::StockRemovalResult removeStock(const domain::StockRemovalRequest& request) override {
        validate(request);

        auto uow = store_->begin(domain::StockKey{request.storeId, request.productId},
                                 settings_->getLockTimeout());
        // Отсутствующая запись равна нулевому остатку, как при продаже.
        auto existing = uow->record();
        if (!existing || request.quantity > existing->quantity) {
            throw domain::InsufficientStockError(request.quantity, existing ? existing->quantity : 0);
        }

        auto now = domain::Timestamp::now();
        domain::InventoryRecord record = *existing;
        auto consumption = mutator_.removeStock(*uow, record, request.quantity);
        record.updatedAt = now;

        domain::StockRemovalResult result;
        result.removedQuantity = request.quantity;
        result.costOfRemovedItems = consumption.totalCost.roundToCents();
        result.refundAmount = refundFor(request, result.costOfRemovedItems);
        result.lossAmount = result.costOfRemovedItems - result.refundAmount;
        if (result.lossAmount.isNegative()) {
            result.lossAmount = domain::Money();
        }

        std::string source = domain::stockRemovalSource(request.reason);
        nlohmann::json metadata = {
            {"reason", domain::toString(request.reason)},
            {"refundType", domain::toString(request.refundType)},
            {"costOfRemovedItems", result.costOfRemovedItems.toString(2)},
            {"refundAmount", result.refundAmount.toString(2)},
            {"lossAmount", result.lossAmount.toString(2)}
        };

        uow->saveRecord(record);

        if (result.lossAmount.isPositive()) {
            domain::InventoryRevaluationEvent event;
            event.id = utils::UuidGenerator::generate();
            event.storeId = record.storeId;
            event.productId = record.productId;
            event.source = source;
            event.userId = request.userId;
            event.quantityBefore = existing->quantity;
            event.quantityAfter = record.quantity;
            event.revaluedQuantity = request.quantity;
            event.avgCostBefore = existing->avgCost;
            event.avgCostAfter = record.avgCost;
            event.totalCostBefore = existing->totalCostValue;
            event.totalCostAfter = record.totalCostValue;
            event.deltaValue = -result.lossAmount;
            event.metadata = metadata;
            if (request.notes) {
                event.metadata["notes"] = *request.notes;
            }
            event.occurredAt = now;
            uow->appendRevaluation(event);
        }

        InventoryMutator::syncAlert(*uow, record, now);
        uow->commit();

        auto movement = InventoryMutator::buildMovement(
            uow->key(), existing->quantity, record.quantity,
            domain::MovementAction::REMOVAL, source, now);
        movement.userId = request.userId;
        movement.notes = request.notes;
        movement.metadata = metadata;
        ledger_->append(movement);

        std::cout << "[StockRemovalService] Removed " << request.quantity << " of "
                  << uow->key().toString() << " reason=" << domain::toString(request.reason)
                  << " cost=" << result.costOfRemovedItems.toString(2)
                  << " loss=" << result.lossAmount.toString(2) << std::endl;

        result.inventory = record;
        return result;
    }

private:
    static void validate(const domain::StockRemovalRequest& request) {
        InventoryMutator::validateKey(request.storeId, request.productId);
        if (request.quantity <= 0) {
            throw domain::ValidationError("Removal quantity must be positive");
        }
        if (request.refundAmount && request.refundAmount->isNegative()) {
            throw domain::ValidationError("refundAmount must be >= 0");
        }
        if (request.refundPerUnit && request.refundPerUnit->isNegative()) {
            throw domain::ValidationError("refundPerUnit must be >= 0");
        }
        if (request.refundType == domain::RefundType::PARTIAL
            && !request.refundAmount && !request.refundPerUnit) {
            throw domain::ValidationError("Partial refund requires refundAmount or refundPerUnit");
        }
    }

    static domain::Money refundFor(const domain::StockRemovalRequest& request,
                                   const domain::Money& cost) {
        switch (request.refundType) {
            case domain::RefundType::FULL:
                return cost;
            case domain::RefundType::PARTIAL:
                if (request.refundAmount) {
                    return request.refundAmount->roundToCents();
                }
                return (*request.refundPerUnit * request.quantity).roundToCents();
            case domain::RefundType::NONE:
                break;
        }
        return domain::Money();
    }

    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::input::IStockMovementLedger> ledger_;
    InventoryMutator mutator_;
    std::shared_ptr<settings::InventorySettings> settings_;
};

} // namespace inventory::application
