#pragma once

#include "ports/input/IStockMovementLedger.hpp"
#include "ports/output/IStockMovementRepository.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Журнал движения остатков
 *
 * Запись не блокирует и не откатывает изменение остатка: ошибка
 * хранилища журнала только логируется.
 */
class StockMovementLedger : public ports::input::IStockMovementLedger {
public:
    static constexpr int STORE_DEFAULT_LIMIT = 50;
    static constexpr int STORE_MAX_LIMIT = 200;
    static constexpr int PRODUCT_DEFAULT_LIMIT = 100;
    static constexpr int PRODUCT_MAX_LIMIT = 500;

    explicit StockMovementLedger(std::shared_ptr<ports::output::IStockMovementRepository> repository)
        : repository_(std::move(repository))
    {
        std::cout << "[StockMovementLedger] Created" << std::endl;
    }

    std::optional<domain::StockMovement> append(const domain::StockMovement& movement) override {
        try {
            return repository_->append(movement);
        } catch (const std::exception& e) {
            std::cerr << "[StockMovementLedger] Failed to append " << domain::toString(movement.actionType)
                      << " for " << movement.storeId << ":" << movement.productId
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    std::vector<domain::StockMovement> queryByStore(const std::string& storeId,
                                                    const domain::MovementFilter& filter) override {
        return repository_->findByStore(storeId, normalize(filter, STORE_DEFAULT_LIMIT, STORE_MAX_LIMIT));
    }

    std::vector<domain::StockMovement> queryByProduct(const std::string& storeId,
                                                      const std::string& productId,
                                                      const domain::MovementFilter& filter) override {
        return repository_->findByProduct(
            storeId, productId, normalize(filter, PRODUCT_DEFAULT_LIMIT, PRODUCT_MAX_LIMIT));
    }

private:
    static domain::MovementFilter normalize(domain::MovementFilter filter, int defaultLimit, int maxLimit) {
        filter.limit = std::clamp(filter.limit.value_or(defaultLimit), 1, maxLimit);
        filter.offset = std::max(filter.offset, 0);
        return filter;
    }

    std::shared_ptr<ports::output::IStockMovementRepository> repository_;
};

} // namespace inventory::application
