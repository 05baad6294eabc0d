#pragma once

#include "ports/output/IStockMovementRepository.hpp"
#include <atomic>
#include <stdexcept>

namespace inventory::tests {

/**
 * @brief Репозиторий журнала, который всегда отказывает на запись
 */
class FailingStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    int appendAttempts() const { return appendAttempts_.load(); }

    domain::StockMovement append(const domain::StockMovement&) override {
        ++appendAttempts_;
        throw std::runtime_error("stock_movements is unavailable");
    }

    std::vector<domain::StockMovement> findByStore(const std::string&,
                                                   const domain::MovementFilter&) override {
        return {};
    }

    std::vector<domain::StockMovement> findByProduct(const std::string&,
                                                     const std::string&,
                                                     const domain::MovementFilter&) override {
        return {};
    }

private:
    std::atomic<int> appendAttempts_{0};
};

} // namespace inventory::tests
