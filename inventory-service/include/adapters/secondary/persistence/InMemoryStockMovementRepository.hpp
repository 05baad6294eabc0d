#pragma once

#include "ports/output/IStockMovementRepository.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory журнал движения остатков
 *
 * Только добавление; sequence назначается при вставке.
 */
class InMemoryStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    InMemoryStockMovementRepository() {
        std::cout << "[InMemoryStockMovementRepository] Created" << std::endl;
    }

    domain::StockMovement append(const domain::StockMovement& movement) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::StockMovement stored = movement;
        stored.sequence = ++sequence_;
        movements_.push_back(stored);
        return stored;
    }

    std::vector<domain::StockMovement> findByStore(
        const std::string& storeId,
        const domain::MovementFilter& filter) override
    {
        return select(filter, [&storeId](const domain::StockMovement& m) {
            return m.storeId == storeId;
        });
    }

    std::vector<domain::StockMovement> findByProduct(
        const std::string& storeId,
        const std::string& productId,
        const domain::MovementFilter& filter) override
    {
        return select(filter, [&](const domain::StockMovement& m) {
            return m.storeId == storeId && m.productId == productId;
        });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return movements_.size();
    }

private:
    template <typename Predicate>
    std::vector<domain::StockMovement> select(const domain::MovementFilter& filter, Predicate pred) const {
        std::vector<domain::StockMovement> matched;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::copy_if(movements_.begin(), movements_.end(), std::back_inserter(matched),
                [&](const domain::StockMovement& m) { return pred(m) && filter.matches(m); });
        }

        // Новые первые; при равном времени позже вставленные первые
        std::sort(matched.begin(), matched.end(),
            [](const domain::StockMovement& a, const domain::StockMovement& b) {
                if (a.occurredAt != b.occurredAt) {
                    return a.occurredAt > b.occurredAt;
                }
                return a.sequence > b.sequence;
            });

        size_t offset = static_cast<size_t>(std::max(filter.offset, 0));
        if (offset >= matched.size()) {
            return {};
        }
        auto first = matched.begin() + static_cast<std::ptrdiff_t>(offset);
        auto last = matched.end();
        if (filter.limit && static_cast<size_t>(*filter.limit) < matched.size() - offset) {
            last = first + *filter.limit;
        }
        return std::vector<domain::StockMovement>(first, last);
    }

    mutable std::mutex mutex_;
    std::vector<domain::StockMovement> movements_;
    int64_t sequence_ = 0;
};

} // namespace inventory::adapters::secondary
