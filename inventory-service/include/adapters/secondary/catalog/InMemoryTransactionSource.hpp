#pragma once

#include "ports/output/ITransactionSource.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory источник кассовых транзакций
 *
 * Транзакции кладёт касса (или тест) через record().
 */
class InMemoryTransactionSource : public ports::output::ITransactionSource {
public:
    InMemoryTransactionSource() {
        std::cout << "[InMemoryTransactionSource] Created" << std::endl;
    }

    std::vector<domain::SaleTransaction> findCompleted(
        const std::string& storeId,
        domain::TransactionKind kind,
        const domain::Timestamp& from,
        const domain::Timestamp& to) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::SaleTransaction> result;
        std::copy_if(transactions_.begin(), transactions_.end(), std::back_inserter(result),
            [&](const domain::SaleTransaction& t) {
                return t.storeId == storeId
                    && t.kind == kind
                    && t.status == domain::TransactionStatus::COMPLETED
                    && t.createdAt >= from
                    && t.createdAt < to;
            });
        return result;
    }

    void record(const domain::SaleTransaction& transaction) {
        std::lock_guard<std::mutex> lock(mutex_);
        transactions_.push_back(transaction);
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::SaleTransaction> transactions_;
};

} // namespace inventory::adapters::secondary
