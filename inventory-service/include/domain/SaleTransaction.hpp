#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/TransactionKind.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Позиция кассовой транзакции
 *
 * totalCost посчитан по FIFO в момент продажи.
 */
struct TransactionItem {
    std::string productId;
    int64_t quantity = 0;
    Money unitCost;
    Money totalCost;
};

/**
 * @brief Кассовая транзакция (продажа или возврат)
 */
struct SaleTransaction {
    std::string id;
    std::string storeId;
    TransactionKind kind = TransactionKind::SALE;
    TransactionStatus status = TransactionStatus::COMPLETED;
    Money total;
    Timestamp createdAt;
    std::vector<TransactionItem> items;
};

} // namespace inventory::domain
