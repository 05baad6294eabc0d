#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Вид кассовой транзакции
 */
enum class TransactionKind {
    SALE,
    REFUND
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::SALE:   return "sale";
        case TransactionKind::REFUND: return "refund";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind transactionKindFromString(const std::string& str) {
    if (str == "sale")   return TransactionKind::SALE;
    if (str == "refund") return TransactionKind::REFUND;
    throw std::invalid_argument("Unknown TransactionKind: " + str);
}

/**
 * @brief Статус кассовой транзакции
 */
enum class TransactionStatus {
    PENDING,
    COMPLETED,
    VOIDED
};

inline std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::PENDING:   return "pending";
        case TransactionStatus::COMPLETED: return "completed";
        case TransactionStatus::VOIDED:    return "voided";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionStatus transactionStatusFromString(const std::string& str) {
    if (str == "pending")   return TransactionStatus::PENDING;
    if (str == "completed") return TransactionStatus::COMPLETED;
    if (str == "voided")    return TransactionStatus::VOIDED;
    throw std::invalid_argument("Unknown TransactionStatus: " + str);
}

} // namespace inventory::domain
