#pragma once

#include "domain/SaleTransaction.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Источник кассовых транзакций (внешний)
 */
class ITransactionSource {
public:
    virtual ~ITransactionSource() = default;

    /**
     * @brief Завершённые транзакции вида kind в окне [from, to)
     */
    virtual std::vector<domain::SaleTransaction> findCompleted(
        const std::string& storeId,
        domain::TransactionKind kind,
        const domain::Timestamp& from,
        const domain::Timestamp& to) = 0;
};

} // namespace inventory::ports::output
