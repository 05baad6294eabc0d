#pragma once

#include "ports/output/ITransactionSource.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <map>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Кассовые транзакции из общей БД кассы (только чтение)
 */
class PostgresTransactionSource : public ports::output::ITransactionSource {
public:
    explicit PostgresTransactionSource(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresTransactionSource] Connected to " << settings_->getName() << std::endl;
    }

    std::vector<domain::SaleTransaction> findCompleted(
        const std::string& storeId,
        domain::TransactionKind kind,
        const domain::Timestamp& from,
        const domain::Timestamp& to) override
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            auto header = t.exec_params(
                R"(
                    SELECT id, store_id, kind, status, total::text AS total,
                           (extract(epoch from created_at) * 1000)::bigint AS created_at_ms
                    FROM sale_transactions
                    WHERE store_id = $1 AND kind = $2 AND status = 'completed'
                      AND created_at >= $3::timestamptz AND created_at < $4::timestamptz
                    ORDER BY created_at ASC
                )",
                storeId, domain::toString(kind), pg::toSql(from), pg::toSql(to));

            auto items = t.exec_params(
                R"(
                    SELECT i.transaction_id, i.product_id, i.quantity,
                           i.unit_cost::text AS unit_cost, i.total_cost::text AS total_cost
                    FROM sale_transaction_items i
                    JOIN sale_transactions s ON s.id = i.transaction_id
                    WHERE s.store_id = $1 AND s.kind = $2 AND s.status = 'completed'
                      AND s.created_at >= $3::timestamptz AND s.created_at < $4::timestamptz
                )",
                storeId, domain::toString(kind), pg::toSql(from), pg::toSql(to));
            t.commit();

            std::vector<domain::SaleTransaction> result;
            std::map<std::string, size_t> indexById;
            for (const auto& row : header) {
                domain::SaleTransaction tx;
                tx.id = row["id"].as<std::string>();
                tx.storeId = row["store_id"].as<std::string>();
                tx.kind = domain::transactionKindFromString(row["kind"].as<std::string>());
                tx.status = domain::transactionStatusFromString(row["status"].as<std::string>());
                tx.total = pg::moneyField(row["total"]);
                tx.createdAt = pg::millisField(row["created_at_ms"]);
                indexById[tx.id] = result.size();
                result.push_back(std::move(tx));
            }

            for (const auto& row : items) {
                auto it = indexById.find(row["transaction_id"].as<std::string>());
                if (it == indexById.end()) {
                    continue;
                }
                domain::TransactionItem item;
                item.productId = row["product_id"].as<std::string>();
                item.quantity = row["quantity"].as<int64_t>();
                item.unitCost = row["unit_cost"].is_null() ? domain::Money() : pg::moneyField(row["unit_cost"]);
                item.totalCost = row["total_cost"].is_null() ? domain::Money() : pg::moneyField(row["total_cost"]);
                result[it->second].items.push_back(std::move(item));
            }
            return result;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("find transactions of " + storeId);
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace inventory::adapters::secondary
