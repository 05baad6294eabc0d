#pragma once

#include "ports/output/IStockMovementRepository.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL журнал движения остатков
 *
 * Только INSERT и SELECT: строки журнала не меняются и не удаляются.
 */
class PostgresStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    explicit PostgresStockMovementRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresStockMovementRepo] Connected to " << settings_->getName() << std::endl;
    }

    domain::StockMovement append(const domain::StockMovement& m) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                R"(
                    INSERT INTO stock_movements (
                        id, store_id, product_id, quantity_before, quantity_after, delta,
                        action_type, source, reference_id, user_id, notes, metadata, occurred_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12::jsonb, $13::timestamptz)
                    RETURNING sequence
                )",
                m.id, m.storeId, m.productId, m.quantityBefore, m.quantityAfter, m.delta,
                domain::toString(m.actionType), m.source, m.referenceId, m.userId, m.notes,
                m.metadata.dump(), pg::toSql(m.occurredAt));
            t.commit();

            domain::StockMovement stored = m;
            stored.sequence = r[0]["sequence"].as<int64_t>();
            return stored;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("append movement " + m.storeId + ":" + m.productId);
        }
    }

    std::vector<domain::StockMovement> findByStore(
        const std::string& storeId,
        const domain::MovementFilter& filter) override
    {
        return select(storeId, filter.productId, filter);
    }

    std::vector<domain::StockMovement> findByProduct(
        const std::string& storeId,
        const std::string& productId,
        const domain::MovementFilter& filter) override
    {
        return select(storeId, productId, filter);
    }

private:
    std::vector<domain::StockMovement> select(const std::string& storeId,
                                              const std::optional<std::string>& productId,
                                              const domain::MovementFilter& filter)
    {
        std::optional<std::string> action;
        if (filter.actionType) {
            action = domain::toString(*filter.actionType);
        }
        std::optional<int64_t> limit;
        if (filter.limit) {
            limit = *filter.limit;
        }

        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                R"(
                    SELECT id, store_id, product_id, quantity_before, quantity_after, delta,
                           action_type, source, reference_id, user_id, notes,
                           metadata::text AS metadata, sequence,
                           (extract(epoch from occurred_at) * 1000)::bigint AS occurred_at_ms
                    FROM stock_movements
                    WHERE store_id = $1
                      AND ($2::text IS NULL OR product_id = $2)
                      AND ($3::text IS NULL OR action_type = $3)
                      AND ($4::text IS NULL OR user_id = $4)
                      AND ($5::timestamptz IS NULL OR occurred_at >= $5::timestamptz)
                      AND ($6::timestamptz IS NULL OR occurred_at <= $6::timestamptz)
                    ORDER BY occurred_at DESC, sequence DESC
                    LIMIT $7 OFFSET $8
                )",
                storeId, productId, action, filter.userId,
                pg::toSql(filter.from), pg::toSql(filter.to),
                limit, static_cast<int64_t>(std::max(filter.offset, 0)));
            t.commit();

            std::vector<domain::StockMovement> movements;
            for (const auto& row : r) {
                movements.push_back(rowToMovement(row));
            }
            return movements;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("select movements " + storeId);
        }
    }

    domain::StockMovement rowToMovement(const pqxx::row& row) const {
        domain::StockMovement m;
        m.id = row["id"].as<std::string>();
        m.storeId = row["store_id"].as<std::string>();
        m.productId = row["product_id"].as<std::string>();
        m.quantityBefore = row["quantity_before"].as<int64_t>();
        m.quantityAfter = row["quantity_after"].as<int64_t>();
        m.delta = row["delta"].as<int64_t>();
        m.actionType = domain::movementActionFromString(row["action_type"].as<std::string>());
        m.source = row["source"].as<std::string>();
        m.referenceId = pg::optionalTextField(row["reference_id"]);
        m.userId = pg::optionalTextField(row["user_id"]);
        m.notes = pg::optionalTextField(row["notes"]);
        m.metadata = nlohmann::json::parse(row["metadata"].as<std::string>());
        m.sequence = row["sequence"].as<int64_t>();
        m.occurredAt = pg::millisField(row["occurred_at_ms"]);
        return m;
    }

    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace inventory::adapters::secondary
