#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "ports/output/IValuationEventRepository.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"
#include "settings/DbSettings.hpp"
#include "settings/InventorySettings.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL хранилище остатков, слоёв, алертов, журналов стоимости и outbox
 *
 * Изменения идут через PostgresUnitOfWork; чтения открывают короткое
 * соединение на вызов. Схема: sql/schema.sql.
 */
class PostgresInventoryStore : public ports::output::IInventoryStore,
                               public ports::output::IValuationEventRepository,
                               public ports::output::INotificationOutbox {
public:
    PostgresInventoryStore(std::shared_ptr<settings::DbSettings> dbSettings,
                           std::shared_ptr<settings::InventorySettings> inventorySettings)
        : dbSettings_(std::move(dbSettings))
        , inventorySettings_(std::move(inventorySettings))
    {
        // Проверяем соединение, схему не создаём
        try {
            pqxx::connection c(dbSettings_->getConnectionString());
            std::cout << "[PostgresInventoryStore] Connected to " << dbSettings_->getName() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryStore] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    // ============================================
    // IInventoryStore
    // ============================================

    std::unique_ptr<ports::output::IInventoryUnitOfWork> begin(
        const domain::StockKey& key,
        std::chrono::milliseconds timeout) override
    {
        return std::make_unique<PostgresUnitOfWork>(
            dbSettings_->getConnectionString(), key, timeout,
            std::max(timeout, inventorySettings_->getStatementTimeout()));
    }

    std::optional<domain::InventoryRecord> findRecord(const domain::StockKey& key) override {
        return query("findRecord", [&](pqxx::work& t) {
            auto r = t.exec_params(
                "SELECT " + pg::RECORD_COLUMNS + " FROM inventory_records "
                "WHERE store_id = $1 AND product_id = $2",
                key.storeId, key.productId);
            if (r.empty()) {
                return std::optional<domain::InventoryRecord>();
            }
            return std::optional(pg::recordFromRow(r[0]));
        });
    }

    std::vector<domain::InventoryRecord> findRecordsByStore(const std::string& storeId) override {
        return query("findRecordsByStore", [&](pqxx::work& t) {
            auto r = t.exec_params(
                "SELECT " + pg::RECORD_COLUMNS + " FROM inventory_records "
                "WHERE store_id = $1 ORDER BY product_id",
                storeId);
            std::vector<domain::InventoryRecord> records;
            for (const auto& row : r) {
                records.push_back(pg::recordFromRow(row));
            }
            return records;
        });
    }

    std::vector<domain::CostLayer> findLayers(const domain::StockKey& key) override {
        return query("findLayers", [&](pqxx::work& t) {
            auto r = t.exec_params(
                "SELECT " + pg::LAYER_COLUMNS + " FROM cost_layers "
                "WHERE store_id = $1 AND product_id = $2 "
                "ORDER BY created_at ASC, sequence ASC",
                key.storeId, key.productId);
            std::vector<domain::CostLayer> layers;
            for (const auto& row : r) {
                layers.push_back(pg::layerFromRow(row));
            }
            return layers;
        });
    }

    std::optional<domain::LowStockAlert> findActiveAlert(const domain::StockKey& key) override {
        return query("findActiveAlert", [&](pqxx::work& t) {
            auto r = t.exec_params(
                "SELECT " + pg::ALERT_COLUMNS + " FROM low_stock_alerts "
                "WHERE store_id = $1 AND product_id = $2 AND NOT is_resolved",
                key.storeId, key.productId);
            if (r.empty()) {
                return std::optional<domain::LowStockAlert>();
            }
            return std::optional(pg::alertFromRow(r[0]));
        });
    }

    std::vector<domain::LowStockAlert> findActiveAlertsByStore(const std::string& storeId) override {
        return query("findActiveAlertsByStore", [&](pqxx::work& t) {
            auto r = t.exec_params(
                "SELECT " + pg::ALERT_COLUMNS + " FROM low_stock_alerts "
                "WHERE store_id = $1 AND NOT is_resolved ORDER BY created_at DESC",
                storeId);
            std::vector<domain::LowStockAlert> alerts;
            for (const auto& row : r) {
                alerts.push_back(pg::alertFromRow(row));
            }
            return alerts;
        });
    }

    std::optional<domain::LowStockAlert> findAlertById(const std::string& alertId) override {
        return query("findAlertById", [&](pqxx::work& t) -> std::optional<domain::LowStockAlert> {
            auto r = t.exec_params(
                "SELECT " + pg::ALERT_COLUMNS + " FROM low_stock_alerts WHERE id = $1",
                alertId);
            if (r.empty()) {
                return std::nullopt;
            }
            return pg::alertFromRow(r[0]);
        });
    }

    // ============================================
    // IValuationEventRepository
    // ============================================

    std::vector<domain::PriceChangeEvent> findPriceChanges(
        const std::string& storeId,
        const std::optional<std::string>& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) override
    {
        return query("findPriceChanges", [&](pqxx::work& t) {
            auto r = t.exec_params(
                R"(
                    SELECT id, store_id, product_id,
                           old_cost::text AS old_cost, new_cost::text AS new_cost,
                           old_sale_price::text AS old_sale_price, new_sale_price::text AS new_sale_price,
                           source, reference_id, user_id, metadata::text AS metadata,
                           (extract(epoch from occurred_at) * 1000)::bigint AS occurred_at_ms
                    FROM price_change_events
                    WHERE store_id = $1
                      AND ($2::text IS NULL OR product_id = $2)
                      AND ($3::timestamptz IS NULL OR occurred_at >= $3::timestamptz)
                      AND ($4::timestamptz IS NULL OR occurred_at < $4::timestamptz)
                    ORDER BY occurred_at ASC
                )",
                storeId, productId, pg::toSql(from), pg::toSql(to));

            std::vector<domain::PriceChangeEvent> events;
            for (const auto& row : r) {
                domain::PriceChangeEvent e;
                e.id = row["id"].as<std::string>();
                e.storeId = row["store_id"].as<std::string>();
                e.productId = row["product_id"].as<std::string>();
                e.oldCost = pg::optionalMoneyField(row["old_cost"]);
                e.newCost = pg::optionalMoneyField(row["new_cost"]);
                e.oldSalePrice = pg::optionalMoneyField(row["old_sale_price"]);
                e.newSalePrice = pg::optionalMoneyField(row["new_sale_price"]);
                e.source = row["source"].as<std::string>();
                e.referenceId = pg::optionalTextField(row["reference_id"]);
                e.userId = pg::optionalTextField(row["user_id"]);
                e.metadata = nlohmann::json::parse(row["metadata"].as<std::string>());
                e.occurredAt = pg::millisField(row["occurred_at_ms"]);
                events.push_back(std::move(e));
            }
            return events;
        });
    }

    std::vector<domain::InventoryRevaluationEvent> findRevaluations(
        const std::string& storeId,
        const std::optional<std::string>& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) override
    {
        return query("findRevaluations", [&](pqxx::work& t) {
            auto r = t.exec_params(
                R"(
                    SELECT id, store_id, product_id, source, reference_id, user_id,
                           quantity_before, quantity_after, revalued_quantity,
                           avg_cost_before::text AS avg_cost_before, avg_cost_after::text AS avg_cost_after,
                           total_cost_before::text AS total_cost_before, total_cost_after::text AS total_cost_after,
                           delta_value::text AS delta_value, metadata::text AS metadata,
                           (extract(epoch from occurred_at) * 1000)::bigint AS occurred_at_ms
                    FROM inventory_revaluation_events
                    WHERE store_id = $1
                      AND ($2::text IS NULL OR product_id = $2)
                      AND ($3::timestamptz IS NULL OR occurred_at >= $3::timestamptz)
                      AND ($4::timestamptz IS NULL OR occurred_at < $4::timestamptz)
                    ORDER BY occurred_at ASC
                )",
                storeId, productId, pg::toSql(from), pg::toSql(to));

            std::vector<domain::InventoryRevaluationEvent> events;
            for (const auto& row : r) {
                domain::InventoryRevaluationEvent e;
                e.id = row["id"].as<std::string>();
                e.storeId = row["store_id"].as<std::string>();
                e.productId = row["product_id"].as<std::string>();
                e.source = row["source"].as<std::string>();
                e.referenceId = pg::optionalTextField(row["reference_id"]);
                e.userId = pg::optionalTextField(row["user_id"]);
                e.quantityBefore = row["quantity_before"].as<int64_t>();
                e.quantityAfter = row["quantity_after"].as<int64_t>();
                e.revaluedQuantity = row["revalued_quantity"].as<int64_t>();
                e.avgCostBefore = pg::moneyField(row["avg_cost_before"]);
                e.avgCostAfter = pg::moneyField(row["avg_cost_after"]);
                e.totalCostBefore = pg::moneyField(row["total_cost_before"]);
                e.totalCostAfter = pg::moneyField(row["total_cost_after"]);
                e.deltaValue = pg::moneyField(row["delta_value"]);
                e.metadata = nlohmann::json::parse(row["metadata"].as<std::string>());
                e.occurredAt = pg::millisField(row["occurred_at_ms"]);
                events.push_back(std::move(e));
            }
            return events;
        });
    }

    // ============================================
    // INotificationOutbox
    // ============================================

    std::vector<domain::OutboxMessage> fetchPending(size_t limit) override {
        return query("fetchPending", [&](pqxx::work& t) {
            auto r = t.exec_params(
                R"(
                    SELECT id, event_type, payload, store_id, product_id, attempts, last_error,
                           (extract(epoch from created_at) * 1000)::bigint AS created_at_ms
                    FROM notification_outbox
                    WHERE status = 'pending'
                    ORDER BY created_at ASC, sequence ASC
                    LIMIT $1
                )",
                static_cast<int64_t>(limit));

            std::vector<domain::OutboxMessage> messages;
            for (const auto& row : r) {
                domain::OutboxMessage m;
                m.id = row["id"].as<std::string>();
                m.eventType = row["event_type"].as<std::string>();
                m.payload = row["payload"].as<std::string>();
                m.storeId = row["store_id"].as<std::string>();
                m.productId = row["product_id"].as<std::string>();
                m.attempts = row["attempts"].as<int>();
                m.lastError = pg::optionalTextField(row["last_error"]);
                m.createdAt = pg::millisField(row["created_at_ms"]);
                messages.push_back(std::move(m));
            }
            return messages;
        });
    }

    void markDelivered(const std::string& messageId) override {
        query("markDelivered", [&](pqxx::work& t) {
            t.exec_params(
                "UPDATE notification_outbox SET status = 'delivered', delivered_at = NOW() WHERE id = $1",
                messageId);
            return 0;
        });
    }

    bool markFailed(const std::string& messageId,
                    const std::string& error,
                    int maxAttempts) override
    {
        return query("markFailed", [&](pqxx::work& t) {
            auto r = t.exec_params(
                R"(
                    UPDATE notification_outbox SET
                        attempts = attempts + 1,
                        last_error = $2,
                        status = CASE WHEN attempts + 1 >= $3 THEN 'dead' ELSE 'pending' END
                    WHERE id = $1
                    RETURNING status
                )",
                messageId, error, maxAttempts);
            return !r.empty() && r[0]["status"].as<std::string>() == "dead";
        });
    }

    size_t pendingCount() override {
        return query("pendingCount", [&](pqxx::work& t) {
            auto r = t.exec("SELECT COUNT(*) FROM notification_outbox WHERE status = 'pending'");
            return static_cast<size_t>(r[0][0].as<int64_t>());
        });
    }

private:
    /**
     * @brief Выполнить fn в короткой транзакции на своём соединении
     */
    template <typename Fn>
    auto query(const char* operation, Fn&& fn) -> decltype(fn(std::declval<pqxx::work&>())) {
        try {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);
            t.exec("SET LOCAL statement_timeout = "
                   + t.quote(std::to_string(inventorySettings_->getStatementTimeout().count()) + "ms"));
            auto result = fn(t);
            t.commit();
            return result;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError(operation);
        }
    }

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::InventorySettings> inventorySettings_;
};

} // namespace inventory::adapters::secondary
