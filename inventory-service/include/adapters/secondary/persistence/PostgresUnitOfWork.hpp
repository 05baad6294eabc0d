#pragma once

#include "ports/output/IInventoryUnitOfWork.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "utils/UuidGenerator.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Единица работы PostgreSQL: своё соединение и одна транзакция
 *
 * Ключ захватывается pg_advisory_xact_lock(hashtext('store:product')) и
 * освобождается вместе с транзакцией. lock_timeout ограничивает ожидание
 * ключа, statement_timeout каждый запрос.
 */
class PostgresUnitOfWork : public ports::output::IInventoryUnitOfWork {
public:
    PostgresUnitOfWork(const std::string& connectionString,
                       domain::StockKey key,
                       std::chrono::milliseconds lockTimeout,
                       std::chrono::milliseconds statementTimeout)
        : key_(std::move(key))
    {
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            txn_ = std::make_unique<pqxx::work>(*connection_);

            txn_->exec("SET LOCAL lock_timeout = " + txn_->quote(std::to_string(lockTimeout.count()) + "ms"));
            txn_->exec("SET LOCAL statement_timeout = " + txn_->quote(std::to_string(statementTimeout.count()) + "ms"));
            txn_->exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", key_.toString());
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("begin " + key_.toString());
        }
    }

    ~PostgresUnitOfWork() override {
        if (txn_ && !finished_) {
            try {
                txn_->abort();
            } catch (const std::exception& e) {
                std::cerr << "[PostgresUnitOfWork] Rollback of " << key_.toString()
                          << " failed: " << e.what() << std::endl;
            }
        }
    }

    const domain::StockKey& key() const override { return key_; }

    // ============================================
    // ЗАПИСЬ ОСТАТКА
    // ============================================

    std::optional<domain::InventoryRecord> record() override {
        return run("record", [&] {
            auto result = txn_->exec_params(
                "SELECT " + pg::RECORD_COLUMNS + " FROM inventory_records "
                "WHERE store_id = $1 AND product_id = $2",
                key_.storeId, key_.productId);
            if (result.empty()) {
                return std::optional<domain::InventoryRecord>();
            }
            return std::optional(pg::recordFromRow(result[0]));
        });
    }

    void saveRecord(const domain::InventoryRecord& r) override {
        run("saveRecord", [&] {
            txn_->exec_params(
                R"(
                    INSERT INTO inventory_records (
                        id, store_id, product_id, quantity,
                        min_stock_level, max_stock_level, reorder_level,
                        avg_cost, total_cost_value, last_cost_update, created_at, updated_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8::numeric, $9::numeric,
                            $10::timestamptz, $11::timestamptz, $12::timestamptz)
                    ON CONFLICT (store_id, product_id) DO UPDATE SET
                        quantity = EXCLUDED.quantity,
                        min_stock_level = EXCLUDED.min_stock_level,
                        max_stock_level = EXCLUDED.max_stock_level,
                        reorder_level = EXCLUDED.reorder_level,
                        avg_cost = EXCLUDED.avg_cost,
                        total_cost_value = EXCLUDED.total_cost_value,
                        last_cost_update = EXCLUDED.last_cost_update,
                        updated_at = EXCLUDED.updated_at
                )",
                r.id, r.storeId, r.productId, r.quantity,
                r.minStockLevel, r.maxStockLevel, r.reorderLevel,
                pg::toSql(r.avgCost), pg::toSql(r.totalCostValue), pg::toSql(r.lastCostUpdate),
                pg::toSql(r.createdAt), pg::toSql(r.updatedAt));
            return 0;
        });
    }

    void deleteRecord() override {
        run("deleteRecord", [&] {
            txn_->exec_params(
                "DELETE FROM inventory_records WHERE store_id = $1 AND product_id = $2",
                key_.storeId, key_.productId);
            return 0;
        });
    }

    // ============================================
    // СЛОИ СЕБЕСТОИМОСТИ
    // ============================================

    std::vector<domain::CostLayer> layers() override {
        return run("layers", [&] {
            auto result = txn_->exec_params(
                "SELECT " + pg::LAYER_COLUMNS + " FROM cost_layers "
                "WHERE store_id = $1 AND product_id = $2 "
                "ORDER BY created_at ASC, sequence ASC",
                key_.storeId, key_.productId);

            std::vector<domain::CostLayer> layers;
            for (const auto& row : result) {
                layers.push_back(pg::layerFromRow(row));
            }
            return layers;
        });
    }

    domain::CostLayer insertLayer(const domain::CostLayer& layer) override {
        return run("insertLayer", [&] {
            auto result = txn_->exec_params(
                R"(
                    INSERT INTO cost_layers (
                        id, store_id, product_id, quantity_remaining, unit_cost,
                        source, reference_id, notes, created_at
                    )
                    VALUES ($1, $2, $3, $4, $5::numeric, $6, $7, $8, $9::timestamptz)
                    RETURNING sequence
                )",
                layer.id, layer.storeId, layer.productId, layer.quantityRemaining,
                pg::toSql(layer.unitCost), layer.source, layer.referenceId, layer.notes,
                pg::toSql(layer.createdAt));

            domain::CostLayer stored = layer;
            stored.sequence = result[0]["sequence"].as<int64_t>();
            return stored;
        });
    }

    void updateLayerQuantity(const std::string& layerId, int64_t quantityRemaining) override {
        run("updateLayerQuantity", [&] {
            txn_->exec_params(
                "UPDATE cost_layers SET quantity_remaining = $2 WHERE id = $1",
                layerId, quantityRemaining);
            return 0;
        });
    }

    void deleteLayer(const std::string& layerId) override {
        run("deleteLayer", [&] {
            txn_->exec_params("DELETE FROM cost_layers WHERE id = $1", layerId);
            return 0;
        });
    }

    // ============================================
    // АЛЕРТ
    // ============================================

    std::optional<domain::LowStockAlert> activeAlert() override {
        return run("activeAlert", [&] {
            auto result = txn_->exec_params(
                "SELECT " + pg::ALERT_COLUMNS + " FROM low_stock_alerts "
                "WHERE store_id = $1 AND product_id = $2 AND NOT is_resolved",
                key_.storeId, key_.productId);
            if (result.empty()) {
                return std::optional<domain::LowStockAlert>();
            }
            return std::optional(pg::alertFromRow(result[0]));
        });
    }

    void saveAlert(const domain::LowStockAlert& a) override {
        run("saveAlert", [&] {
            txn_->exec_params(
                R"(
                    INSERT INTO low_stock_alerts (
                        id, store_id, product_id, current_stock, min_stock_level, max_stock_level,
                        status, is_resolved, created_at, updated_at, resolved_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8,
                            $9::timestamptz, $10::timestamptz, $11::timestamptz)
                    ON CONFLICT (id) DO UPDATE SET
                        current_stock = EXCLUDED.current_stock,
                        min_stock_level = EXCLUDED.min_stock_level,
                        max_stock_level = EXCLUDED.max_stock_level,
                        status = EXCLUDED.status,
                        is_resolved = EXCLUDED.is_resolved,
                        updated_at = EXCLUDED.updated_at,
                        resolved_at = EXCLUDED.resolved_at
                )",
                a.id, a.storeId, a.productId, a.currentStock, a.minStockLevel, a.maxStockLevel,
                domain::toString(a.status), a.isResolved,
                pg::toSql(a.createdAt), pg::toSql(a.updatedAt), pg::toSql(a.resolvedAt));
            return 0;
        });
    }

    // ============================================
    // ЖУРНАЛЫ СТОИМОСТИ И OUTBOX
    // ============================================

    void appendPriceChange(const domain::PriceChangeEvent& e) override {
        run("appendPriceChange", [&] {
            txn_->exec_params(
                R"(
                    INSERT INTO price_change_events (
                        id, store_id, product_id, old_cost, new_cost, old_sale_price, new_sale_price,
                        source, reference_id, user_id, metadata, occurred_at
                    )
                    VALUES ($1, $2, $3, $4::numeric, $5::numeric, $6::numeric, $7::numeric,
                            $8, $9, $10, $11::jsonb, $12::timestamptz)
                )",
                e.id, e.storeId, e.productId,
                pg::toSql(e.oldCost), pg::toSql(e.newCost),
                pg::toSql(e.oldSalePrice), pg::toSql(e.newSalePrice),
                e.source, e.referenceId, e.userId, e.metadata.dump(), pg::toSql(e.occurredAt));
            return 0;
        });
    }

    void appendRevaluation(const domain::InventoryRevaluationEvent& e) override {
        run("appendRevaluation", [&] {
            txn_->exec_params(
                R"(
                    INSERT INTO inventory_revaluation_events (
                        id, store_id, product_id, source, reference_id, user_id,
                        quantity_before, quantity_after, revalued_quantity,
                        avg_cost_before, avg_cost_after, total_cost_before, total_cost_after,
                        delta_value, metadata, occurred_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9,
                            $10::numeric, $11::numeric, $12::numeric, $13::numeric,
                            $14::numeric, $15::jsonb, $16::timestamptz)
                )",
                e.id, e.storeId, e.productId, e.source, e.referenceId, e.userId,
                e.quantityBefore, e.quantityAfter, e.revaluedQuantity,
                pg::toSql(e.avgCostBefore), pg::toSql(e.avgCostAfter),
                pg::toSql(e.totalCostBefore), pg::toSql(e.totalCostAfter),
                pg::toSql(e.deltaValue), e.metadata.dump(), pg::toSql(e.occurredAt));
            return 0;
        });
    }

    void enqueueNotification(const domain::DomainEvent& event) override {
        run("enqueueNotification", [&] {
            txn_->exec_params(
                R"(
                    INSERT INTO notification_outbox (id, event_type, payload, store_id, product_id, created_at)
                    VALUES ($1, $2, $3, $4, $5, NOW())
                )",
                utils::UuidGenerator::generate(), event.eventType, event.toJson(),
                key_.storeId, key_.productId);
            return 0;
        });
    }

    // ============================================
    // ЗАВЕРШЕНИЕ
    // ============================================

    void commit() override {
        run("commit", [&] {
            txn_->commit();
            return 0;
        });
        finished_ = true;
    }

    void rollback() override {
        if (finished_) {
            return;
        }
        finished_ = true;
        try {
            txn_->abort();
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("rollback " + key_.toString());
        }
    }

private:
    template <typename Fn>
    auto run(const char* operation, Fn&& fn) -> decltype(fn()) {
        if (finished_) {
            throw std::logic_error("Unit of work for " + key_.toString() + " is already finished");
        }
        try {
            return fn();
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError(std::string(operation) + " " + key_.toString());
        }
    }

    domain::StockKey key_;
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> txn_;
    bool finished_ = false;
};

} // namespace inventory::adapters::secondary
