#pragma once

#include "domain/CostLayer.hpp"
#include "domain/InventoryRecord.hpp"
#include "domain/LowStockAlert.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <optional>
#include <string>

namespace inventory::adapters::secondary::pg {

// ============================================
// ОШИБКИ
// ============================================

/**
 * @brief SQLSTATE, после которых операцию можно повторить
 *
 * 55P03 lock_not_available, 57014 query_canceled (statement_timeout),
 * 40001 serialization_failure, 40P01 deadlock_detected.
 */
inline bool isRetryableSqlState(const std::string& sqlState) {
    return sqlState == "55P03" || sqlState == "57014"
        || sqlState == "40001" || sqlState == "40P01";
}

/**
 * @brief Перебросить текущее исключение libpqxx как доменную ошибку
 *
 * Вызывать только внутри catch. Таймауты, ожидание блокировки и обрыв
 * соединения становятся RetryableStorageError, остальное уходит как есть.
 */
[[noreturn]] inline void rethrowStorageError(const std::string& context) {
    try {
        throw;
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[Postgres] " << context << ": connection lost: " << e.what() << std::endl;
        throw domain::RetryableStorageError(context + ": connection lost: " + e.what());
    } catch (const pqxx::sql_error& e) {
        if (isRetryableSqlState(e.sqlstate())) {
            std::cerr << "[Postgres] " << context << ": SQLSTATE " << e.sqlstate()
                      << ": " << e.what() << std::endl;
            throw domain::RetryableStorageError(context + ": " + e.what());
        }
        std::cerr << "[Postgres] " << context << " failed: " << e.what() << std::endl;
        throw;
    }
}

// ============================================
// КОНВЕРТЕРЫ
// ============================================

inline std::string toSql(const domain::Money& money) {
    return money.toString(4);
}

inline std::optional<std::string> toSql(const std::optional<domain::Money>& money) {
    return money ? std::optional<std::string>(money->toString(4)) : std::nullopt;
}

inline std::string toSql(const domain::Timestamp& ts) {
    return ts.toString();
}

inline std::optional<std::string> toSql(const std::optional<domain::Timestamp>& ts) {
    return ts ? std::optional<std::string>(ts->toString()) : std::nullopt;
}

inline domain::Money moneyField(const pqxx::field& field) {
    return domain::Money::fromString(field.as<std::string>());
}

inline std::optional<domain::Money> optionalMoneyField(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return moneyField(field);
}

/**
 * @brief Метка из колонки миллисекунд (extract(epoch ...) * 1000)
 */
inline domain::Timestamp millisField(const pqxx::field& field) {
    return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
}

inline std::optional<domain::Timestamp> optionalMillisField(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return millisField(field);
}

inline std::optional<int64_t> optionalIntField(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<int64_t>();
}

inline std::optional<std::string> optionalTextField(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

/// Колонка timestamptz как миллисекунды Unix
inline std::string millisColumn(const std::string& column) {
    return "(extract(epoch from " + column + ") * 1000)::bigint AS " + column + "_ms";
}

// ============================================
// СТРОКИ -> ДОМЕН
// ============================================

inline const std::string RECORD_COLUMNS =
    "id, store_id, product_id, quantity, min_stock_level, max_stock_level, reorder_level, "
    "avg_cost::text AS avg_cost, total_cost_value::text AS total_cost_value, "
    + millisColumn("last_cost_update") + ", " + millisColumn("created_at") + ", "
    + millisColumn("updated_at");

inline const std::string LAYER_COLUMNS =
    "id, store_id, product_id, quantity_remaining, unit_cost::text AS unit_cost, source, "
    "reference_id, notes, sequence, " + millisColumn("created_at");

inline const std::string ALERT_COLUMNS =
    "id, store_id, product_id, current_stock, min_stock_level, max_stock_level, status, "
    "is_resolved, " + millisColumn("created_at") + ", " + millisColumn("updated_at") + ", "
    + millisColumn("resolved_at");

inline domain::InventoryRecord recordFromRow(const pqxx::row& row) {
    domain::InventoryRecord record;
    record.id = row["id"].as<std::string>();
    record.storeId = row["store_id"].as<std::string>();
    record.productId = row["product_id"].as<std::string>();
    record.quantity = row["quantity"].as<int64_t>();
    record.minStockLevel = optionalIntField(row["min_stock_level"]);
    record.maxStockLevel = optionalIntField(row["max_stock_level"]);
    record.reorderLevel = optionalIntField(row["reorder_level"]);
    record.avgCost = moneyField(row["avg_cost"]);
    record.totalCostValue = moneyField(row["total_cost_value"]);
    record.lastCostUpdate = optionalMillisField(row["last_cost_update_ms"]);
    record.createdAt = millisField(row["created_at_ms"]);
    record.updatedAt = millisField(row["updated_at_ms"]);
    return record;
}

inline domain::CostLayer layerFromRow(const pqxx::row& row) {
    domain::CostLayer layer;
    layer.id = row["id"].as<std::string>();
    layer.storeId = row["store_id"].as<std::string>();
    layer.productId = row["product_id"].as<std::string>();
    layer.quantityRemaining = row["quantity_remaining"].as<int64_t>();
    layer.unitCost = moneyField(row["unit_cost"]);
    layer.source = row["source"].as<std::string>();
    layer.referenceId = optionalTextField(row["reference_id"]);
    layer.notes = optionalTextField(row["notes"]);
    layer.sequence = row["sequence"].as<int64_t>();
    layer.createdAt = millisField(row["created_at_ms"]);
    return layer;
}

inline domain::LowStockAlert alertFromRow(const pqxx::row& row) {
    domain::LowStockAlert alert;
    alert.id = row["id"].as<std::string>();
    alert.storeId = row["store_id"].as<std::string>();
    alert.productId = row["product_id"].as<std::string>();
    alert.currentStock = row["current_stock"].as<int64_t>();
    alert.minStockLevel = optionalIntField(row["min_stock_level"]);
    alert.maxStockLevel = optionalIntField(row["max_stock_level"]);
    alert.status = domain::alertStatusFromString(row["status"].as<std::string>());
    alert.isResolved = row["is_resolved"].as<bool>();
    alert.createdAt = millisField(row["created_at_ms"]);
    alert.updatedAt = millisField(row["updated_at_ms"]);
    alert.resolvedAt = optionalMillisField(row["resolved_at_ms"]);
    return alert;
}

} // namespace inventory::adapters::secondary::pg
