#pragma once

#include "ports/output/IStoreDirectory.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Справочник магазинов из общей БД кассы (только чтение)
 */
class PostgresStoreDirectory : public ports::output::IStoreDirectory {
public:
    explicit PostgresStoreDirectory(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresStoreDirectory] Connected to " << settings_->getName() << std::endl;
    }

    std::optional<domain::Store> findById(const std::string& storeId) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT id, org_id, name, currency FROM stores WHERE id = $1",
                storeId);
            t.commit();

            if (r.empty()) {
                return std::nullopt;
            }
            return rowToStore(r[0]);
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("find store " + storeId);
        }
    }

    std::vector<domain::Store> findByOrg(const std::string& orgId) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT id, org_id, name, currency FROM stores WHERE org_id = $1 ORDER BY id",
                orgId);
            t.commit();

            std::vector<domain::Store> stores;
            for (const auto& row : r) {
                stores.push_back(rowToStore(row));
            }
            return stores;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("find stores of org " + orgId);
        }
    }

private:
    domain::Store rowToStore(const pqxx::row& row) const {
        domain::Store store;
        store.id = row["id"].as<std::string>();
        store.orgId = row["org_id"].as<std::string>();
        store.name = row["name"].as<std::string>();
        if (!row["currency"].is_null()) {
            store.currency = row["currency"].as<std::string>();
        }
        return store;
    }

    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace inventory::adapters::secondary
