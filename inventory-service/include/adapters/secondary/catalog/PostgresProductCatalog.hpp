#pragma once

#include "ports/output/IProductCatalog.hpp"
#include "adapters/secondary/persistence/PostgresSupport.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Каталог товаров из общей БД кассы
 *
 * Таблица products принадлежит каталогу; отсюда меняются только
 * cost и sale_price.
 */
class PostgresProductCatalog : public ports::output::IProductCatalog {
public:
    explicit PostgresProductCatalog(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresProductCatalog] Connected to " << settings_->getName() << std::endl;
    }

    std::optional<domain::Product> findById(const std::string& productId) override {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT id, name, sku, cost::text AS cost, sale_price::text AS sale_price "
                "FROM products WHERE id = $1",
                productId);
            t.commit();

            if (r.empty()) {
                return std::nullopt;
            }

            domain::Product product;
            product.id = r[0]["id"].as<std::string>();
            product.name = r[0]["name"].as<std::string>();
            product.sku = r[0]["sku"].is_null() ? "" : r[0]["sku"].as<std::string>();
            product.cost = r[0]["cost"].is_null() ? domain::Money() : pg::moneyField(r[0]["cost"]);
            product.salePrice = pg::optionalMoneyField(r[0]["sale_price"]);
            return product;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("find product " + productId);
        }
    }

    bool updatePricing(const std::string& productId,
                       const std::optional<domain::Money>& cost,
                       const std::optional<domain::Money>& salePrice) override
    {
        try {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                R"(
                    UPDATE products SET
                        cost = COALESCE($2::numeric, cost),
                        sale_price = COALESCE($3::numeric, sale_price),
                        updated_at = NOW()
                    WHERE id = $1
                )",
                productId, pg::toSql(cost), pg::toSql(salePrice));
            t.commit();

            std::cout << "[PostgresProductCatalog] Pricing updated: " << productId << std::endl;
            return r.affected_rows() > 0;
        } catch (const pqxx::failure&) {
            pg::rethrowStorageError("update pricing " + productId);
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace inventory::adapters::secondary
