#pragma once

#include "ports/output/IProductCatalog.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory каталог товаров
 *
 * Значения неизменяемы: updatePricing() кладёт новую копию карточки.
 */
class InMemoryProductCatalog : public ports::output::IProductCatalog {
public:
    InMemoryProductCatalog() {
        std::cout << "[InMemoryProductCatalog] Created" << std::endl;
    }

    std::optional<domain::Product> findById(const std::string& productId) override {
        auto product = products_.find(productId);
        if (!product) {
            return std::nullopt;
        }
        return std::optional(*product);
    }

    bool updatePricing(const std::string& productId,
                       const std::optional<domain::Money>& cost,
                       const std::optional<domain::Money>& salePrice) override
    {
        auto existing = products_.find(productId);
        if (!existing) {
            return false;
        }

        auto updated = std::make_shared<domain::Product>(*existing);
        if (cost) {
            updated->cost = *cost;
        }
        if (salePrice) {
            updated->salePrice = *salePrice;
        }
        products_.insert(productId, updated);
        return true;
    }

    /**
     * @brief Добавить или заменить карточку
     */
    void save(const domain::Product& product) {
        products_.insert(product.id, std::make_shared<domain::Product>(product));
    }

    size_t size() const {
        return products_.size();
    }

private:
    ThreadSafeMap<std::string, domain::Product> products_;
};

} // namespace inventory::adapters::secondary
