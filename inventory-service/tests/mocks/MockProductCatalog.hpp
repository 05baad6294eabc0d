#pragma once

#include "ports/output/IProductCatalog.hpp"
#include <map>
#include <mutex>
#include <stdexcept>

namespace inventory::tests {

/**
 * @brief Mock реализация IProductCatalog для тестов
 */
class MockProductCatalog : public ports::output::IProductCatalog {
public:
    // Настройка ответов
    void addProduct(const std::string& id, double cost, std::optional<double> salePrice = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::Product product;
        product.id = id;
        product.name = "Product " + id;
        product.sku = "SKU-" + id;
        product.cost = domain::Money::fromDouble(cost);
        if (salePrice) {
            product.salePrice = domain::Money::fromDouble(*salePrice);
        }
        products_[id] = product;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    // Счётчики вызовов
    int findCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return findCallCount_;
    }

    int updatePricingCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return updatePricingCallCount_;
    }

    // IProductCatalog implementation
    std::optional<domain::Product> findById(const std::string& productId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++findCallCount_;
        if (failing_) {
            throw std::runtime_error("Catalog unavailable");
        }
        auto it = products_.find(productId);
        if (it == products_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool updatePricing(const std::string& productId,
                       const std::optional<domain::Money>& cost,
                       const std::optional<domain::Money>& salePrice) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++updatePricingCallCount_;
        if (failing_) {
            throw std::runtime_error("Catalog unavailable");
        }
        auto it = products_.find(productId);
        if (it == products_.end()) {
            return false;
        }
        if (cost) {
            it->second.cost = *cost;
        }
        if (salePrice) {
            it->second.salePrice = salePrice;
        }
        return true;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::Product> products_;
    bool failing_ = false;
    int findCallCount_ = 0;
    int updatePricingCallCount_ = 0;
};

} // namespace inventory::tests
