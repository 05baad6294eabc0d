#pragma once

#include "ports/output/IProductCatalog.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief Декоратор IProductCatalog с LRU + TTL кэшированием карточек
 *
 * Кэшируются только найденные товары. updatePricing() всегда идёт
 * в делегат и сбрасывает запись товара в кэше.
 */
class CachedProductCatalog : public ports::output::IProductCatalog {
public:
    CachedProductCatalog(
        std::shared_ptr<ports::output::IProductCatalog> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    std::optional<domain::Product> findById(const std::string& productId) override {
        auto cached = productCache_->get(productId);
        if (cached) {
            return *cached;
        }

        auto product = delegate_->findById(productId);
        if (product) {
            productCache_->put(productId, *product);
        }
        return product;
    }

    bool updatePricing(const std::string& productId,
                       const std::optional<domain::Money>& cost,
                       const std::optional<domain::Money>& salePrice) override
    {
        bool updated = delegate_->updatePricing(productId, cost, salePrice);
        productCache_->remove(productId);
        return updated;
    }

    // ============================================
    // УПРАВЛЕНИЕ КЭШЕМ
    // ============================================

    void clearCache() {
        productCache_->clear();
    }

    size_t getCacheSize() const {
        return productCache_->size();
    }

private:
    void initCache() {
        size_t cacheSize = cacheSettings_->getProductCacheSize();
        int ttlSeconds = cacheSettings_->getProductTtlSeconds();

        // productId -> Product
        auto base = std::make_unique<Cache<std::string, domain::Product>>(
            cacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        productCache_ = std::make_unique<ThreadSafeCache<std::string, domain::Product>>(
            std::move(base)
        );

        std::cout << "[CachedProductCatalog] Created with productCache="
                  << cacheSize << "/" << ttlSeconds << "s" << std::endl;
    }

    std::shared_ptr<ports::output::IProductCatalog> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ICache<std::string, domain::Product>> productCache_;
};

} // namespace inventory::adapters::secondary
