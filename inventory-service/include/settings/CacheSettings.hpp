#pragma once

#include <cstdlib>
#include <string>

namespace inventory::settings {

/**
 * @brief Настройки кэша каталога товаров
 *
 * Читает из ENV:
 * - CACHE_PRODUCT_SIZE (default: 5000)
 * - CACHE_PRODUCT_TTL_SECONDS (default: 300)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_PRODUCT_SIZE")) {
            productCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_PRODUCT_TTL_SECONDS")) {
            productTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getProductCacheSize() const { return productCacheSize_; }
    int getProductTtlSeconds() const { return productTtlSeconds_; }

    void setProductCacheSize(size_t size) { productCacheSize_ = size; }
    void setProductTtlSeconds(int seconds) { productTtlSeconds_ = seconds; }

private:
    size_t productCacheSize_ = 5000;
    int productTtlSeconds_ = 300;
};

} // namespace inventory::settings
