#pragma once

#include <functional>
#include <string>

namespace inventory::domain {

/**
 * @brief Ключ остатка: (магазин, товар)
 *
 * Все изменения по одному ключу сериализуются.
 */
struct StockKey {
    std::string storeId;
    std::string productId;

    std::string toString() const {
        return storeId + ":" + productId;
    }

    bool operator==(const StockKey& other) const {
        return storeId == other.storeId && productId == other.productId;
    }

    bool operator!=(const StockKey& other) const {
        return !(*this == other);
    }
};

} // namespace inventory::domain

template <>
struct std::hash<inventory::domain::StockKey> {
    size_t operator()(const inventory::domain::StockKey& key) const noexcept {
        size_t h1 = std::hash<std::string>{}(key.storeId);
        size_t h2 = std::hash<std::string>{}(key.productId);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
