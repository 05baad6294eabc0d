#pragma once

#include "domain/Money.hpp"
#include "domain/Product.hpp"
#include <optional>
#include <string>

namespace inventory::ports::output {

/**
 * @brief Каталог товаров (внешний)
 *
 * Источник запасной себестоимости и приёмник новых цен.
 */
class IProductCatalog {
public:
    virtual ~IProductCatalog() = default;

    virtual std::optional<domain::Product> findById(const std::string& productId) = 0;

    /**
     * @brief Обновить себестоимость и/или цену продажи
     * @return false если товар не найден
     */
    virtual bool updatePricing(const std::string& productId,
                               const std::optional<domain::Money>& cost,
                               const std::optional<domain::Money>& salePrice) = 0;
};

} // namespace inventory::ports::output
