#pragma once

#include "domain/Money.hpp"
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Карточка товара из каталога (внешний источник)
 */
struct Product {
    std::string id;
    std::string name;
    std::string sku;
    Money cost;                      ///< себестоимость по каталогу, запасной источник цены
    std::optional<Money> salePrice;
};

} // namespace inventory::domain
