#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Магазин (внешний справочник)
 */
struct Store {
    std::string id;
    std::string orgId;
    std::string name;
    std::string currency = "USD";
};

} // namespace inventory::domain
