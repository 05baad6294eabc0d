#pragma once

#include "domain/Store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Справочник магазинов (внешний)
 */
class IStoreDirectory {
public:
    virtual ~IStoreDirectory() = default;

    virtual std::optional<domain::Store> findById(const std::string& storeId) = 0;

    virtual std::vector<domain::Store> findByOrg(const std::string& orgId) = 0;
};

} // namespace inventory::ports::output
