#pragma once

#include "ports/output/IStoreDirectory.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory справочник магазинов
 */
class InMemoryStoreDirectory : public ports::output::IStoreDirectory {
public:
    InMemoryStoreDirectory() {
        std::cout << "[InMemoryStoreDirectory] Created" << std::endl;
    }

    std::optional<domain::Store> findById(const std::string& storeId) override {
        auto store = stores_.find(storeId);
        if (!store) {
            return std::nullopt;
        }
        return std::optional(*store);
    }

    std::vector<domain::Store> findByOrg(const std::string& orgId) override {
        std::vector<domain::Store> result;
        for (const auto& store : stores_.getAll()) {
            if (store->orgId == orgId) {
                result.push_back(*store);
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::Store& a, const domain::Store& b) { return a.id < b.id; });
        return result;
    }

    void save(const domain::Store& store) {
        stores_.insert(store.id, std::make_shared<domain::Store>(store));
    }

private:
    ThreadSafeMap<std::string, domain::Store> stores_;
};

} // namespace inventory::adapters::secondary
