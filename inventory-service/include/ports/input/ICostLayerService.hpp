#pragma once

#include "domain/CostLayer.hpp"
#include "domain/InventoryResult.hpp"
#include "domain/Money.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Input Port: FIFO-слои себестоимости
 *
 * Запасная цена для недостачи слоёв: avgCost записи, если > 0,
 * иначе себестоимость из каталога, иначе 0.
 */
class ICostLayerService {
public:
    virtual ~ICostLayerService() = default;

    /**
     * @brief Создать слой; запись остатка не меняется
     * @throws domain::ValidationError при quantity <= 0 или unitCost < 0
     */
    virtual domain::CostLayer createLayer(const std::string& storeId,
                                          const std::string& productId,
                                          int64_t quantity,
                                          const domain::Money& unitCost,
                                          const std::string& source,
                                          const std::optional<std::string>& referenceId = std::nullopt,
                                          const std::optional<std::string>& notes = std::nullopt) = 0;

    /**
     * @brief Списать quantity единиц по FIFO; запись остатка не меняется
     */
    virtual domain::CostConsumption consume(const std::string& storeId,
                                            const std::string& productId,
                                            int64_t quantity) = 0;

    /**
     * @brief Оценка списания без изменений
     */
    virtual domain::CostConsumption preview(const std::string& storeId,
                                            const std::string& productId,
                                            int64_t quantity) = 0;

    /**
     * @brief Слои ключа, oldest first
     */
    virtual std::vector<domain::CostLayer> listLayers(const std::string& storeId,
                                                      const std::string& productId) = 0;

    /**
     * @brief Закрыть разрыв между остатком и слоями синтетическим слоем "backfill_legacy"
     * @return Созданный слой или std::nullopt, если разрыва нет
     */
    virtual std::optional<domain::CostLayer> backfillLegacyLayer(const std::string& storeId,
                                                                 const std::string& productId) = 0;
};

} // namespace inventory::ports::input
