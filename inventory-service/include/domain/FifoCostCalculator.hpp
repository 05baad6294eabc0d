#pragma once

#include "domain/CostLayer.hpp"
#include "domain/InventoryResult.hpp"
#include "domain/Money.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace inventory::domain {

/**
 * @brief Запасная цена единицы для количества, не покрытого слоями.
 *
 * Вызывается лениво, только если слоёв не хватило.
 */
using FallbackCostProvider = std::function<Money()>;

/**
 * @brief FIFO-алгоритм списания слоёв себестоимости
 *
 * Чистые функции над упорядоченным (oldest first) набором слоёв одного ключа.
 * Доступ к ключу сериализует вызывающий (единица работы).
 */
class FifoCostCalculator {
public:
    /**
     * @brief Оценить списание quantity единиц, не меняя слои
     *
     * @param layers Слои в FIFO-порядке
     * @param quantity Сколько списать (> 0)
     * @param fallback Цена единицы для недостачи слоёв
     * @throws ValidationError при quantity <= 0
     */
    static CostConsumption preview(const std::vector<CostLayer>& layers,
                                   int64_t quantity,
                                   const FallbackCostProvider& fallback);

    /**
     * @brief Списать quantity единиц: уменьшает слои, удаляет опустевшие
     *
     * Результат тот же, что у preview() над исходными слоями.
     */
    static CostConsumption consume(std::vector<CostLayer>& layers,
                                   int64_t quantity,
                                   const FallbackCostProvider& fallback);

    /**
     * @brief Отсортировать слои в FIFO-порядке
     */
    static void sortFifo(std::vector<CostLayer>& layers);

    static int64_t totalQuantity(const std::vector<CostLayer>& layers);

    static Money totalValue(const std::vector<CostLayer>& layers);
};

} // namespace inventory::domain
