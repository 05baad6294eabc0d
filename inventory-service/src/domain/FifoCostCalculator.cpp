#include "domain/FifoCostCalculator.hpp"
#include "domain/errors/InventoryErrors.hpp"

#include <algorithm>

namespace inventory::domain {

CostConsumption FifoCostCalculator::preview(const std::vector<CostLayer>& layers,
                                            int64_t quantity,
                                            const FallbackCostProvider& fallback) {
    if (quantity <= 0) {
        throw ValidationError("Quantity to consume must be positive");
    }

    CostConsumption result;
    result.requestedQuantity = quantity;

    int64_t remaining = quantity;
    for (const auto& layer : layers) {
        if (remaining == 0) {
            break;
        }
        if (layer.quantityRemaining <= 0) {
            continue;
        }

        int64_t take = std::min(layer.quantityRemaining, remaining);
        Money cost = layer.unitCost * take;

        result.slices.push_back(LayerSlice{layer.id, take, layer.unitCost, cost});
        result.totalCost += cost;
        result.coveredByLayers += take;
        remaining -= take;
    }

    if (remaining > 0) {
        Money unitCost = fallback ? fallback() : Money();
        if (unitCost.isNegative()) {
            unitCost = Money();
        }
        result.shortfallQuantity = remaining;
        result.fallbackUnitCost = unitCost;
        result.totalCost += unitCost * remaining;
    }

    return result;
}

CostConsumption FifoCostCalculator::consume(std::vector<CostLayer>& layers,
                                            int64_t quantity,
                                            const FallbackCostProvider& fallback) {
    CostConsumption result = preview(layers, quantity, fallback);

    for (const auto& slice : result.slices) {
        auto it = std::find_if(layers.begin(), layers.end(),
                               [&slice](const CostLayer& l) { return l.id == slice.layerId; });
        if (it != layers.end()) {
            it->quantityRemaining -= slice.quantity;
        }
    }

    layers.erase(std::remove_if(layers.begin(), layers.end(),
                                [](const CostLayer& l) { return l.quantityRemaining <= 0; }),
                 layers.end());

    return result;
}

void FifoCostCalculator::sortFifo(std::vector<CostLayer>& layers) {
    std::stable_sort(layers.begin(), layers.end(), fifoBefore);
}

int64_t FifoCostCalculator::totalQuantity(const std::vector<CostLayer>& layers) {
    int64_t total = 0;
    for (const auto& layer : layers) {
        total += layer.quantityRemaining;
    }
    return total;
}

Money FifoCostCalculator::totalValue(const std::vector<CostLayer>& layers) {
    Money total;
    for (const auto& layer : layers) {
        total += layer.remainingValue();
    }
    return total;
}

} // namespace inventory::domain
