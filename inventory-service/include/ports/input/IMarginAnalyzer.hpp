#pragma once

#include "domain/MarginAnalysis.hpp"
#include "domain/Money.hpp"
#include <string>

namespace inventory::ports::input {

/**
 * @brief Input Port: анализ маржи по слоям при предлагаемой цене
 */
class IMarginAnalyzer {
public:
    virtual ~IMarginAnalyzer() = default;

    /**
     * @throws domain::ValidationError при отрицательной цене
     */
    virtual domain::MarginAnalysis analyzeMargin(const std::string& storeId,
                                                 const std::string& productId,
                                                 const domain::Money& proposedSalePrice) = 0;
};

} // namespace inventory::ports::input
