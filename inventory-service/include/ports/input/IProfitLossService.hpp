#pragma once

#include "domain/ProfitLossResult.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace inventory::ports::input {

/**
 * @brief Input Port: прибыль и убыток за период
 */
class IProfitLossService {
public:
    virtual ~IProfitLossService() = default;

    /**
     * @brief Окно [start, end)
     * @throws domain::ValidationError если start >= end
     */
    virtual domain::ProfitLossResult getProfitLoss(const std::string& storeId,
                                                   const domain::Timestamp& start,
                                                   const domain::Timestamp& end) = 0;
};

} // namespace inventory::ports::input
