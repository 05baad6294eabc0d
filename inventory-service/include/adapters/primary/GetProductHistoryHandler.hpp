#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IStockMovementLedger.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/inventory/{productId}/history
     *
     * Query: action, user_id, from, to, limit, offset. Новые движения первыми.
     */
    class GetProductHistoryHandler : public IHttpHandler
    {
    public:
        explicit GetProductHistoryHandler(std::shared_ptr<ports::input::IStockMovementLedger> ledger)
            : ledger_(std::move(ledger))
        {
            std::cout << "[GetProductHistoryHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                std::string storeId = http::requirePathParam(req, 0, "Store ID");
                std::string productId = http::requirePathParam(req, 1, "Product ID");

                domain::MovementFilter filter;
                if (auto action = http::stringQueryParam(req, "action"))
                {
                    filter.actionType = domain::movementActionFromString(*action);
                }
                filter.userId = http::stringQueryParam(req, "user_id");
                filter.from = http::timestampQueryParam(req, "from");
                filter.to = http::timestampQueryParam(req, "to");
                if (auto limit = http::boundedIntQueryParam(req, "limit"))
                {
                    filter.limit = *limit;
                }
                filter.offset = http::boundedIntQueryParam(req, "offset").value_or(0);

                auto movements = ledger_->queryByProduct(storeId, productId, filter);

                nlohmann::json response;
                response["store_id"] = storeId;
                response["product_id"] = productId;
                response["movements"] = json::toJsonArray(movements);
                response["count"] = movements.size();
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetProductHistoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IStockMovementLedger> ledger_;
    };

} // namespace inventory::adapters::primary
