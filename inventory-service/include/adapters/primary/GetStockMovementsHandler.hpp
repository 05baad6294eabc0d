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
     * @brief GET /api/v1/stores/{storeId}/stock-movements
     *
     * Query: product_id, action, user_id, from, to, limit (1..200, по умолчанию 50), offset.
     */
    class GetStockMovementsHandler : public IHttpHandler
    {
    public:
        explicit GetStockMovementsHandler(std::shared_ptr<ports::input::IStockMovementLedger> ledger)
            : ledger_(std::move(ledger))
        {
            std::cout << "[GetStockMovementsHandler] Created" << std::endl;
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

                domain::MovementFilter filter;
                filter.productId = http::stringQueryParam(req, "product_id");
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

                auto movements = ledger_->queryByStore(storeId, filter);

                nlohmann::json response;
                response["store_id"] = storeId;
                response["movements"] = json::toJsonArray(movements);
                response["count"] = movements.size();
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetStockMovementsHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IStockMovementLedger> ledger_;
    };

} // namespace inventory::adapters::primary
