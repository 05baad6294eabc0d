#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IInventoryQueryService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/inventory/{productId}/price-history?from=&to=
     */
    class GetPriceHistoryHandler : public IHttpHandler
    {
    public:
        explicit GetPriceHistoryHandler(std::shared_ptr<ports::input::IInventoryQueryService> queryService)
            : queryService_(std::move(queryService))
        {
            std::cout << "[GetPriceHistoryHandler] Created" << std::endl;
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

                auto history = queryService_->getPriceHistory(
                    storeId, productId,
                    http::timestampQueryParam(req, "from"),
                    http::timestampQueryParam(req, "to"));

                nlohmann::json response;
                response["store_id"] = storeId;
                response["product_id"] = productId;
                response["entries"] = json::toJsonArray(history);
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetPriceHistoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryQueryService> queryService_;
    };

} // namespace inventory::adapters::primary
