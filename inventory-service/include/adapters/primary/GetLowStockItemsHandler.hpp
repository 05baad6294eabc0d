#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILowStockAlertService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/low-stock: записи на минимуме или в нуле
     */
    class GetLowStockItemsHandler : public IHttpHandler
    {
    public:
        explicit GetLowStockItemsHandler(std::shared_ptr<ports::input::ILowStockAlertService> alertService)
            : alertService_(std::move(alertService))
        {
            std::cout << "[GetLowStockItemsHandler] Created" << std::endl;
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
                auto items = alertService_->listLowStockItems(storeId);

                nlohmann::json response;
                response["store_id"] = storeId;
                response["items"] = json::toJsonArray(items);
                response["count"] = items.size();
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetLowStockItemsHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::ILowStockAlertService> alertService_;
    };

} // namespace inventory::adapters::primary
