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
     * @brief GET /api/v1/stores/{storeId}/alerts: активные алерты магазина
     */
    class GetAlertsHandler : public IHttpHandler
    {
    public:
        explicit GetAlertsHandler(std::shared_ptr<ports::input::ILowStockAlertService> alertService)
            : alertService_(std::move(alertService))
        {
            std::cout << "[GetAlertsHandler] Created" << std::endl;
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
                auto alerts = alertService_->listActiveAlerts(storeId);

                nlohmann::json response;
                response["store_id"] = storeId;
                response["alerts"] = json::toJsonArray(alerts);
                response["count"] = alerts.size();
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetAlertsHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::ILowStockAlertService> alertService_;
    };

} // namespace inventory::adapters::primary
