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
     * @brief PUT /api/v1/alerts/{alertId}/resolve: закрыть алерт вручную
     *
     * Если остаток всё ещё ниже порога, следующая мутация ключа откроет новый алерт.
     */
    class ResolveAlertHandler : public IHttpHandler
    {
    public:
        explicit ResolveAlertHandler(std::shared_ptr<ports::input::ILowStockAlertService> alertService)
            : alertService_(std::move(alertService))
        {
            std::cout << "[ResolveAlertHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "PUT")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                std::string alertId = http::requirePathParam(req, 0, "Alert ID");
                auto alert = alertService_->resolveAlert(alertId);

                nlohmann::json response;
                response["status"] = "resolved";
                response["alert"] = json::toJson(alert);
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "ResolveAlertHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::ILowStockAlertService> alertService_;
    };

} // namespace inventory::adapters::primary
