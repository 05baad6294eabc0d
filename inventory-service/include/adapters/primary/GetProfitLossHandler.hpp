#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IProfitLossService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/profit-loss?start=2024-01-01&end=2024-02-01
     *
     * Окно [start, end); даты в виде YYYY-MM-DD или ISO 8601.
     */
    class GetProfitLossHandler : public IHttpHandler
    {
    public:
        explicit GetProfitLossHandler(std::shared_ptr<ports::input::IProfitLossService> profitLossService)
            : profitLossService_(std::move(profitLossService))
        {
            std::cout << "[GetProfitLossHandler] Created" << std::endl;
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

                auto start = http::timestampQueryParam(req, "start");
                auto end = http::timestampQueryParam(req, "end");
                if (!start || !end)
                {
                    http::sendError(res, 400, "Query parameters 'start' and 'end' are required");
                    return;
                }

                auto result = profitLossService_->getProfitLoss(storeId, *start, *end);
                http::sendJson(res, 200, json::toJson(result));
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetProfitLossHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IProfitLossService> profitLossService_;
    };

} // namespace inventory::adapters::primary
