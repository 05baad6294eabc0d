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
     * @brief GET /api/v1/stores/{storeId}/summary: сводка остатков магазина
     */
    class GetStoreSummaryHandler : public IHttpHandler
    {
    public:
        explicit GetStoreSummaryHandler(std::shared_ptr<ports::input::IInventoryQueryService> queryService)
            : queryService_(std::move(queryService))
        {
            std::cout << "[GetStoreSummaryHandler] Created" << std::endl;
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
                http::sendJson(res, 200, json::toJson(queryService_->getStoreSummary(storeId)));
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetStoreSummaryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryQueryService> queryService_;
    };

} // namespace inventory::adapters::primary
