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
     * @brief GET /api/v1/orgs/{orgId}/inventory-summary: сводка по всем магазинам организации
     */
    class GetOrgSummaryHandler : public IHttpHandler
    {
    public:
        explicit GetOrgSummaryHandler(std::shared_ptr<ports::input::IInventoryQueryService> queryService)
            : queryService_(std::move(queryService))
        {
            std::cout << "[GetOrgSummaryHandler] Created" << std::endl;
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
                std::string orgId = http::requirePathParam(req, 0, "Organization ID");
                http::sendJson(res, 200, json::toJson(queryService_->getOrganizationSummary(orgId)));
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetOrgSummaryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryQueryService> queryService_;
    };

} // namespace inventory::adapters::primary
