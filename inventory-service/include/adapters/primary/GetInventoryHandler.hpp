#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IInventoryService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/inventory/{productId}: остаток товара
     */
    class GetInventoryHandler : public IHttpHandler
    {
    public:
        explicit GetInventoryHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[GetInventoryHandler] Created" << std::endl;
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

                auto record = inventoryService_->getRecord(storeId, productId);
                if (!record)
                {
                    http::sendError(res, 404, "Inventory not found");
                    return;
                }

                http::sendJson(res, 200, json::toJson(*record));
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetInventoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
