#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IInventoryService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief DELETE /api/v1/stores/{storeId}/inventory/{productId}: удалить остаток и его слои
     */
    class DeleteInventoryHandler : public IHttpHandler
    {
    public:
        explicit DeleteInventoryHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[DeleteInventoryHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "DELETE")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                std::string storeId = http::requirePathParam(req, 0, "Store ID");
                std::string productId = http::requirePathParam(req, 1, "Product ID");

                inventoryService_->remove(storeId, productId, http::userIdFrom(req));

                nlohmann::json response;
                response["store_id"] = storeId;
                response["product_id"] = productId;
                response["deleted"] = true;
                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "DeleteInventoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
