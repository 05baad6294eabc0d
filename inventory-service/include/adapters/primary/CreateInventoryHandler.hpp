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
     * @brief POST /api/v1/stores/{storeId}/inventory: завести остаток
     *
     * Тело: {"product_id", "quantity", "min_stock_level", "max_stock_level",
     * "reorder_level", "cost", "sale_price"}; обязателен только product_id.
     */
    class CreateInventoryHandler : public IHttpHandler
    {
    public:
        explicit CreateInventoryHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[CreateInventoryHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                http::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = http::parseBody(req);

                domain::CreateInventoryRequest request;
                request.storeId = http::requirePathParam(req, 0, "Store ID");
                request.productId = http::optionalString(body, "product_id").value_or("");
                request.initialQuantity = http::optionalInt(body, "quantity").value_or(0);
                request.minStockLevel = http::optionalInt(body, "min_stock_level");
                request.maxStockLevel = http::optionalInt(body, "max_stock_level");
                request.reorderLevel = http::optionalInt(body, "reorder_level");
                request.costOverride = json::costUpdateFrom(body);
                request.userId = http::userIdFrom(req);

                if (request.productId.empty())
                {
                    http::sendError(res, 400, "product_id is required");
                    return;
                }

                auto record = inventoryService_->create(request);
                http::sendJson(res, 201, json::toJson(record));
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "CreateInventoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
