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
     * @brief PUT /api/v1/stores/{storeId}/inventory/{productId}: частичное обновление
     *
     * Меняются только переданные поля: quantity, пороги, cost, sale_price.
     */
    class UpdateInventoryHandler : public IHttpHandler
    {
    public:
        explicit UpdateInventoryHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[UpdateInventoryHandler] Created" << std::endl;
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
                std::string storeId = http::requirePathParam(req, 0, "Store ID");
                std::string productId = http::requirePathParam(req, 1, "Product ID");
                auto body = http::parseBody(req);

                domain::InventoryPatch patch;
                patch.quantity = http::optionalInt(body, "quantity");
                patch.minStockLevel = http::optionalInt(body, "min_stock_level");
                patch.maxStockLevel = http::optionalInt(body, "max_stock_level");
                patch.reorderLevel = http::optionalInt(body, "reorder_level");
                patch.costUpdate = json::costUpdateFrom(body);
                patch.source = http::optionalString(body, "source").value_or("manual");
                patch.referenceId = http::optionalString(body, "reference_id");
                patch.notes = http::optionalString(body, "notes");
                patch.userId = http::userIdFrom(req);

                auto record = inventoryService_->update(storeId, productId, patch);
                http::sendJson(res, 200, json::toJson(record));
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "UpdateInventoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
