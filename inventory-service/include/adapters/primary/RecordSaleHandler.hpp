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
     * @brief POST /api/v1/stores/{storeId}/inventory/{productId}/sales: списание продажи POS
     *
     * Тело: {"quantity", "transaction_id"}. Ответ содержит себестоимость продажи по FIFO.
     */
    class RecordSaleHandler : public IHttpHandler
    {
    public:
        explicit RecordSaleHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[RecordSaleHandler] Created" << std::endl;
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
                std::string storeId = http::requirePathParam(req, 0, "Store ID");
                std::string productId = http::requirePathParam(req, 1, "Product ID");
                auto body = http::parseBody(req);

                int64_t quantity = http::requireInt(body, "quantity");
                std::string transactionId = http::optionalString(body, "transaction_id").value_or("");
                if (transactionId.empty())
                {
                    http::sendError(res, 400, "transaction_id is required");
                    return;
                }

                auto costing = inventoryService_->recordSaleConsumption(
                    storeId, productId, quantity, transactionId, http::userIdFrom(req));

                nlohmann::json response;
                response["transaction_id"] = transactionId;
                response["quantity"] = costing.quantity;
                response["unit_cost"] = json::money(costing.unitCost);
                response["total_cost"] = json::money(costing.totalCost);
                response["inventory"] = json::toJson(costing.inventory);
                http::sendJson(res, 200, response);
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "RecordSaleHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
