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
     * @brief POST /api/v1/stores/{storeId}/inventory/{productId}/adjust: изменить остаток на delta
     *
     * При delta > 0 и отсутствии записи она создаётся.
     * Возврат от покупателя: delta > 0, cost возвращённой единицы, source "pos_refund".
     */
    class AdjustInventoryHandler : public IHttpHandler
    {
    public:
        explicit AdjustInventoryHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[AdjustInventoryHandler] Created" << std::endl;
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

                domain::AdjustmentRequest request;
                request.storeId = http::requirePathParam(req, 0, "Store ID");
                request.productId = http::requirePathParam(req, 1, "Product ID");
                request.delta = http::requireInt(body, "delta");
                request.costUpdate = json::costUpdateFrom(body);
                request.source = http::optionalString(body, "source").value_or("manual");
                request.referenceId = http::optionalString(body, "reference_id");
                request.notes = http::optionalString(body, "notes");
                request.userId = http::userIdFrom(req);

                auto record = inventoryService_->adjust(request);
                http::sendJson(res, 200, json::toJson(record));
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "AdjustInventoryHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
