#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IStockRemovalService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief POST /api/v1/stores/{storeId}/inventory/{productId}/removals: списание товара
     *
     * Тело: {"quantity", "reason", "refund_type", "refund_amount", "refund_per_unit", "notes"}.
     * reason: expired | damaged | low_sales | returned_to_manufacturer | theft | other.
     * refund_type: none | full | partial.
     */
    class RemoveStockHandler : public IHttpHandler
    {
    public:
        explicit RemoveStockHandler(std::shared_ptr<ports::input::IStockRemovalService> removalService)
            : removalService_(std::move(removalService))
        {
            std::cout << "[RemoveStockHandler] Created" << std::endl;
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

                domain::StockRemovalRequest request;
                request.storeId = http::requirePathParam(req, 0, "Store ID");
                request.productId = http::requirePathParam(req, 1, "Product ID");
                request.quantity = http::requireInt(body, "quantity");
                request.reason = domain::removalReasonFromString(
                    http::optionalString(body, "reason").value_or("other"));
                request.refundType = domain::refundTypeFromString(
                    http::optionalString(body, "refund_type").value_or("none"));
                request.refundAmount = http::optionalMoney(body, "refund_amount");
                request.refundPerUnit = http::optionalMoney(body, "refund_per_unit");
                request.notes = http::optionalString(body, "notes");
                request.userId = http::userIdFrom(req);

                auto result = removalService_->removeStock(request);
                http::sendJson(res, 201, json::toJson(result));
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "RemoveStockHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IStockRemovalService> removalService_;
    };

} // namespace inventory::adapters::primary
