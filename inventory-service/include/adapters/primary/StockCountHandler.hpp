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
     * @brief POST /api/v1/stores/{storeId}/stock-counts: результаты инвентаризации
     *
     * Тело: {"items": [{"product_id", "counted_quantity"}], "notes"}.
     */
    class StockCountHandler : public IHttpHandler
    {
    public:
        explicit StockCountHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[StockCountHandler] Created" << std::endl;
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
                auto body = http::parseBody(req);

                if (!body.contains("items") || !body["items"].is_array())
                {
                    http::sendError(res, 400, "Field 'items' must be an array");
                    return;
                }

                std::vector<domain::StockCountItem> items;
                for (const auto &entry : body["items"])
                {
                    domain::StockCountItem item;
                    item.productId = http::optionalString(entry, "product_id").value_or("");
                    item.countedQuantity = http::requireInt(entry, "counted_quantity");
                    items.push_back(std::move(item));
                }

                auto results = inventoryService_->performStockCount(
                    storeId, items, http::userIdFrom(req), http::optionalString(body, "notes"));

                int64_t totalVariance = 0;
                for (const auto &r : results)
                {
                    if (r.success)
                    {
                        totalVariance += r.variance;
                    }
                }

                nlohmann::json response;
                response["store_id"] = storeId;
                response["results"] = json::toJsonArray(results);
                response["total_variance"] = totalVariance;
                http::sendJson(res, 200, response);
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "StockCountHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
