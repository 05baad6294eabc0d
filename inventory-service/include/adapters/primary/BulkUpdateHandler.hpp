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
     * @brief POST /api/v1/stores/{storeId}/inventory-bulk
     *
     * Тело: {"items": [{"product_id", "quantity", "min_stock_level", ...}]}.
     * Ответ 200 даже при частичных ошибках; итог по позициям в "results".
     */
    class BulkUpdateHandler : public IHttpHandler
    {
    public:
        explicit BulkUpdateHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
            : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[BulkUpdateHandler] Created" << std::endl;
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

                std::vector<domain::BulkUpdateItem> items;
                for (const auto &entry : body["items"])
                {
                    domain::BulkUpdateItem item;
                    item.productId = http::optionalString(entry, "product_id").value_or("");
                    item.quantity = http::optionalInt(entry, "quantity");
                    item.minStockLevel = http::optionalInt(entry, "min_stock_level");
                    item.maxStockLevel = http::optionalInt(entry, "max_stock_level");
                    item.reorderLevel = http::optionalInt(entry, "reorder_level");
                    item.costUpdate = json::costUpdateFrom(entry);
                    items.push_back(std::move(item));
                }

                auto results = inventoryService_->bulkUpdate(storeId, items, http::userIdFrom(req));

                size_t succeeded = 0;
                for (const auto &r : results)
                {
                    if (r.success)
                    {
                        ++succeeded;
                    }
                }

                nlohmann::json response;
                response["store_id"] = storeId;
                response["results"] = json::toJsonArray(results);
                response["succeeded"] = succeeded;
                response["failed"] = results.size() - succeeded;
                http::sendJson(res, 200, response);
            }
            catch (const nlohmann::json::exception &)
            {
                http::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "BulkUpdateHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace inventory::adapters::primary
