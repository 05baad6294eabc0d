#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICostLayerService.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/inventory/{productId}/cost-layers
     *
     * Слои в порядке FIFO. С ?quantity=N в ответ добавляется "preview":
     * оценка списания N единиц без изменений.
     */
    class GetCostLayersHandler : public IHttpHandler
    {
    public:
        explicit GetCostLayersHandler(std::shared_ptr<ports::input::ICostLayerService> costLayerService)
            : costLayerService_(std::move(costLayerService))
        {
            std::cout << "[GetCostLayersHandler] Created" << std::endl;
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

                auto layers = costLayerService_->listLayers(storeId, productId);

                int64_t totalQuantity = 0;
                for (const auto &layer : layers)
                {
                    totalQuantity += layer.quantityRemaining;
                }

                nlohmann::json response;
                response["store_id"] = storeId;
                response["product_id"] = productId;
                response["layers"] = json::toJsonArray(layers);
                response["total_quantity"] = totalQuantity;

                if (auto quantity = http::intQueryParam(req, "quantity"))
                {
                    response["preview"] = json::toJson(costLayerService_->preview(storeId, productId, *quantity));
                }

                http::sendJson(res, 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetCostLayersHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::ICostLayerService> costLayerService_;
    };

} // namespace inventory::adapters::primary
