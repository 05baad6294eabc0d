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
     * @brief POST /api/v1/stores/{storeId}/inventory/{productId}/cost-layers/backfill
     *
     * 201 и созданный слой, либо 200 с "layer": null, если слои уже покрывают остаток.
     */
    class BackfillCostLayerHandler : public IHttpHandler
    {
    public:
        explicit BackfillCostLayerHandler(std::shared_ptr<ports::input::ICostLayerService> costLayerService)
            : costLayerService_(std::move(costLayerService))
        {
            std::cout << "[BackfillCostLayerHandler] Created" << std::endl;
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

                auto layer = costLayerService_->backfillLegacyLayer(storeId, productId);

                nlohmann::json response;
                response["store_id"] = storeId;
                response["product_id"] = productId;
                response["layer"] = layer ? json::toJson(*layer) : nlohmann::json(nullptr);
                http::sendJson(res, layer ? 201 : 200, response);
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "BackfillCostLayerHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::ICostLayerService> costLayerService_;
    };

} // namespace inventory::adapters::primary
