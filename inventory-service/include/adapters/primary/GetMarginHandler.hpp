#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMarginAnalyzer.hpp"
#include "adapters/primary/HandlerSupport.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/inventory/{productId}/margin?price=2.50
     */
    class GetMarginHandler : public IHttpHandler
    {
    public:
        explicit GetMarginHandler(std::shared_ptr<ports::input::IMarginAnalyzer> marginAnalyzer)
            : marginAnalyzer_(std::move(marginAnalyzer))
        {
            std::cout << "[GetMarginHandler] Created" << std::endl;
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

                auto price = http::stringQueryParam(req, "price");
                if (!price)
                {
                    http::sendError(res, 400, "Query parameter 'price' is required");
                    return;
                }

                auto analysis = marginAnalyzer_->analyzeMargin(
                    storeId, productId, domain::Money::fromString(*price));
                http::sendJson(res, 200, json::toJson(analysis));
            }
            catch (const std::exception &e)
            {
                http::sendMappedError(res, "GetMarginHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IMarginAnalyzer> marginAnalyzer_;
    };

} // namespace inventory::adapters::primary
