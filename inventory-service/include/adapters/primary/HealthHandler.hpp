#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/INotificationOutbox.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace inventory::adapters::primary {

/**
 * @brief GET /health
 *
 * Хранилище проверяется через outbox: pendingCount() идёт в ту же базу,
 * что и остатки. Нет ответа от хранилища: 503 и status "degraded".
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::INotificationOutbox> outbox)
        : outbox_(std::move(outbox)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["service"] = "inventory-service";
        response["version"] = "1.0.0";

        try {
            response["outbox_pending"] = outbox_->pendingCount();
            response["status"] = "healthy";
            res.setResult(200, "application/json", response.dump());
        } catch (const std::exception& e) {
            std::cerr << "[HealthHandler] Storage check failed: " << e.what() << std::endl;
            response["status"] = "degraded";
            res.setResult(503, "application/json", response.dump());
        }
    }

private:
    std::shared_ptr<ports::output::INotificationOutbox> outbox_;
};

} // namespace inventory::adapters::primary
