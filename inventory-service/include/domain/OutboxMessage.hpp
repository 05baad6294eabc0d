#pragma once

#include "domain/Timestamp.hpp"
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Сообщение transactional outbox
 *
 * payload: сериализованное доменное событие (DomainEvent::toJson()).
 */
struct OutboxMessage {
    std::string id;
    std::string eventType;
    std::string payload;
    std::string storeId;
    std::string productId;
    int attempts = 0;
    std::optional<std::string> lastError;
    Timestamp createdAt;
};

} // namespace inventory::domain
