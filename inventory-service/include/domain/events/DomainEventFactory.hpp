#pragma once

#include <memory>
#include <string>

#include "domain/events/DomainEvent.hpp"

namespace inventory::domain {

/**
 * @brief Восстановление типизированного события из JSON (outbox, RabbitMQ)
 */
class DomainEventFactory {
public:
    virtual ~DomainEventFactory() = default;

    virtual std::unique_ptr<DomainEvent> create(
        const std::string& eventType,
        const std::string& payloadJson
    ) const = 0;
};

} // namespace inventory::domain
