#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace inventory::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Передаётся через IEventBus; eventType служит routing key.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (inventory.alert.low_stock, ...)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace inventory::domain
