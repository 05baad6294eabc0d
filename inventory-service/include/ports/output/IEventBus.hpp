#pragma once

#include "domain/events/DomainEvent.hpp"

namespace inventory::ports::output {

/**
 * @brief Интерфейс событийной шины
 *
 * Транспорт уведомлений после outbox. Сервис только публикует:
 * потребители уведомлений живут за пределами процесса.
 *
 * Реализации:
 * - InMemoryEventBus - журнал опубликованного в процессе (без брокера)
 * - RabbitMQEventBus - topic exchange RabbitMQ
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Опубликовать событие
     * @throws std::exception если событие не передано транспорту
     */
    virtual void publish(const domain::DomainEvent& event) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace inventory::ports::output
