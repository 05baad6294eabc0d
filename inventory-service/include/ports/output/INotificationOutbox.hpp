#pragma once

#include "domain/OutboxMessage.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Outbox уведомлений
 *
 * Сообщения попадают сюда при commit() единицы работы.
 */
class INotificationOutbox {
public:
    virtual ~INotificationOutbox() = default;

    /**
     * @brief Недоставленные сообщения в порядке поступления
     */
    virtual std::vector<domain::OutboxMessage> fetchPending(size_t limit) = 0;

    virtual void markDelivered(const std::string& messageId) = 0;

    /**
     * @brief Учесть неудачную попытку доставки
     * @return true если попытки исчерпаны и сообщение снято с доставки
     */
    virtual bool markFailed(const std::string& messageId,
                            const std::string& error,
                            int maxAttempts) = 0;

    virtual size_t pendingCount() = 0;
};

} // namespace inventory::ports::output
