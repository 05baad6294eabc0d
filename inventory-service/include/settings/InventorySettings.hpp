#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace inventory::settings {

/**
 * @brief Настройки учёта остатков
 *
 * Читает из ENV:
 * - INVENTORY_STORAGE (default: "memory") - "memory" | "postgres"
 * - EVENT_BUS (default: "memory") - "memory" | "rabbitmq"
 * - INVENTORY_LOCK_TIMEOUT_MS (default: 5000) - ожидание захвата ключа
 * - INVENTORY_STATEMENT_TIMEOUT_MS (default: 10000) - таймаут запроса к БД
 * - OUTBOX_POLL_INTERVAL_MS (default: 500)
 * - OUTBOX_BATCH_SIZE (default: 100)
 * - OUTBOX_MAX_ATTEMPTS (default: 5)
 */
class InventorySettings {
public:
    InventorySettings() {
        if (const char* val = std::getenv("INVENTORY_STORAGE")) {
            storage_ = val;
        }
        if (const char* val = std::getenv("EVENT_BUS")) {
            eventBus_ = val;
        }
        if (const char* val = std::getenv("INVENTORY_LOCK_TIMEOUT_MS")) {
            lockTimeoutMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("INVENTORY_STATEMENT_TIMEOUT_MS")) {
            statementTimeoutMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("OUTBOX_POLL_INTERVAL_MS")) {
            outboxPollIntervalMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("OUTBOX_BATCH_SIZE")) {
            outboxBatchSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("OUTBOX_MAX_ATTEMPTS")) {
            outboxMaxAttempts_ = std::stoi(val);
        }
    }

    std::string getStorage() const { return storage_; }
    std::string getEventBus() const { return eventBus_; }
    bool usePostgres() const { return storage_ == "postgres"; }
    bool useRabbitMQ() const { return eventBus_ == "rabbitmq"; }

    std::chrono::milliseconds getLockTimeout() const {
        return std::chrono::milliseconds(lockTimeoutMs_);
    }

    std::chrono::milliseconds getStatementTimeout() const {
        return std::chrono::milliseconds(statementTimeoutMs_);
    }

    std::chrono::milliseconds getOutboxPollInterval() const {
        return std::chrono::milliseconds(outboxPollIntervalMs_);
    }

    size_t getOutboxBatchSize() const { return outboxBatchSize_; }
    int getOutboxMaxAttempts() const { return outboxMaxAttempts_; }

    // Для тестов
    void setLockTimeoutMs(int ms) { lockTimeoutMs_ = ms; }
    void setOutboxMaxAttempts(int attempts) { outboxMaxAttempts_ = attempts; }
    void setOutboxPollIntervalMs(int ms) { outboxPollIntervalMs_ = ms; }

private:
    std::string storage_ = "memory";
    std::string eventBus_ = "memory";
    int lockTimeoutMs_ = 5000;
    int statementTimeoutMs_ = 10000;
    int outboxPollIntervalMs_ = 500;
    size_t outboxBatchSize_ = 100;
    int outboxMaxAttempts_ = 5;
};

} // namespace inventory::settings
