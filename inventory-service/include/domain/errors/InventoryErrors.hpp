#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Базовое исключение учёта остатков
 */
class InventoryError : public std::runtime_error {
public:
    explicit InventoryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Неверные входные данные; ничего не записано
 */
class ValidationError : public InventoryError {
public:
    explicit ValidationError(const std::string& message)
        : InventoryError(message) {}
};

/**
 * @brief Запрошено больше, чем есть на остатке; ничего не записано
 */
class InsufficientStockError : public ValidationError {
public:
    InsufficientStockError(int64_t requested, int64_t available)
        : ValidationError("Insufficient stock: requested " + std::to_string(requested)
                          + ", available " + std::to_string(available))
        , requested_(requested)
        , available_(available) {}

    int64_t requested() const { return requested_; }
    int64_t available() const { return available_; }

private:
    int64_t requested_;
    int64_t available_;
};

/**
 * @brief Запись остатка не найдена
 */
class NotFoundError : public InventoryError {
public:
    explicit NotFoundError(const std::string& message)
        : InventoryError(message) {}
};

/**
 * @brief Таймаут, ожидание блокировки, обрыв соединения.
 *
 * Единица работы не зафиксирована, операцию можно повторить.
 */
class RetryableStorageError : public InventoryError {
public:
    explicit RetryableStorageError(const std::string& message)
        : InventoryError(message) {}
};

} // namespace inventory::domain
