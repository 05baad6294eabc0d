#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace inventory::adapters::primary::http
{

    /**
     * @brief {"error": message} с заданным статусом
     */
    inline void sendError(IResponse &res, int status, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }

    inline void sendJson(IResponse &res, int status, const nlohmann::json &body)
    {
        res.setResult(status, "application/json", body.dump());
    }

    /**
     * @brief Ответ на исключение сервиса
     *
     * InsufficientStockError -> 409, ValidationError и std::invalid_argument -> 400,
     * NotFoundError -> 404, RetryableStorageError -> 503, остальное -> 500.
     */
    inline void sendMappedError(IResponse &res, const std::string &handler, const std::exception &e)
    {
        if (auto insufficient = dynamic_cast<const domain::InsufficientStockError *>(&e))
        {
            nlohmann::json error;
            error["error"] = insufficient->what();
            error["requested"] = insufficient->requested();
            error["available"] = insufficient->available();
            res.setResult(409, "application/json", error.dump());
            return;
        }
        if (dynamic_cast<const domain::ValidationError *>(&e) ||
            dynamic_cast<const std::invalid_argument *>(&e) ||
            dynamic_cast<const std::out_of_range *>(&e))
        {
            sendError(res, 400, e.what());
            return;
        }
        if (dynamic_cast<const domain::NotFoundError *>(&e))
        {
            sendError(res, 404, e.what());
            return;
        }
        if (dynamic_cast<const domain::RetryableStorageError *>(&e))
        {
            std::cerr << "[" << handler << "] Storage busy: " << e.what() << std::endl;
            res.setHeader("Retry-After", "1");
            sendError(res, 503, "Storage temporarily unavailable, retry the request");
            return;
        }

        std::cerr << "[" << handler << "] Error: " << e.what() << std::endl;
        sendError(res, 500, "Internal server error");
    }

    // ============================================
    // ЗАПРОС
    // ============================================

    /**
     * @brief Пользователь из заголовка X-User-Id
     */
    inline std::optional<std::string> userIdFrom(IRequest &req)
    {
        auto userId = req.getHeader("X-User-Id");
        if (!userId || userId->empty())
        {
            return std::nullopt;
        }
        return userId;
    }

    /**
     * @brief Параметр пути; ValidationError если его нет
     */
    inline std::string requirePathParam(IRequest &req, size_t index, const std::string &name)
    {
        auto value = req.getPathParam(index).value_or("");
        if (value.empty())
        {
            throw domain::ValidationError(name + " is required");
        }
        return value;
    }

    inline std::optional<int64_t> intQueryParam(IRequest &req, const std::string &name)
    {
        auto value = req.getQueryParam(name);
        if (!value || value->empty())
        {
            return std::nullopt;
        }
        size_t pos = 0;
        int64_t parsed = std::stoll(*value, &pos);
        if (pos != value->size())
        {
            throw std::invalid_argument("Query parameter '" + name + "' must be an integer");
        }
        return parsed;
    }

    /// Целочисленный параметр в диапазоне int: лимиты и смещения пагинации.
    inline std::optional<int> boundedIntQueryParam(IRequest &req, const std::string &name)
    {
        auto value = intQueryParam(req, name);
        if (!value)
        {
            return std::nullopt;
        }
        if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        {
            throw domain::ValidationError("Query parameter '" + name + "' is out of range");
        }
        return static_cast<int>(*value);
    }

    inline std::optional<domain::Timestamp> timestampQueryParam(IRequest &req, const std::string &name)
    {
        auto value = req.getQueryParam(name);
        if (!value || value->empty())
        {
            return std::nullopt;
        }
        return domain::Timestamp::fromString(*value);
    }

    inline std::optional<std::string> stringQueryParam(IRequest &req, const std::string &name)
    {
        auto value = req.getQueryParam(name);
        if (!value || value->empty())
        {
            return std::nullopt;
        }
        return value;
    }

    // ============================================
    // ТЕЛО
    // ============================================

    /**
     * @brief Тело запроса как JSON-объект
     * @throws nlohmann::json::exception при неверном JSON
     */
    inline nlohmann::json parseBody(IRequest &req)
    {
        const auto &body = req.getBody();
        if (body.empty())
        {
            return nlohmann::json::object();
        }
        auto json = nlohmann::json::parse(body);
        if (!json.is_object())
        {
            throw domain::ValidationError("Request body must be a JSON object");
        }
        return json;
    }

    /**
     * @brief Денежное поле: число или строка ("12.50")
     */
    inline std::optional<domain::Money> optionalMoney(const nlohmann::json &body, const std::string &key)
    {
        auto it = body.find(key);
        if (it == body.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (it->is_string())
        {
            return domain::Money::fromString(it->get<std::string>());
        }
        if (it->is_number())
        {
            return domain::Money::fromDouble(it->get<double>());
        }
        throw domain::ValidationError("Field '" + key + "' must be a number");
    }

    inline std::optional<int64_t> optionalInt(const nlohmann::json &body, const std::string &key)
    {
        auto it = body.find(key);
        if (it == body.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_number_integer())
        {
            throw domain::ValidationError("Field '" + key + "' must be an integer");
        }
        return it->get<int64_t>();
    }

    inline int64_t requireInt(const nlohmann::json &body, const std::string &key)
    {
        auto value = optionalInt(body, key);
        if (!value)
        {
            throw domain::ValidationError("Field '" + key + "' is required");
        }
        return *value;
    }

    inline std::optional<std::string> optionalString(const nlohmann::json &body, const std::string &key)
    {
        auto it = body.find(key);
        if (it == body.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_string())
        {
            throw domain::ValidationError("Field '" + key + "' must be a string");
        }
        return it->get<std::string>();
    }

} // namespace inventory::adapters::primary::http
