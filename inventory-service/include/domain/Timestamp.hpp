#pragma once

#include <string>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Временная метка (UTC) с миллисекундной точностью в строковом виде
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать ISO 8601: "2025-12-16", "2025-12-16T10:30:00Z", "2025-12-16T10:30:00.250+03:00"
     *
     * Без зоны время считается UTC. Смещение ±HH:MM переводится в UTC.
     * @return std::nullopt если строка не распознана или после времени есть лишние символы
     */
    static std::optional<Timestamp> tryParse(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);

        bool dateOnly = isoString.size() == 10;
        ss >> std::get_time(&tm, dateOnly ? "%Y-%m-%d" : "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }

        size_t pos = ss.eof() ? isoString.size() : static_cast<size_t>(ss.tellg());
        if (dateOnly && pos != isoString.size()) {
            return std::nullopt;
        }

        int64_t millis = 0;
        if (pos < isoString.size() && isoString[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < isoString.size() && std::isdigit(static_cast<unsigned char>(isoString[pos]))) {
                int d = isoString[pos++] - '0';
                if (digits < 3) {
                    millis = millis * 10 + d;
                }
                ++digits;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (; digits < 3; ++digits) {
                millis *= 10;
            }
        }

        auto offset = parseZone(isoString.substr(pos));
        if (!offset) {
            return std::nullopt;
        }

        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm))
                + std::chrono::milliseconds(millis)
                - std::chrono::minutes(*offset);
        return Timestamp(tp);
    }

    /**
     * @brief Разобрать ISO 8601
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        auto parsed = tryParse(isoString);
        if (!parsed) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }
        return *parsed;
    }

    /**
     * @brief ISO 8601 с миллисекундами: "2025-12-16T10:30:00.250Z"
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto millis = toUnixMillis() % 1000;
        if (millis < 0) {
            millis += 1000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)
        ));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    Timestamp addDays(int64_t days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    /**
     * @brief Смещение зоны в минутах: "" и "Z" дают 0, "+03:00" даёт 180
     */
    static std::optional<int64_t> parseZone(const std::string& zone) {
        if (zone.empty() || zone == "Z") {
            return 0;
        }
        if (zone.size() != 6 || (zone[0] != '+' && zone[0] != '-') || zone[3] != ':') {
            return std::nullopt;
        }
        for (size_t i : {1, 2, 4, 5}) {
            if (!std::isdigit(static_cast<unsigned char>(zone[i]))) {
                return std::nullopt;
            }
        }

        int64_t hours = (zone[1] - '0') * 10 + (zone[2] - '0');
        int64_t minutes = (zone[4] - '0') * 10 + (zone[5] - '0');
        if (hours > 23 || minutes > 59) {
            return std::nullopt;
        }
        int64_t offset = hours * 60 + minutes;
        return zone[0] == '-' ? -offset : offset;
    }
};

} // namespace inventory::domain
