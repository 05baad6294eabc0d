#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace inventory::utils {

/**
 * @brief Генератор UUID v4 для записей, слоёв, движений и событий
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4 в каноническом виде xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;

        std::array<uint8_t, 16> bytes{};
        uint64_t hi = dist(gen);
        uint64_t lo = dist(gen);
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
            bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant RFC 4122

        static const char* HEX = "0123456789abcdef";
        std::string result;
        result.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                result.push_back('-');
            }
            result.push_back(HEX[bytes[i] >> 4]);
            result.push_back(HEX[bytes[i] & 0x0F]);
        }
        return result;
    }
};

} // namespace inventory::utils
