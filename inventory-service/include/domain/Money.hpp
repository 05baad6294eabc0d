#pragma once

#include "domain/errors/InventoryErrors.hpp"
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Денежная сумма с фиксированной точкой
 *
 * Хранит значение в десятитысячных долях (4 знака после запятой),
 * чтобы многократное списание слоёв не накапливало ошибку double.
 * Себестоимость единицы держится с 4 знаками, итоговые суммы
 * для отчётов округляются до копеек через roundToCents().
 *
 * Валюта не хранится: сумма всегда в валюте магазина.
 * Арифметика проверяет переполнение int64 и бросает ValidationError.
 */
class Money {
public:
    static constexpr int64_t SCALE = 10000;

    Money() = default;

    static Money fromScaled(int64_t scaled) {
        Money m;
        m.scaled_ = scaled;
        return m;
    }

    static Money fromUnits(int64_t units) {
        return fromScaled(checkedMul(units, SCALE));
    }

    /**
     * @brief Из double с округлением до 4 знаков
     */
    static Money fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Money value is not finite");
        }
        double scaled = value * SCALE;
        // 2^63: первое значение double, которое не помещается в int64
        if (std::fabs(scaled) >= 9223372036854775808.0) {
            throw ValidationError("Money amount out of range");
        }
        return fromScaled(static_cast<int64_t>(std::llround(value * SCALE)));
    }

    /**
     * @brief Из десятичной строки ("12.5", "-0.0075", "3")
     * @throws std::invalid_argument при неверном формате или больше 4 знаков
     */
    static Money fromString(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Money value is empty");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-' || text[pos] == '+') {
            negative = text[pos] == '-';
            ++pos;
        }

        int64_t whole = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDigit = false;
        bool seenPoint = false;

        for (; pos < text.size(); ++pos) {
            char c = text[pos];
            if (c == '.' && !seenPoint) {
                seenPoint = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid money value: " + text);
            }
            seenDigit = true;
            if (seenPoint) {
                if (++fractionDigits > 4) {
                    throw std::invalid_argument("Money supports at most 4 fractional digits: " + text);
                }
                fraction = fraction * 10 + (c - '0');
            } else {
                whole = checkedAdd(checkedMul(whole, 10), c - '0');
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid money value: " + text);
        }
        for (int i = fractionDigits; i < 4; ++i) {
            fraction *= 10;
        }

        int64_t scaled = checkedAdd(checkedMul(whole, SCALE), fraction);
        return fromScaled(negative ? -scaled : scaled);
    }

    int64_t scaled() const { return scaled_; }

    double toDouble() const {
        return static_cast<double>(scaled_) / SCALE;
    }

    /**
     * @brief Строка с заданным числом знаков (0..4), округление половины от нуля
     */
    std::string toString(int digits = 4) const {
        if (digits < 0 || digits > 4) {
            throw std::invalid_argument("Money digits must be in 0..4");
        }

        Money rounded = roundTo(digits);
        int64_t abs = std::llabs(rounded.scaled_);
        std::string result = rounded.scaled_ < 0 ? "-" : "";
        result += std::to_string(abs / SCALE);

        if (digits > 0) {
            std::string fraction = std::to_string(abs % SCALE);
            fraction.insert(0, 4 - fraction.size(), '0');
            result += "." + fraction.substr(0, static_cast<size_t>(digits));
        }
        return result;
    }

    /**
     * @brief Округлить до digits знаков, половина округляется от нуля
     */
    Money roundTo(int digits) const {
        int64_t step = 1;
        for (int i = digits; i < 4; ++i) {
            step *= 10;
        }
        if (step == 1) {
            return *this;
        }
        int64_t abs = std::llabs(scaled_);
        int64_t roundedAbs = checkedMul(checkedAdd(abs, step / 2) / step, step);
        return fromScaled(scaled_ < 0 ? -roundedAbs : roundedAbs);
    }

    Money roundToCents() const { return roundTo(2); }

    /**
     * @brief Разделить на количество с округлением до 4 знаков
     */
    Money dividedBy(int64_t divisor) const {
        if (divisor == 0) {
            throw std::invalid_argument("Money division by zero");
        }
        bool negative = (scaled_ < 0) != (divisor < 0);
        int64_t num = std::llabs(scaled_);
        int64_t den = std::llabs(divisor);
        int64_t q = num / den;
        int64_t rest = num % den;
        if (rest >= den - rest) {
            ++q;
        }
        return fromScaled(negative ? -q : q);
    }

    bool isZero() const { return scaled_ == 0; }
    bool isNegative() const { return scaled_ < 0; }
    bool isPositive() const { return scaled_ > 0; }

    Money operator+(const Money& other) const { return fromScaled(checkedAdd(scaled_, other.scaled_)); }
    Money operator-(const Money& other) const { return fromScaled(checkedSub(scaled_, other.scaled_)); }
    Money operator-() const { return fromScaled(checkedSub(0, scaled_)); }
    Money operator*(int64_t multiplier) const { return fromScaled(checkedMul(scaled_, multiplier)); }

    Money& operator+=(const Money& other) {
        scaled_ = checkedAdd(scaled_, other.scaled_);
        return *this;
    }

    Money& operator-=(const Money& other) {
        scaled_ = checkedSub(scaled_, other.scaled_);
        return *this;
    }

    bool operator==(const Money& other) const { return scaled_ == other.scaled_; }
    bool operator!=(const Money& other) const { return scaled_ != other.scaled_; }
    bool operator<(const Money& other) const { return scaled_ < other.scaled_; }
    bool operator>(const Money& other) const { return scaled_ > other.scaled_; }
    bool operator<=(const Money& other) const { return scaled_ <= other.scaled_; }
    bool operator>=(const Money& other) const { return scaled_ >= other.scaled_; }

private:
    static int64_t checkedAdd(int64_t a, int64_t b) {
        int64_t result = 0;
        if (__builtin_add_overflow(a, b, &result)) {
            throw ValidationError("Money amount out of range");
        }
        return result;
    }

    static int64_t checkedSub(int64_t a, int64_t b) {
        int64_t result = 0;
        if (__builtin_sub_overflow(a, b, &result)) {
            throw ValidationError("Money amount out of range");
        }
        return result;
    }

    static int64_t checkedMul(int64_t a, int64_t b) {
        int64_t result = 0;
        if (__builtin_mul_overflow(a, b, &result)) {
            throw ValidationError("Money amount out of range");
        }
        return result;
    }

    int64_t scaled_ = 0;
};

} // namespace inventory::domain
