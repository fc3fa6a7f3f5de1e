#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>

namespace session::domain {

/**
 * @brief 64-битный сортируемый идентификатор (Snowflake)
 *
 * Раскладка бит (старшие → младшие):
 * - 42 бита: миллисекунды от эпохи 2015-01-01T00:00:00.000Z
 * - 10 бит: workerId (0..1023)
 * - 12 бит: sequence внутри миллисекунды (0..4095)
 *
 * Внутри — std::uint64_t, наружу (JSON, ключ сессии) — десятичная строка.
 */
struct SnowflakeId {
    static constexpr std::int64_t EPOCH_MS = 1420070400000LL;   ///< 2015-01-01T00:00:00.000Z

    static constexpr int TIMESTAMP_BITS = 42;
    static constexpr int WORKER_ID_BITS = 10;
    static constexpr int SEQUENCE_BITS = 12;

    static constexpr int WORKER_ID_SHIFT = SEQUENCE_BITS;
    static constexpr int TIMESTAMP_SHIFT = WORKER_ID_BITS + SEQUENCE_BITS;

    static constexpr std::uint64_t TIMESTAMP_MASK = (std::uint64_t{1} << TIMESTAMP_BITS) - 1;
    static constexpr std::uint32_t MAX_WORKER_ID = (1u << WORKER_ID_BITS) - 1;
    static constexpr std::uint32_t MAX_SEQUENCE = (1u << SEQUENCE_BITS) - 1;

    std::uint64_t value = 0;

    SnowflakeId() = default;
    explicit SnowflakeId(std::uint64_t v) : value(v) {}

    /**
     * @brief Собрать ID из компонентов
     * @param unixMillis Unix-время в миллисекундах (эпоха сдвигается здесь)
     */
    static SnowflakeId compose(std::int64_t unixMillis, std::uint32_t workerId, std::uint32_t sequence) {
        auto offset = static_cast<std::uint64_t>(unixMillis - EPOCH_MS);
        return SnowflakeId(
            ((offset & TIMESTAMP_MASK) << TIMESTAMP_SHIFT)
            | (static_cast<std::uint64_t>(workerId & MAX_WORKER_ID) << WORKER_ID_SHIFT)
            | static_cast<std::uint64_t>(sequence & MAX_SEQUENCE)
        );
    }

    /**
     * @brief Разобрать десятичную строку
     * @throws std::invalid_argument если строка не число или не влезает в 64 бита
     */
    static SnowflakeId fromString(const std::string& str) {
        if (str.empty() || str.size() > 20) {
            throw std::invalid_argument("Invalid snowflake id: '" + str + "'");
        }
        std::uint64_t result = 0;
        for (char c : str) {
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid snowflake id: '" + str + "'");
            }
            auto digit = static_cast<std::uint64_t>(c - '0');
            if (result > (UINT64_MAX - digit) / 10) {
                throw std::invalid_argument("Snowflake id out of range: '" + str + "'");
            }
            result = result * 10 + digit;
        }
        return SnowflakeId(result);
    }

    std::string toString() const {
        return std::to_string(value);
    }

    /// Unix-время в миллисекундах
    std::int64_t timestampMillis() const {
        return static_cast<std::int64_t>(value >> TIMESTAMP_SHIFT) + EPOCH_MS;
    }

    std::uint32_t workerId() const {
        return static_cast<std::uint32_t>((value >> WORKER_ID_SHIFT) & MAX_WORKER_ID);
    }

    std::uint32_t sequence() const {
        return static_cast<std::uint32_t>(value & MAX_SEQUENCE);
    }

    bool operator==(const SnowflakeId& other) const { return value == other.value; }
    bool operator!=(const SnowflakeId& other) const { return value != other.value; }
    bool operator<(const SnowflakeId& other) const { return value < other.value; }
    bool operator>(const SnowflakeId& other) const { return value > other.value; }
};

/**
 * @brief Компоненты декодированного ID
 */
struct SnowflakeComponents {
    std::int64_t timestamp = 0;     ///< Unix-время в миллисекундах
    std::uint32_t workerId = 0;
    std::uint32_t sequence = 0;
};

} // namespace session::domain
