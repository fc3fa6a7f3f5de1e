#pragma once

#include <cstdint>

namespace session::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Все компоненты читают время только через этот порт,
 * чтобы тесты могли управлять часами.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Unix-время в миллисекундах
     */
    virtual std::int64_t nowMillis() const = 0;

    /**
     * @brief Unix-время в секундах
     */
    std::int64_t nowSeconds() const {
        return nowMillis() / 1000;
    }
};

} // namespace session::ports::output
