#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace session::adapters::secondary {

/**
 * @brief Системные часы (wall clock)
 *
 * system_clock, а не steady_clock: ID и токены содержат Unix-время.
 * Перевод часов назад проявится как CLOCK_REGRESSION в генераторе ID.
 */
class SystemClock : public ports::output::IClock {
public:
    std::int64_t nowMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

} // namespace session::adapters::secondary
