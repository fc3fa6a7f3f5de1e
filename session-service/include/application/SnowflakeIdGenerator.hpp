#pragma once

#include "ports/output/IIdGenerator.hpp"
#include "ports/output/IClock.hpp"
#include "domain/SnowflakeId.hpp"
#include "domain/errors/IdGeneratorError.hpp"
#include "utils/Crypto.hpp"

#include <unistd.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace session::application {

/**
 * @brief Генератор Snowflake ID
 *
 * Инварианты для одного workerId:
 * - ID строго возрастают;
 * - не более 4096 ID за миллисекунду, дальше — ожидание следующей миллисекунды;
 * - часы назад — фатальная ошибка CLOCK_REGRESSION (повтор не поможет).
 *
 * sequence и lastTimestamp защищены одним мьютексом; ожидание при
 * переполнении sequence идёт под тем же мьютексом, поэтому другой поток
 * не может вклиниться между проверкой часов и выдачей ID.
 */
class SnowflakeIdGenerator : public ports::output::IIdGenerator {
public:
    /**
     * @param clock Источник времени
     * @param workerId Явный workerId (0..1023); std::nullopt — deriveWorkerId()
     * @throws domain::IdGeneratorError WORKER_ID_OUT_OF_RANGE
     */
    explicit SnowflakeIdGenerator(
        std::shared_ptr<ports::output::IClock> clock,
        std::optional<std::uint32_t> workerId = std::nullopt
    ) : clock_(std::move(clock))
      , workerId_(workerId ? *workerId : deriveWorkerId())
    {
        if (workerId_ > domain::SnowflakeId::MAX_WORKER_ID) {
            throw domain::IdGeneratorError(
                domain::IdGeneratorErrorCode::WORKER_ID_OUT_OF_RANGE,
                "Worker ID " + std::to_string(workerId_) + " exceeds maximum allowed value "
                    + std::to_string(domain::SnowflakeId::MAX_WORKER_ID)
            );
        }
        std::cout << "[SnowflakeIdGenerator] Created, workerId=" << workerId_ << std::endl;
    }

    domain::SnowflakeId generateId() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::int64_t timestamp = clock_->nowMillis();

        if (timestamp < lastTimestamp_) {
            throw domain::IdGeneratorError(
                domain::IdGeneratorErrorCode::CLOCK_REGRESSION,
                "Clock moved backwards by " + std::to_string(lastTimestamp_ - timestamp) + "ms"
            );
        }

        if (timestamp == lastTimestamp_) {
            sequence_ = (sequence_ + 1) & domain::SnowflakeId::MAX_SEQUENCE;
            if (sequence_ == 0) {
                timestamp = waitNextMillis(lastTimestamp_);
            }
        } else {
            sequence_ = 0;
        }

        lastTimestamp_ = timestamp;
        return domain::SnowflakeId::compose(timestamp, workerId_, sequence_);
    }

    std::uint32_t getWorkerId() const {
        return workerId_;
    }

    /**
     * @brief Разобрать ID на компоненты (чистая функция)
     */
    static domain::SnowflakeComponents decodeId(const domain::SnowflakeId& id) {
        return {id.timestampMillis(), id.workerId(), id.sequence()};
    }

    /**
     * @throws std::invalid_argument если строка не является 64-битным числом
     */
    static domain::SnowflakeComponents decodeId(const std::string& id) {
        return decodeId(domain::SnowflakeId::fromString(id));
    }

    /**
     * @brief Детерминированный workerId из "{hostname}:{pid}"
     *
     * SHA-256, первые 4 байта big-endian, маска на 10 бит.
     * Стабилен между рестартами на одном хосте только при одинаковом pid,
     * от коллизий между хостами защищает слабо.
     */
    static std::uint32_t deriveWorkerId() {
        char hostname[256] = {0};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        std::string identifier = std::string(hostname) + ":" + std::to_string(getpid());
        auto digest = utils::Crypto::sha256(identifier);

        std::uint32_t prefix = (static_cast<std::uint32_t>(digest[0]) << 24)
                             | (static_cast<std::uint32_t>(digest[1]) << 16)
                             | (static_cast<std::uint32_t>(digest[2]) << 8)
                             | static_cast<std::uint32_t>(digest[3]);
        return prefix & domain::SnowflakeId::MAX_WORKER_ID;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    const std::uint32_t workerId_;

    std::mutex mutex_;
    std::uint32_t sequence_ = 0;
    std::int64_t lastTimestamp_ = -1;

    // Активное ожидание без sleep: обычно меньше миллисекунды
    std::int64_t waitNextMillis(std::int64_t last) const {
        std::int64_t now = clock_->nowMillis();
        while (now <= last) {
            now = clock_->nowMillis();
        }
        return now;
    }
};

} // namespace session::application
