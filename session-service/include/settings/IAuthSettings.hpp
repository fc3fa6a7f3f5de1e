#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace session::settings {

/**
 * @brief Параметры жизненного цикла сессий и токенов
 *
 * Все длительности — в секундах.
 */
class IAuthSettings {
public:
    virtual ~IAuthSettings() = default;

    virtual std::int64_t getAccessTokenExpiry() const = 0;
    virtual std::int64_t getRefreshTokenExpiry() const = 0;
    virtual std::int64_t getRememberMeExpiry() const = 0;

    /// 0 — без ограничения
    virtual int getMaxSessionsPerUser() const = 0;

    /// Порог простоя для cleanupSessions()
    virtual std::int64_t getSessionIdleTimeout() const = 0;

    /// Отзывать старую сессию при refresh
    virtual bool isRefreshRotationEnabled() const = 0;

    virtual std::string getTokenSecret() const = 0;

    /// Зарезервировано: TotpService работает с секретом пользователя из запроса
    virtual std::string getTotpSecret() const = 0;

    /// std::nullopt — вычислить из hostname:pid
    virtual std::optional<std::uint32_t> getWorkerId() const = 0;
};

} // namespace session::settings
