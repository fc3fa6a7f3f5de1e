#pragma once

#include "settings/IAuthSettings.hpp"
#include "utils/Crypto.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

namespace session::settings {

/**
 * @brief Настройки Session Service из ENV
 *
 * Читает:
 * - AUTH_ACCESS_TOKEN_EXPIRY (default: 900 — 15 минут)
 * - AUTH_REFRESH_TOKEN_EXPIRY (default: 604800 — 7 дней)
 * - AUTH_REMEMBER_ME_EXPIRY (default: 2592000 — 30 дней)
 * - AUTH_MAX_SESSIONS_PER_USER (default: 5)
 * - AUTH_SESSION_IDLE_TIMEOUT (default: 2592000 — 30 дней)
 * - AUTH_REFRESH_ROTATION (default: false)
 * - AUTH_TOKEN_SECRET (default: случайный на время жизни процесса)
 * - AUTH_TOTP_SECRET (default: пусто; секреты TOTP приходят от вызывающего)
 * - AUTH_WORKER_ID (default: хэш hostname:pid)
 *
 * @warning Без AUTH_TOKEN_SECRET все токены теряют силу при рестарте.
 */
class AuthSettings : public IAuthSettings {
public:
    AuthSettings() {
        accessTokenExpiry_ = std::stoll(getEnvOrDefault("AUTH_ACCESS_TOKEN_EXPIRY", "900"));
        refreshTokenExpiry_ = std::stoll(getEnvOrDefault("AUTH_REFRESH_TOKEN_EXPIRY", "604800"));
        rememberMeExpiry_ = std::stoll(getEnvOrDefault("AUTH_REMEMBER_ME_EXPIRY", "2592000"));
        maxSessionsPerUser_ = std::stoi(getEnvOrDefault("AUTH_MAX_SESSIONS_PER_USER", "5"));
        sessionIdleTimeout_ = std::stoll(getEnvOrDefault("AUTH_SESSION_IDLE_TIMEOUT", "2592000"));

        std::string rotation = getEnvOrDefault("AUTH_REFRESH_ROTATION", "false");
        refreshRotation_ = (rotation == "true" || rotation == "1");

        tokenSecret_ = secretOrRandom("AUTH_TOKEN_SECRET");
        totpSecret_ = getEnvOrDefault("AUTH_TOTP_SECRET", "");

        if (const char* workerId = std::getenv("AUTH_WORKER_ID")) {
            workerId_ = static_cast<std::uint32_t>(std::stoul(workerId));
        }

        std::cout << "[AuthSettings] accessTokenExpiry=" << accessTokenExpiry_ << "s"
                  << " refreshTokenExpiry=" << refreshTokenExpiry_ << "s"
                  << " rememberMeExpiry=" << rememberMeExpiry_ << "s"
                  << " maxSessionsPerUser=" << maxSessionsPerUser_
                  << " refreshRotation=" << (refreshRotation_ ? "on" : "off")
                  << std::endl;
    }

    std::int64_t getAccessTokenExpiry() const override { return accessTokenExpiry_; }
    std::int64_t getRefreshTokenExpiry() const override { return refreshTokenExpiry_; }
    std::int64_t getRememberMeExpiry() const override { return rememberMeExpiry_; }
    int getMaxSessionsPerUser() const override { return maxSessionsPerUser_; }
    std::int64_t getSessionIdleTimeout() const override { return sessionIdleTimeout_; }
    bool isRefreshRotationEnabled() const override { return refreshRotation_; }
    std::string getTokenSecret() const override { return tokenSecret_; }
    std::string getTotpSecret() const override { return totpSecret_; }
    std::optional<std::uint32_t> getWorkerId() const override { return workerId_; }

private:
    std::int64_t accessTokenExpiry_;
    std::int64_t refreshTokenExpiry_;
    std::int64_t rememberMeExpiry_;
    int maxSessionsPerUser_;
    std::int64_t sessionIdleTimeout_;
    bool refreshRotation_;
    std::string tokenSecret_;
    std::string totpSecret_;
    std::optional<std::uint32_t> workerId_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string secretOrRandom(const char* name) {
        const char* value = std::getenv(name);
        if (value && *value) {
            return value;
        }
        std::cerr << "[AuthSettings] WARNING: " << name << " is not set, using a random secret."
                  << " Issued tokens will not survive a restart. Do not run like this in production."
                  << std::endl;
        return utils::Crypto::toHex(utils::Crypto::randomBytes(32));
    }
};

} // namespace session::settings
