#pragma once

#include "domain/DeviceInfo.hpp"
#include "domain/SessionData.hpp"
#include "domain/TokenData.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace session::ports::input {

/**
 * @brief Запрос на создание сессии
 *
 * В deviceInfo достаточно userAgent и ip, остальное дополнит сервис.
 */
struct CreateSessionRequest {
    std::string userId;
    domain::DeviceInfo deviceInfo;
    bool isRememberMe = false;
    std::vector<std::string> roles;
    std::vector<std::string> permissions;
};

/**
 * @brief Пара токенов
 *
 * expiresIn — время жизни access token в секундах.
 */
struct TokenPair {
    std::string accessToken;
    std::string refreshToken;
    std::int64_t expiresIn = 0;
};

/**
 * @brief Интерфейс управления сессиями
 *
 * Ошибки токенов и сессий — domain::AuthError.
 */
class ISessionService {
public:
    using SessionEntry = std::pair<std::string, domain::SessionData>;

    virtual ~ISessionService() = default;

    virtual TokenPair createSession(const CreateSessionRequest& request) = 0;

    /**
     * @throws domain::AuthError INVALID_TOKEN, TOKEN_EXPIRED, SESSION_NOT_FOUND
     */
    virtual domain::TokenData validateAccessToken(const std::string& token) = 0;

    /**
     * @brief Новая пара токенов по refresh token (новый sessionId)
     * @throws domain::AuthError INVALID_REFRESH_TOKEN, REFRESH_TOKEN_EXPIRED, SESSION_NOT_FOUND
     */
    virtual TokenPair refreshAccessToken(const std::string& refreshToken) = 0;

    /**
     * @brief Отозвать сессию (идемпотентно)
     */
    virtual void revokeSession(const std::string& sessionId, const std::string& reason = "user_logout") = 0;

    /**
     * @return Количество отозванных сессий
     */
    virtual size_t revokeUserSessions(const std::string& userId, const std::string& reason = "security_breach") = 0;

    /**
     * @brief Удалить простаивающие сессии
     * @return Количество удалённых
     */
    virtual size_t cleanupSessions() = 0;

    virtual std::optional<domain::SessionData> getSession(const std::string& sessionId) = 0;
    virtual std::vector<SessionEntry> listUserSessions(const std::string& userId) = 0;
};

} // namespace session::ports::input
