#pragma once

#include <stdexcept>
#include <string>

namespace session::domain {

/**
 * @brief Коды ошибок токенов и сессий
 *
 * Все ошибки восстановимы на стороне клиента: нужна повторная аутентификация.
 */
enum class AuthErrorCode {
    TOKEN_SECRET_NOT_CONFIGURED,
    INVALID_TOKEN_FORMAT,
    INVALID_TOKEN_SIGNATURE,
    TOKEN_PAYLOAD_CORRUPT,
    TOKEN_EXPIRED,
    REFRESH_TOKEN_EXPIRED,
    INVALID_TOKEN,
    INVALID_REFRESH_TOKEN,
    SESSION_NOT_FOUND
};

/**
 * @brief Машиночитаемый код для API
 */
inline std::string toString(AuthErrorCode code) {
    switch (code) {
        case AuthErrorCode::TOKEN_SECRET_NOT_CONFIGURED: return "TOKEN_SECRET_NOT_CONFIGURED";
        case AuthErrorCode::INVALID_TOKEN_FORMAT:        return "INVALID_TOKEN_FORMAT";
        case AuthErrorCode::INVALID_TOKEN_SIGNATURE:     return "INVALID_TOKEN_SIGNATURE";
        case AuthErrorCode::TOKEN_PAYLOAD_CORRUPT:       return "TOKEN_PAYLOAD_CORRUPT";
        case AuthErrorCode::TOKEN_EXPIRED:               return "TOKEN_EXPIRED";
        case AuthErrorCode::REFRESH_TOKEN_EXPIRED:       return "REFRESH_TOKEN_EXPIRED";
        case AuthErrorCode::INVALID_TOKEN:               return "INVALID_TOKEN";
        case AuthErrorCode::INVALID_REFRESH_TOKEN:       return "INVALID_REFRESH_TOKEN";
        case AuthErrorCode::SESSION_NOT_FOUND:           return "SESSION_NOT_FOUND";
    }
    return "AUTH_ERROR";
}

/**
 * @brief Ошибка токена или сессии
 *
 * Клиенты ветвятся по code(), а не по тексту сообщения.
 */
class AuthError : public std::runtime_error {
public:
    AuthError(AuthErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    AuthErrorCode code() const { return code_; }

private:
    AuthErrorCode code_;
};

} // namespace session::domain
