#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace session::ports::output {

/**
 * @brief Кодек подписанных токенов
 *
 * Формат: base64url(JSON(payload)) + "." + base64url(HMAC-SHA256(secret, payload))
 * Секрет задаётся при создании реализации.
 */
class ITokenCodec {
public:
    virtual ~ITokenCodec() = default;

    /**
     * @brief Подписать сериализованный payload
     * @param payload base64url-сегмент токена
     * @return base64url подписи
     */
    virtual std::string sign(const std::string& payload) const = 0;

    /**
     * @brief Выпустить токен
     * @throws domain::AuthError TOKEN_SECRET_NOT_CONFIGURED
     */
    virtual std::string generateToken(const nlohmann::json& data) const = 0;

    /**
     * @brief Проверить подпись и вернуть payload
     * @throws domain::AuthError TOKEN_SECRET_NOT_CONFIGURED, INVALID_TOKEN_FORMAT,
     *         INVALID_TOKEN_SIGNATURE, TOKEN_PAYLOAD_CORRUPT
     */
    virtual nlohmann::json verifyToken(const std::string& token) const = 0;
};

} // namespace session::ports::output
