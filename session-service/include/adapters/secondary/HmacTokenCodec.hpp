#pragma once

#include "ports/output/ITokenCodec.hpp"
#include "domain/errors/AuthError.hpp"
#include "utils/Base64.hpp"
#include "utils/Crypto.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace session::adapters::secondary {

/**
 * @brief Токены вида payload.signature на HMAC-SHA256
 *
 * Намеренно минимальный формат, не JWT:
 *   payload   = base64url(JSON(data))
 *   signature = base64url(HMAC-SHA256(secret, payload))
 *
 * Подпись сравнивается за постоянное время (CRYPTO_memcmp) по
 * base64url-строкам, поэтому изменение любого символа подписи
 * (включая младшие биты последнего) делает токен невалидным.
 */
class HmacTokenCodec : public ports::output::ITokenCodec {
public:
    explicit HmacTokenCodec(std::string secret)
        : secret_(std::move(secret))
    {}

    std::string sign(const std::string& payload) const override {
        return utils::Base64::encodeUrl(utils::Crypto::hmacSha256(secret_, payload));
    }

    std::string generateToken(const nlohmann::json& data) const override {
        requireSecret();

        // Невалидный UTF-8 (например, из User-Agent) заменяется, а не роняет выпуск токена
        std::string payload = utils::Base64::encodeUrl(
            data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return payload + "." + sign(payload);
    }

    nlohmann::json verifyToken(const std::string& token) const override {
        requireSecret();

        size_t dot = token.find('.');
        if (dot == std::string::npos || token.find('.', dot + 1) != std::string::npos) {
            throw domain::AuthError(domain::AuthErrorCode::INVALID_TOKEN_FORMAT, "Invalid token format");
        }

        std::string payload = token.substr(0, dot);
        std::string signature = token.substr(dot + 1);

        if (!utils::Crypto::constantTimeEquals(signature, sign(payload))) {
            throw domain::AuthError(domain::AuthErrorCode::INVALID_TOKEN_SIGNATURE, "Invalid token signature");
        }

        auto json = utils::Base64::decodeUrl(payload);
        if (!json) {
            throw domain::AuthError(domain::AuthErrorCode::TOKEN_PAYLOAD_CORRUPT, "Failed to decode token payload");
        }

        try {
            return nlohmann::json::parse(*json);
        } catch (const nlohmann::json::parse_error&) {
            throw domain::AuthError(domain::AuthErrorCode::TOKEN_PAYLOAD_CORRUPT, "Failed to decode token payload");
        }
    }

private:
    std::string secret_;

    void requireSecret() const {
        if (secret_.empty()) {
            throw domain::AuthError(domain::AuthErrorCode::TOKEN_SECRET_NOT_CONFIGURED, "Token secret not configured");
        }
    }
};

} // namespace session::adapters::secondary
