#pragma once

#include "domain/DeviceInfo.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace session::domain {

/**
 * @brief Полезная нагрузка access/refresh токена
 *
 * Подписывается целиком. exp и iat — Unix-секунды.
 * sessionId — десятичная строка Snowflake ID.
 */
struct TokenData {
    std::string sessionId;
    std::string userId;
    std::vector<std::string> roles;
    std::vector<std::string> permissions;
    DeviceInfo deviceInfo;
    bool isRememberMe = false;
    std::int64_t exp = 0;
    std::int64_t iat = 0;

    bool isExpiredAt(std::int64_t nowSeconds) const {
        return exp < nowSeconds;
    }
};

inline void to_json(nlohmann::json& j, const TokenData& data) {
    j = nlohmann::json{
        {"sessionId", data.sessionId},
        {"userId", data.userId},
        {"roles", data.roles},
        {"permissions", data.permissions},
        {"deviceInfo", data.deviceInfo},
        {"isRememberMe", data.isRememberMe},
        {"exp", data.exp},
        {"iat", data.iat}
    };
}

/**
 * @throws nlohmann::json::exception если обязательных полей нет или типы не совпадают
 */
inline void from_json(const nlohmann::json& j, TokenData& data) {
    j.at("sessionId").get_to(data.sessionId);
    j.at("userId").get_to(data.userId);
    data.roles = j.value("roles", std::vector<std::string>{});
    data.permissions = j.value("permissions", std::vector<std::string>{});
    data.deviceInfo = j.value("deviceInfo", DeviceInfo{});
    data.isRememberMe = j.value("isRememberMe", false);
    j.at("exp").get_to(data.exp);
    j.at("iat").get_to(data.iat);
}

} // namespace session::domain
