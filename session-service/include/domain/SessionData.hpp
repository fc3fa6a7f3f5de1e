#pragma once

#include "domain/DeviceInfo.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace session::domain {

/**
 * @brief Серверная запись сессии
 *
 * Принадлежит таблице сессий SessionService.
 * Состояния: активна (есть в таблице) → отозвана (удалена). Других нет.
 *
 * Время — Unix-секунды.
 */
struct SessionData {
    std::string userId;
    DeviceInfo deviceInfo;
    bool isRememberMe = false;
    std::int64_t lastActivity = 0;
    std::int64_t createdAt = 0;
    std::vector<std::string> roles;
    std::vector<std::string> permissions;

    /**
     * @brief Простаивает ли сессия дольше idleTimeoutSeconds
     */
    bool isIdle(std::int64_t nowSeconds, std::int64_t idleTimeoutSeconds) const {
        return nowSeconds - lastActivity > idleTimeoutSeconds;
    }
};

} // namespace session::domain
