#pragma once

#include <string>
#include <stdexcept>

namespace session::domain {

/**
 * @brief Класс устройства, определённый по User-Agent
 */
enum class DeviceType {
    MOBILE,
    TABLET,
    DESKTOP,
    UNKNOWN
};

/**
 * @brief Преобразовать DeviceType в строку (формат токена)
 */
inline std::string toString(DeviceType type) {
    switch (type) {
        case DeviceType::MOBILE:  return "mobile";
        case DeviceType::TABLET:  return "tablet";
        case DeviceType::DESKTOP: return "desktop";
        case DeviceType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Создать DeviceType из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline DeviceType deviceTypeFromString(const std::string& str) {
    if (str == "mobile")  return DeviceType::MOBILE;
    if (str == "tablet")  return DeviceType::TABLET;
    if (str == "desktop") return DeviceType::DESKTOP;
    if (str == "unknown") return DeviceType::UNKNOWN;
    throw std::invalid_argument("Unknown DeviceType: " + str);
}

} // namespace session::domain
