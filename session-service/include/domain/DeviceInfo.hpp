#pragma once

#include "domain/enums/DeviceType.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace session::domain {

/**
 * @brief Местоположение клиента (урезанная IpGeolocation)
 */
struct Location {
    std::string country;
    std::string city;
    std::string timezone;
};

/**
 * @brief Информация об устройстве клиента
 *
 * До обогащения заполнены только userAgent и ip.
 * DeviceEnricher дописывает location и deviceType.
 */
struct DeviceInfo {
    std::string userAgent;
    std::string ip;
    std::optional<Location> location;
    DeviceType deviceType = DeviceType::UNKNOWN;

    DeviceInfo() = default;

    DeviceInfo(const std::string& userAgent, const std::string& ip)
        : userAgent(userAgent)
        , ip(ip)
    {}
};

// ============================================
// JSON (имена полей — camelCase, как в токене)
// ============================================

inline void to_json(nlohmann::json& j, const Location& loc) {
    j = nlohmann::json{
        {"country", loc.country},
        {"city", loc.city},
        {"timezone", loc.timezone}
    };
}

inline void from_json(const nlohmann::json& j, Location& loc) {
    loc.country = j.value("country", "");
    loc.city = j.value("city", "");
    loc.timezone = j.value("timezone", "");
}

inline void to_json(nlohmann::json& j, const DeviceInfo& info) {
    j = nlohmann::json{
        {"userAgent", info.userAgent},
        {"ip", info.ip},
        {"deviceType", toString(info.deviceType)}
    };
    if (info.location) {
        j["location"] = *info.location;
    }
}

inline void from_json(const nlohmann::json& j, DeviceInfo& info) {
    info.userAgent = j.value("userAgent", "");
    info.ip = j.value("ip", "");
    info.deviceType = deviceTypeFromString(j.value("deviceType", "unknown"));
    if (j.contains("location") && j["location"].is_object()) {
        info.location = j["location"].get<Location>();
    } else {
        info.location.reset();
    }
}

} // namespace session::domain
