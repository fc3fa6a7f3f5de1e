#pragma once

#include <string>

namespace session::domain {

/**
 * @brief Результат геолокации IP-адреса
 *
 * Поля соответствуют ответу ip-api.com:
 * query → ip, lat → latitude, lon → longitude, as → asn.
 */
struct IpGeolocation {
    std::string ip;
    std::string country;
    std::string city;
    std::string timezone;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string isp;
    std::string asn;

    /**
     * @brief Заглушка на случай недоступности сервиса геолокации
     *
     * Не кэшируется: при следующем запросе будет новая попытка.
     */
    static IpGeolocation unknown(const std::string& ip) {
        IpGeolocation geo;
        geo.ip = ip;
        geo.country = "Unknown";
        geo.city = "Unknown";
        geo.timezone = "UTC";
        geo.isp = "Unknown";
        geo.asn = "Unknown";
        return geo;
    }
};

} // namespace session::domain
