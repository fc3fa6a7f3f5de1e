#pragma once

#include "domain/IpGeolocation.hpp"
#include <optional>
#include <string>

namespace session::ports::output {

/**
 * @brief Внешний сервис геолокации по IP
 */
class IGeolocationProvider {
public:
    virtual ~IGeolocationProvider() = default;

    /**
     * @brief Найти местоположение IP
     * @return std::nullopt при любой ошибке (мягкий отказ, никогда не бросает)
     */
    virtual std::optional<domain::IpGeolocation> lookup(const std::string& ip) = 0;
};

} // namespace session::ports::output
