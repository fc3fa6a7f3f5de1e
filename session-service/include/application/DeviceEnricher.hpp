#pragma once

#include "ports/output/IGeolocationProvider.hpp"
#include "domain/DeviceInfo.hpp"
#include "domain/IpGeolocation.hpp"
#include <cstddef>
#include <iostream>
#include <memory>
#include <regex>
#include <string>

namespace session::application {

/**
 * @brief Обогащение DeviceInfo: тип устройства + местоположение
 *
 * Порядок проверки типа важен: tablet → mobile → desktop → unknown.
 * Android без "mobi" — планшет, поэтому tablet проверяется первым.
 * Все шаблоны регистронезависимые.
 *
 * User-Agent обрезается до MAX_USER_AGENT_LENGTH: std::regex из libstdc++
 * рекурсивен по длине входа и на десятках килобайт переполняет стек.
 */
class DeviceEnricher {
public:
    static constexpr std::size_t MAX_USER_AGENT_LENGTH = 512;

    explicit DeviceEnricher(std::shared_ptr<ports::output::IGeolocationProvider> geoProvider)
        : geoProvider_(std::move(geoProvider))
    {}

    /**
     * @brief Собрать DeviceInfo по User-Agent и IP
     *
     * Не бросает: при отказе геолокации подставляется "Unknown"/"UTC".
     */
    domain::DeviceInfo enrich(const std::string& userAgent, const std::string& ip) {
        domain::DeviceInfo info(userAgent.substr(0, MAX_USER_AGENT_LENGTH), ip);
        info.deviceType = classifyDeviceType(info.userAgent);

        auto geo = geoProvider_->lookup(ip);
        if (!geo) {
            std::cerr << "[DeviceEnricher] Geolocation unavailable for " << ip
                      << ", using placeholder" << std::endl;
            geo = domain::IpGeolocation::unknown(ip);
        }

        info.location = domain::Location{geo->country, geo->city, geo->timezone};
        return info;
    }

    static domain::DeviceType classifyDeviceType(const std::string& userAgent) {
        // ECMAScript в std::regex не поддерживает lookbehind, но lookahead есть
        static const std::regex tablet(
            "(tablet|ipad|playbook|silk)|(android(?!.*mobi))",
            std::regex::ECMAScript | std::regex::icase);
        static const std::regex mobile(
            "Mobile|Android|iP(hone|od)|IEMobile|BlackBerry|Kindle|Silk-Accelerated|(hpw|web)OS|Opera M(obi|ini)",
            std::regex::ECMAScript | std::regex::icase);
        static const std::regex desktop(
            "(Macintosh|Windows NT|Linux|Ubuntu|X11)",
            std::regex::ECMAScript | std::regex::icase);

        const std::string head = userAgent.substr(0, MAX_USER_AGENT_LENGTH);

        if (std::regex_search(head, tablet)) return domain::DeviceType::TABLET;
        if (std::regex_search(head, mobile)) return domain::DeviceType::MOBILE;
        if (std::regex_search(head, desktop)) return domain::DeviceType::DESKTOP;
        return domain::DeviceType::UNKNOWN;
    }

private:
    std::shared_ptr<ports::output::IGeolocationProvider> geoProvider_;
};

} // namespace session::application
