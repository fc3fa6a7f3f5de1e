#pragma once

#include "settings/IGeoClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace session::settings {

/**
 * @brief Адрес сервиса геолокации (ip-api.com-совместимый)
 *
 * Читает из ENV:
 * - GEO_SERVICE_HOST (default: ip-api.com)
 * - GEO_SERVICE_PORT (default: 80)
 * - GEO_TIMEOUT_MS (default: 3000)
 * - GEO_MAX_IN_FLIGHT (default: 16)
 */
class GeoClientSettings : public IGeoClientSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("GEO_SERVICE_HOST");
        return host ? host : "ip-api.com";
    }

    int getPort() const override {
        const char* port = std::getenv("GEO_SERVICE_PORT");
        return port ? std::stoi(port) : 80;
    }

    int getTimeoutMs() const override {
        const char* timeout = std::getenv("GEO_TIMEOUT_MS");
        return timeout ? std::stoi(timeout) : 3000;
    }

    int getMaxInFlight() const override {
        const char* maxInFlight = std::getenv("GEO_MAX_IN_FLIGHT");
        return maxInFlight ? std::stoi(maxInFlight) : 16;
    }
};

} // namespace session::settings
