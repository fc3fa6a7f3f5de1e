#pragma once

#include <cstdlib>
#include <string>

namespace session::settings {

/**
 * @brief Настройки кэша геолокации
 *
 * Читает из ENV:
 * - GEO_CACHE_SIZE (default: 10000)
 * - GEO_CACHE_TTL_SECONDS (default: 86400 — 24 часа)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("GEO_CACHE_SIZE")) {
            geoCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("GEO_CACHE_TTL_SECONDS")) {
            geoTtlSeconds_ = std::stoi(val);
        }
    }

    CacheSettings(size_t geoCacheSize, int geoTtlSeconds)
        : geoCacheSize_(geoCacheSize)
        , geoTtlSeconds_(geoTtlSeconds)
    {}

    size_t getGeoCacheSize() const { return geoCacheSize_; }
    int getGeoTtlSeconds() const { return geoTtlSeconds_; }

private:
    size_t geoCacheSize_ = 10000;
    int geoTtlSeconds_ = 86400;
};

} // namespace session::settings
