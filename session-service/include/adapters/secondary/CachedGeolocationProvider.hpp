#pragma once

#include "ports/output/IGeolocationProvider.hpp"
#include "adapters/secondary/HttpGeolocationProvider.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace session::adapters::secondary {

/**
 * @brief Декоратор IGeolocationProvider с LRU кэшированием
 *
 * ip -> IpGeolocation, TTL из CacheSettings (по умолчанию 24 часа).
 * Кэшируются только успешные ответы: после отказа сервиса
 * следующий запрос того же IP снова идёт в сеть.
 */
class CachedGeolocationProvider : public ports::output::IGeolocationProvider {
public:
    CachedGeolocationProvider(
        std::shared_ptr<HttpGeolocationProvider> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    std::optional<domain::IpGeolocation> lookup(const std::string& ip) override {
        auto cached = geoCache_->get(ip);
        if (cached) {
            return *cached;
        }

        auto geo = delegate_->lookup(ip);
        if (geo) {
            geoCache_->put(ip, *geo);
        }

        return geo;
    }

    void clearCache() {
        geoCache_->clear();
    }

    size_t getCacheSize() const {
        return geoCache_->size();
    }

private:
    void initCache() {
        size_t cacheSize = cacheSettings_->getGeoCacheSize();
        int ttlSeconds = cacheSettings_->getGeoTtlSeconds();

        auto base = std::make_unique<Cache<std::string, domain::IpGeolocation>>(
            cacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        geoCache_ = std::make_unique<ThreadSafeCache<std::string, domain::IpGeolocation>>(
            std::move(base)
        );

        std::cout << "[CachedGeolocationProvider] Created with geoCache="
                  << cacheSize << "/" << ttlSeconds << "s" << std::endl;
    }

    std::shared_ptr<HttpGeolocationProvider> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ICache<std::string, domain::IpGeolocation>> geoCache_;
};

} // namespace session::adapters::secondary
