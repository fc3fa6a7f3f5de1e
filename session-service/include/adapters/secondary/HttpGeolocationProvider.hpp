#pragma once

#include "ports/output/IGeolocationProvider.hpp"
#include "settings/IGeoClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <boost/asio/ip/address.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

namespace session::adapters::secondary {

/**
 * @brief HTTP клиент к сервису геолокации (ip-api.com)
 *
 * GET /json/{ip} → {status, query, country, city, timezone, lat, lon, isp, as}
 *
 * Любой отказ — мягкий: не-200, status != "success", битый JSON,
 * исключение транспорта или превышение таймаута → std::nullopt.
 *
 * Запрос выполняется в отдельном потоке и ожидается с дедлайном
 * getTimeoutMs(). Зависший запрос дорабатывает в фоне, его результат
 * отбрасывается. Одновременно в фоне не больше getMaxInFlight() запросов,
 * сверх лимита lookup сразу отвечает std::nullopt.
 *
 * IP разбирается boost::asio::ip::make_address; в путь запроса попадает
 * только каноническая запись адреса.
 */
class HttpGeolocationProvider : public ports::output::IGeolocationProvider {
public:
    HttpGeolocationProvider(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IGeoClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
      , inFlight_(std::make_shared<std::atomic<int>>(0))
    {
        std::cout << "[HttpGeolocationProvider] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " timeout=" << settings_->getTimeoutMs() << "ms"
                  << " maxInFlight=" << settings_->getMaxInFlight() << std::endl;
    }

    std::optional<domain::IpGeolocation> lookup(const std::string& ip) override {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(ip, ec);
        if (ec) {
            std::cerr << "[HttpGeolocationProvider] lookup skipped: malformed IP" << std::endl;
            return std::nullopt;
        }

        auto slot = tryAcquireSlot();
        if (!slot) {
            std::cerr << "[HttpGeolocationProvider] lookup " << ip << " skipped: "
                      << settings_->getMaxInFlight() << " requests already in flight" << std::endl;
            return std::nullopt;
        }

        try {
            auto response = fetchWithTimeout("/json/" + address.to_string(), std::move(slot));
            if (!response) {
                std::cerr << "[HttpGeolocationProvider] lookup " << ip << " timed out after "
                          << settings_->getTimeoutMs() << "ms" << std::endl;
                return std::nullopt;
            }

            if (response->status != 200) {
                std::cerr << "[HttpGeolocationProvider] lookup " << ip << " failed: HTTP "
                          << response->status << std::endl;
                return std::nullopt;
            }

            auto json = nlohmann::json::parse(response->body);
            if (json.value("status", "") != "success") {
                std::cerr << "[HttpGeolocationProvider] lookup " << ip << " rejected: "
                          << json.value("message", "unknown reason") << std::endl;
                return std::nullopt;
            }

            return parseGeolocation(json, ip);
        } catch (const std::exception& e) {
            std::cerr << "[HttpGeolocationProvider] lookup " << ip << " error: " << e.what() << std::endl;
        }

        return std::nullopt;
    }

    /// Запросы, ещё не вернувшиеся из IHttpClient::send
    int getInFlight() const {
        return inFlight_->load();
    }

private:
    struct RawResponse {
        int status = 0;
        std::string body;
    };

    /**
     * @brief Занятый слот фонового запроса, освобождается в деструкторе
     */
    struct InFlightSlot {
        std::shared_ptr<std::atomic<int>> counter;

        explicit InFlightSlot(std::shared_ptr<std::atomic<int>> c) : counter(std::move(c)) {}
        ~InFlightSlot() { counter->fetch_sub(1); }
    };

    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IGeoClientSettings> settings_;
    std::shared_ptr<std::atomic<int>> inFlight_;

    std::shared_ptr<InFlightSlot> tryAcquireSlot() {
        if (inFlight_->fetch_add(1) >= settings_->getMaxInFlight()) {
            inFlight_->fetch_sub(1);
            return nullptr;
        }
        return std::make_shared<InFlightSlot>(inFlight_);
    }

    /**
     * @param slot живёт вместе с задачей: до выхода из send или до отказа запуска потока
     * @return std::nullopt при таймауте
     * @throws исключение транспорта, если запрос упал до дедлайна
     */
    std::optional<RawResponse> fetchWithTimeout(const std::string& path, std::shared_ptr<InFlightSlot> slot) {
        auto client = httpClient_;
        auto host = settings_->getHost();
        auto port = settings_->getPort();

        std::packaged_task<RawResponse()> task([client, path, host, port, slot = std::move(slot)]() {
            SimpleRequest request(
                "GET",
                path,
                "",
                host,
                port,
                {{"Accept", "application/json"}}
            );

            SimpleResponse response;
            if (!client->send(request, response)) {
                throw std::runtime_error("transport error");
            }
            return RawResponse{response.getStatus(), response.getBody()};
        });

        auto future = task.get_future();
        std::thread(std::move(task)).detach();

        if (future.wait_for(std::chrono::milliseconds(settings_->getTimeoutMs())) != std::future_status::ready) {
            return std::nullopt;
        }
        return future.get();
    }

    static domain::IpGeolocation parseGeolocation(const nlohmann::json& j, const std::string& ip) {
        domain::IpGeolocation geo;
        geo.ip = j.value("query", ip);
        geo.country = j.value("country", "");
        geo.city = j.value("city", "");
        geo.timezone = j.value("timezone", "");
        geo.latitude = j.value("lat", 0.0);
        geo.longitude = j.value("lon", 0.0);
        geo.isp = j.value("isp", "");
        geo.asn = j.value("as", "");
        return geo;
    }
};

} // namespace session::adapters::secondary
