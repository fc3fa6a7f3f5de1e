// include/SessionApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/AuthSettings.hpp"
#include "settings/GeoClientSettings.hpp"
#include "settings/CacheSettings.hpp"

// Ports
#include "ports/input/ISessionService.hpp"
#include "ports/input/ITotpService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IIdGenerator.hpp"
#include "ports/output/ITokenCodec.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IGeolocationProvider.hpp"

// Application
#include "application/SnowflakeIdGenerator.hpp"
#include "application/DeviceEnricher.hpp"
#include "application/SessionService.hpp"
#include "application/TotpService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/HmacTokenCodec.hpp"
#include "adapters/secondary/InMemorySessionRepository.hpp"
#include "adapters/secondary/HttpGeolocationProvider.hpp"
#include "adapters/secondary/CachedGeolocationProvider.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CreateSessionHandler.hpp"
#include "adapters/primary/ValidateTokenHandler.hpp"
#include "adapters/primary/RefreshTokenHandler.hpp"
#include "adapters/primary/RevokeSessionHandler.hpp"
#include "adapters/primary/RevokeUserSessionsHandler.hpp"
#include "adapters/primary/CleanupSessionsHandler.hpp"
#include "adapters/primary/TotpHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace session {

/**
 * @brief Session Service Application
 *
 * Выдаёт и проверяет токены, хранит сессии в памяти процесса.
 * HTTP: /api/v1/sessions/*, /api/v1/totp/*
 */
class SessionApp : public BoostBeastApplication {
public:
    SessionApp() { std::cout << "[SessionApp] Initializing..." << std::endl; }
    ~SessionApp() override { std::cout << "[SessionApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[SessionApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[SessionApp] Configuring DI..." << std::endl;

        // Шаг 1: компоненты, которым нужны значения из настроек (workerId, секрет).
        // Boost.DI не умеет прокидывать скаляры, поэтому собираем вручную.
        auto authSettings = std::make_shared<settings::AuthSettings>();
        auto clock = std::make_shared<adapters::secondary::SystemClock>();
        auto idGenerator = std::make_shared<application::SnowflakeIdGenerator>(
            clock, authSettings->getWorkerId());
        auto tokenCodec = std::make_shared<adapters::secondary::HmacTokenCodec>(
            authSettings->getTokenSecret());

        // Шаг 2: основной injector
        auto injector = di::make_injector(
            di::bind<settings::IAuthSettings>().to(authSettings),
            di::bind<settings::IGeoClientSettings>().to(std::make_shared<settings::GeoClientSettings>()),
            // instance binding: у CacheSettings два конструктора
            di::bind<settings::CacheSettings>().to(std::make_shared<settings::CacheSettings>()),

            di::bind<ports::output::IClock>().to(clock),
            di::bind<ports::output::IIdGenerator>().to(idGenerator),
            di::bind<ports::output::ITokenCodec>().to(tokenCodec),
            di::bind<ports::output::ISessionRepository>()
                .to<adapters::secondary::InMemorySessionRepository>()
                .in(di::singleton),

            di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
            di::bind<adapters::secondary::HttpGeolocationProvider>().in(di::singleton),
            di::bind<ports::output::IGeolocationProvider>()
                .to<adapters::secondary::CachedGeolocationProvider>()
                .in(di::singleton),

            di::bind<application::DeviceEnricher>().in(di::singleton),
            di::bind<ports::input::ISessionService>().to<application::SessionService>().in(di::singleton),
            di::bind<ports::input::ITotpService>().to<application::TotpService>().in(di::singleton)
        );

        // Шаг 3: HTTP handlers
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            handlers_[getHandlerKey("GET", "/health")] = handler;
        }
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::CreateSessionHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/sessions")] = handler;
        }
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ValidateTokenHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/sessions/validate")] = handler;
        }
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RefreshTokenHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/sessions/refresh")] = handler;
        }
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RevokeUserSessionsHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/sessions/revoke-user")] = handler;
        }
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::CleanupSessionsHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/sessions/cleanup")] = handler;
        }
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RevokeSessionHandler>>();
            handlers_[getHandlerKey("DELETE", "/api/v1/sessions/*")] = handler;
        }
        {
            // Один handler на все маршруты TOTP
            auto handler = injector.create<std::shared_ptr<adapters::primary::TotpHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/totp/secret")] = handler;
            handlers_[getHandlerKey("POST", "/api/v1/totp/verify")] = handler;
            handlers_[getHandlerKey("POST", "/api/v1/totp/backup-codes")] = handler;
            handlers_[getHandlerKey("POST", "/api/v1/totp/backup-codes/verify")] = handler;
        }

        std::cout << "[SessionApp] DI configured, " << handlers_.size() << " routes registered" << std::endl;
    }
};

} // namespace session
