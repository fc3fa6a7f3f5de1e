#pragma once

#include "ports/input/ISessionService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IIdGenerator.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/ITokenCodec.hpp"
#include "application/DeviceEnricher.hpp"
#include "settings/IAuthSettings.hpp"
#include "domain/errors/AuthError.hpp"
#include "domain/SnowflakeId.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace session::application {

/**
 * @brief Жизненный цикл сессий: создание, проверка, обновление, отзыв
 *
 * Сессия либо активна (есть в репозитории), либо отозвана (удалена).
 * Токены неизменяемы: refresh всегда выпускает новую пару с новым sessionId.
 *
 * Составные операции (проверка лимита + вставка, обход + удаление)
 * выполняются под mutex_. Геолокация — вне блокировки.
 */
class SessionService : public ports::input::ISessionService {
public:
    SessionService(
        std::shared_ptr<settings::IAuthSettings> settings,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IIdGenerator> idGenerator,
        std::shared_ptr<ports::output::ITokenCodec> tokenCodec,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<DeviceEnricher> deviceEnricher
    ) : settings_(std::move(settings))
      , clock_(std::move(clock))
      , idGenerator_(std::move(idGenerator))
      , tokenCodec_(std::move(tokenCodec))
      , sessionRepo_(std::move(sessionRepo))
      , deviceEnricher_(std::move(deviceEnricher))
    {
        std::cout << "[SessionService] Created" << std::endl;
    }

    ports::input::TokenPair createSession(const ports::input::CreateSessionRequest& request) override {
        auto deviceInfo = deviceEnricher_->enrich(
            request.deviceInfo.userAgent,
            request.deviceInfo.ip
        );

        std::lock_guard<std::mutex> lock(mutex_);
        return issueSession(request, deviceInfo);
    }

    domain::TokenData validateAccessToken(const std::string& token) override {
        auto tokenData = decode(token, domain::AuthErrorCode::INVALID_TOKEN, "Invalid token");

        if (tokenData.isExpiredAt(clock_->nowSeconds())) {
            throw domain::AuthError(domain::AuthErrorCode::TOKEN_EXPIRED, "Token expired");
        }

        if (!sessionRepo_->findById(tokenData.sessionId)) {
            throw domain::AuthError(domain::AuthErrorCode::SESSION_NOT_FOUND, "Session not found");
        }

        return tokenData;
    }

    ports::input::TokenPair refreshAccessToken(const std::string& refreshToken) override {
        auto tokenData = decode(refreshToken, domain::AuthErrorCode::INVALID_REFRESH_TOKEN, "Invalid refresh token");

        if (tokenData.isExpiredAt(clock_->nowSeconds())) {
            throw domain::AuthError(domain::AuthErrorCode::REFRESH_TOKEN_EXPIRED, "Refresh token expired");
        }

        auto session = sessionRepo_->findById(tokenData.sessionId);
        if (!session) {
            throw domain::AuthError(domain::AuthErrorCode::SESSION_NOT_FOUND, "Session not found");
        }

        ports::input::CreateSessionRequest request;
        request.userId = session->userId;
        request.isRememberMe = session->isRememberMe;
        request.roles = session->roles;
        request.permissions = session->permissions;

        auto deviceInfo = deviceEnricher_->enrich(session->deviceInfo.userAgent, session->deviceInfo.ip);

        std::lock_guard<std::mutex> lock(mutex_);

        if (!settings_->isRefreshRotationEnabled()) {
            return issueSession(request, deviceInfo);
        }

        // Refresh token одноразовый: выпускает пару только тот, кто удалил старую сессию
        if (!sessionRepo_->deleteById(tokenData.sessionId)) {
            throw domain::AuthError(domain::AuthErrorCode::SESSION_NOT_FOUND, "Session not found");
        }

        try {
            auto result = issueSession(request, deviceInfo);
            std::cout << "[SessionService] Session " << tokenData.sessionId << " revoked: rotated" << std::endl;
            return result;
        } catch (...) {
            sessionRepo_->save(tokenData.sessionId, *session);
            throw;
        }
    }

    void revokeSession(const std::string& sessionId, const std::string& reason = "user_logout") override {
        if (sessionRepo_->deleteById(sessionId)) {
            std::cout << "[SessionService] Session " << sessionId << " revoked: " << reason << std::endl;
        }
    }

    size_t revokeUserSessions(const std::string& userId, const std::string& reason = "security_breach") override {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t revoked = 0;
        for (const auto& [sessionId, session] : sessionRepo_->findByUserId(userId)) {
            if (sessionRepo_->deleteById(sessionId)) {
                ++revoked;
            }
        }

        std::cout << "[SessionService] Revoked " << revoked << " session(s) of user "
                  << userId << ": " << reason << std::endl;
        return revoked;
    }

    size_t cleanupSessions() override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::int64_t now = clock_->nowSeconds();
        std::int64_t idleTimeout = settings_->getSessionIdleTimeout();

        size_t removed = 0;
        for (const auto& [sessionId, session] : sessionRepo_->findAll()) {
            if (session.isIdle(now, idleTimeout)) {
                revokeSession(sessionId, "expired");
                ++removed;
            }
        }

        if (removed > 0) {
            std::cout << "[SessionService] Cleanup removed " << removed << " idle session(s)" << std::endl;
        }
        return removed;
    }

    std::optional<domain::SessionData> getSession(const std::string& sessionId) override {
        return sessionRepo_->findById(sessionId);
    }

    std::vector<SessionEntry> listUserSessions(const std::string& userId) override {
        return sessionRepo_->findByUserId(userId);
    }

private:
    std::shared_ptr<settings::IAuthSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IIdGenerator> idGenerator_;
    std::shared_ptr<ports::output::ITokenCodec> tokenCodec_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<DeviceEnricher> deviceEnricher_;

    std::mutex mutex_;

    /**
     * @brief Id, токены, лимит, запись в репозиторий. Вызывается под mutex_
     *
     * Сессия сохраняется только после успешного выпуска обоих токенов.
     */
    ports::input::TokenPair issueSession(
        const ports::input::CreateSessionRequest& request,
        const domain::DeviceInfo& deviceInfo
    ) {
        std::string sessionId = idGenerator_->generateId().toString();
        std::int64_t now = clock_->nowSeconds();

        std::int64_t expiresIn = request.isRememberMe
            ? settings_->getRememberMeExpiry()
            : settings_->getAccessTokenExpiry();

        domain::TokenData tokenData;
        tokenData.sessionId = sessionId;
        tokenData.userId = request.userId;
        tokenData.roles = request.roles;
        tokenData.permissions = request.permissions;
        tokenData.deviceInfo = deviceInfo;
        tokenData.isRememberMe = request.isRememberMe;
        tokenData.exp = now + expiresIn;
        tokenData.iat = now;

        ports::input::TokenPair result;
        result.accessToken = tokenCodec_->generateToken(tokenData);

        tokenData.exp = now + settings_->getRefreshTokenExpiry();
        result.refreshToken = tokenCodec_->generateToken(tokenData);
        result.expiresIn = expiresIn;

        enforceSessionLimit(request.userId);

        domain::SessionData session;
        session.userId = request.userId;
        session.deviceInfo = deviceInfo;
        session.isRememberMe = request.isRememberMe;
        session.lastActivity = now;
        session.createdAt = now;
        session.roles = request.roles;
        session.permissions = request.permissions;
        sessionRepo_->save(sessionId, session);

        std::cout << "[SessionService] Session " << sessionId << " created for user "
                  << request.userId << " (" << domain::toString(deviceInfo.deviceType) << ")" << std::endl;

        return result;
    }

    /**
     * @brief Ошибки кодека и разбора payload → AuthError с кодом failureCode
     */
    domain::TokenData decode(
        const std::string& token,
        domain::AuthErrorCode failureCode,
        const std::string& failureMessage
    ) const {
        try {
            return tokenCodec_->verifyToken(token).get<domain::TokenData>();
        } catch (const domain::AuthError& e) {
            std::cerr << "[SessionService] Token rejected: " << domain::toString(e.code()) << std::endl;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[SessionService] Token payload rejected: " << e.what() << std::endl;
        } catch (const std::invalid_argument& e) {
            // неизвестный deviceType
            std::cerr << "[SessionService] Token payload rejected: " << e.what() << std::endl;
        }
        throw domain::AuthError(failureCode, failureMessage);
    }

    // Вызывается под mutex_
    void enforceSessionLimit(const std::string& userId) {
        int limit = settings_->getMaxSessionsPerUser();
        if (limit <= 0) {
            return;
        }

        auto sessions = sessionRepo_->findByUserId(userId);
        if (sessions.size() < static_cast<size_t>(limit)) {
            return;
        }

        std::sort(sessions.begin(), sessions.end(), [](const auto& a, const auto& b) {
            if (a.second.createdAt != b.second.createdAt) {
                return a.second.createdAt < b.second.createdAt;
            }
            return domain::SnowflakeId::fromString(a.first) < domain::SnowflakeId::fromString(b.first);
        });

        size_t excess = sessions.size() - static_cast<size_t>(limit) + 1;
        for (size_t i = 0; i < excess; ++i) {
            revokeSession(sessions[i].first, "session_limit");
        }
    }
};

} // namespace session::application
