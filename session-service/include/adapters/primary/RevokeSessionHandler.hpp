#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionService.hpp"
#include "domain/errors/AuthError.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief DELETE /api/v1/sessions/{id} — выход из сессии
 *
 * Роутер регистрирует с паттерном "/api/v1/sessions/*".
 * Требует Authorization: Bearer <access token> той же сессии:
 * без токена или с невалидным токеном — 401, токен другой сессии — 403.
 * Причина отзыва — query-параметр reason (default: user_logout).
 */
class RevokeSessionHandler : public IHttpHandler {
public:
    explicit RevokeSessionHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService
    ) : sessionService_(std::move(sessionService)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto token = req.getBearerToken();
        if (!token || token->empty()) {
            sendError(res, 401, "Authorization header required");
            return;
        }

        std::string sessionId = req.getPathParam(0).value_or("");
        if (sessionId.empty()) {
            sendError(res, 400, "Session ID is required");
            return;
        }

        try {
            auto caller = sessionService_->validateAccessToken(*token);
            if (caller.sessionId != sessionId) {
                sendError(res, 403, "Token does not belong to this session");
                return;
            }
        } catch (const domain::AuthError& e) {
            nlohmann::json error;
            error["error"] = e.what();
            error["code"] = domain::toString(e.code());
            res.setResult(401, "application/json", error.dump());
            return;
        }

        std::string reason = req.getQueryParam("reason").value_or("user_logout");
        sessionService_->revokeSession(sessionId, reason);

        nlohmann::json response;
        response["revoked"] = true;
        response["session_id"] = sessionId;
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace session::adapters::primary
