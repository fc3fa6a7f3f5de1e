#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionService.hpp"
#include "domain/errors/AuthError.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Проверка access token (внутренний API для других сервисов)
 *
 * POST /api/v1/sessions/validate
 * { "token": "..." }   или заголовок Authorization: Bearer ...
 *
 * Response 200:
 * {
 *   "valid": true,
 *   "session_id": "...",
 *   "user_id": "user-123",
 *   "roles": [...],
 *   "permissions": [...],
 *   "exp": 1700000000
 * }
 *
 * Response 401: { "error": "...", "code": "TOKEN_EXPIRED" }
 */
class ValidateTokenHandler : public IHttpHandler {
public:
    explicit ValidateTokenHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService
    ) : sessionService_(std::move(sessionService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string token = req.getBearerToken().value_or("");
            if (token.empty() && !req.getBody().empty()) {
                auto body = nlohmann::json::parse(req.getBody());
                token = body.value("token", "");
            }

            if (token.empty()) {
                sendError(res, 400, "token is required");
                return;
            }

            auto data = sessionService_->validateAccessToken(token);

            nlohmann::json response;
            response["valid"] = true;
            response["session_id"] = data.sessionId;
            response["user_id"] = data.userId;
            response["roles"] = data.roles;
            response["permissions"] = data.permissions;
            response["exp"] = data.exp;

            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::AuthError& e) {
            nlohmann::json error;
            error["valid"] = false;
            error["error"] = e.what();
            error["code"] = domain::toString(e.code());
            res.setResult(401, "application/json", error.dump());
        }
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
