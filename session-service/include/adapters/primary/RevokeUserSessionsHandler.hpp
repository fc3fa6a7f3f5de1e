#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionService.hpp"
#include "domain/errors/AuthError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Отзыв всех сессий пользователя (смена пароля, компрометация)
 *
 * POST /api/v1/sessions/revoke-user
 * Authorization: Bearer <access token>
 * { "user_id": "user-123", "reason": "password_changed" }
 *
 * Разрешено владельцу (user_id токена совпадает) или роли "admin".
 *
 * Response 200: { "revoked": 3 }
 * Response 401: нет токена / токен невалиден; 403: чужой user_id
 */
class RevokeUserSessionsHandler : public IHttpHandler {
public:
    static constexpr const char* ADMIN_ROLE = "admin";

    explicit RevokeUserSessionsHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService
    ) : sessionService_(std::move(sessionService)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto token = req.getBearerToken();
        if (!token || token->empty()) {
            sendError(res, 401, "Authorization header required");
            return;
        }

        try {
            auto caller = sessionService_->validateAccessToken(*token);

            auto body = nlohmann::json::parse(req.getBody());

            std::string userId = body.value("user_id", "");
            if (userId.empty()) {
                sendError(res, 400, "user_id is required");
                return;
            }

            bool isAdmin = std::find(caller.roles.begin(), caller.roles.end(), ADMIN_ROLE) != caller.roles.end();
            if (caller.userId != userId && !isAdmin) {
                sendError(res, 403, "Not allowed to revoke sessions of another user");
                return;
            }

            size_t revoked = sessionService_->revokeUserSessions(
                userId, body.value("reason", "security_breach"));

            nlohmann::json response;
            response["revoked"] = revoked;
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::AuthError& e) {
            nlohmann::json error;
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
