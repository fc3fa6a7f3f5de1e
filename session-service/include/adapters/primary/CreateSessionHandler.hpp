#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionService.hpp"
#include "domain/errors/AuthError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Создание сессии после успешной аутентификации
 *
 * POST /api/v1/sessions
 * {
 *   "user_id": "user-123",
 *   "user_agent": "Mozilla/5.0 ...",   // default: заголовок User-Agent
 *   "ip": "8.8.8.8",                    // default: адрес клиента
 *   "remember_me": false,
 *   "roles": ["trader"],
 *   "permissions": ["orders:write"]
 * }
 *
 * Response 201:
 * {
 *   "access_token": "...",
 *   "refresh_token": "...",
 *   "expires_in": 900,
 *   "token_type": "Bearer"
 * }
 */
class CreateSessionHandler : public IHttpHandler {
public:
    explicit CreateSessionHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService
    ) : sessionService_(std::move(sessionService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            ports::input::CreateSessionRequest request;
            request.userId = body.value("user_id", "");
            if (request.userId.empty()) {
                sendError(res, 400, "user_id is required");
                return;
            }

            request.deviceInfo.userAgent = body.value("user_agent", req.getHeader("User-Agent").value_or(""));
            request.deviceInfo.ip = body.value("ip", req.getIp());
            request.isRememberMe = body.value("remember_me", false);
            request.roles = body.value("roles", std::vector<std::string>{});
            request.permissions = body.value("permissions", std::vector<std::string>{});

            auto tokens = sessionService_->createSession(request);

            nlohmann::json response;
            response["access_token"] = tokens.accessToken;
            response["refresh_token"] = tokens.refreshToken;
            response["expires_in"] = tokens.expiresIn;
            response["token_type"] = "Bearer";

            res.setResult(201, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::AuthError& e) {
            std::cerr << "[CreateSessionHandler] " << domain::toString(e.code()) << ": " << e.what() << std::endl;
            sendError(res, 500, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[CreateSessionHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
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
