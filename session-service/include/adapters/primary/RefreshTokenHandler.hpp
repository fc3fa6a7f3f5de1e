#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionService.hpp"
#include "domain/errors/AuthError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Обмен refresh token на новую пару токенов
 *
 * POST /api/v1/sessions/refresh
 * { "refresh_token": "..." }
 *
 * Response 200: как у POST /api/v1/sessions
 */
class RefreshTokenHandler : public IHttpHandler {
public:
    explicit RefreshTokenHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService
    ) : sessionService_(std::move(sessionService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string refreshToken = body.value("refresh_token", "");
            if (refreshToken.empty()) {
                sendError(res, 400, "refresh_token is required");
                return;
            }

            auto tokens = sessionService_->refreshAccessToken(refreshToken);

            nlohmann::json response;
            response["access_token"] = tokens.accessToken;
            response["refresh_token"] = tokens.refreshToken;
            response["expires_in"] = tokens.expiresIn;
            response["token_type"] = "Bearer";

            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::AuthError& e) {
            sendError(res, 401, e.what(), domain::toString(e.code()));
        } catch (const std::exception& e) {
            std::cerr << "[RefreshTokenHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;

    void sendError(IResponse& res, int status, const std::string& message, const std::string& code = "") {
        nlohmann::json error;
        error["error"] = message;
        if (!code.empty()) {
            error["code"] = code;
        }
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace session::adapters::primary
