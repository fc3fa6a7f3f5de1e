#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITotpService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Второй фактор: TOTP и резервные коды
 *
 * POST /api/v1/totp/secret              → { "secret": "base64" }
 * POST /api/v1/totp/verify              { "secret", "code" } → { "valid": bool }
 * POST /api/v1/totp/backup-codes        { "count"? } → { "codes": [...] }
 * POST /api/v1/totp/backup-codes/verify { "code" } → { "valid": bool }
 *
 * Один handler на все четыре маршрута, ветвление по пути.
 */
class TotpHandler : public IHttpHandler {
public:
    static constexpr int MAX_BACKUP_CODES = 32;

    explicit TotpHandler(
        std::shared_ptr<ports::input::ITotpService> totpService
    ) : totpService_(std::move(totpService)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string path = req.getPath();

        try {
            if (path == "/api/v1/totp/secret") {
                handleSecret(res);
            } else if (path == "/api/v1/totp/verify") {
                handleVerify(req, res);
            } else if (path == "/api/v1/totp/backup-codes") {
                handleBackupCodes(req, res);
            } else if (path == "/api/v1/totp/backup-codes/verify") {
                handleVerifyBackupCode(req, res);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[TotpHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ITotpService> totpService_;

    void handleSecret(IResponse& res) {
        nlohmann::json response;
        response["secret"] = totpService_->generateSecret();
        res.setResult(200, "application/json", response.dump());
    }

    void handleVerify(IRequest& req, IResponse& res) {
        auto body = nlohmann::json::parse(req.getBody());

        std::string secret = body.value("secret", "");
        std::string code = body.value("code", "");
        if (secret.empty() || code.empty()) {
            sendError(res, 400, "secret and code are required");
            return;
        }

        nlohmann::json response;
        response["valid"] = totpService_->verifyTotp(secret, code);
        res.setResult(200, "application/json", response.dump());
    }

    void handleBackupCodes(IRequest& req, IResponse& res) {
        int count = 8;
        if (!req.getBody().empty()) {
            count = nlohmann::json::parse(req.getBody()).value("count", 8);
        }

        if (count < 1 || count > MAX_BACKUP_CODES) {
            sendError(res, 400, "count must be between 1 and " + std::to_string(MAX_BACKUP_CODES));
            return;
        }

        nlohmann::json response;
        response["codes"] = totpService_->generateBackupCodes(count);
        res.setResult(200, "application/json", response.dump());
    }

    void handleVerifyBackupCode(IRequest& req, IResponse& res) {
        auto body = nlohmann::json::parse(req.getBody());

        std::string code = body.value("code", "");
        if (code.empty()) {
            sendError(res, 400, "code is required");
            return;
        }

        nlohmann::json response;
        response["valid"] = totpService_->verifyBackupCode(code);
        res.setResult(200, "application/json", response.dump());
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace session::adapters::primary
