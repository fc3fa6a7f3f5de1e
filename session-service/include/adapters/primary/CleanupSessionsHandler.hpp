#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Сборка простаивающих сессий
 *
 * POST /api/v1/sessions/cleanup
 * Сервис сам не планирует очистку: дёргается внешним cron/CronJob.
 *
 * Response 200: { "removed": 12 }
 */
class CleanupSessionsHandler : public IHttpHandler {
public:
    explicit CleanupSessionsHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService
    ) : sessionService_(std::move(sessionService)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["removed"] = sessionService_->cleanupSessions();
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
};

} // namespace session::adapters::primary
