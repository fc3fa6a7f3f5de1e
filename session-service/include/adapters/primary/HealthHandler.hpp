#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/ISessionRepository.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace session::adapters::primary {

/**
 * @brief Health check handler
 *
 * GET /health
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::ISessionRepository> sessionRepo)
        : sessionRepo_(std::move(sessionRepo))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "session-service";
        response["version"] = "1.0.0";
        response["active_sessions"] = sessionRepo_->count();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
};

} // namespace session::adapters::primary
