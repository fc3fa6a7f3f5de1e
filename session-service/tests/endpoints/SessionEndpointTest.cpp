#include <gtest/gtest.h>

#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CreateSessionHandler.hpp"
#include "adapters/primary/ValidateTokenHandler.hpp"
#include "adapters/primary/RefreshTokenHandler.hpp"
#include "adapters/primary/RevokeSessionHandler.hpp"
#include "adapters/primary/RevokeUserSessionsHandler.hpp"
#include "adapters/primary/CleanupSessionsHandler.hpp"

#include "application/SessionService.hpp"
#include "application/SnowflakeIdGenerator.hpp"
#include "application/DeviceEnricher.hpp"
#include "adapters/secondary/HmacTokenCodec.hpp"
#include "adapters/secondary/InMemorySessionRepository.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/StubGeolocationProvider.hpp"
#include "mocks/TestAuthSettings.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace session;
using namespace session::tests;
using namespace session::adapters::primary;

// ============================================
// TEST FIXTURE
// ============================================

class SessionEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<TestAuthSettings>();
        clock_ = std::make_shared<FakeClock>(1700000000000);
        geoProvider_ = std::make_shared<StubGeolocationProvider>();
        geoProvider_->setLocation("8.8.8.8", "United States", "Mountain View", "America/Los_Angeles");
        sessionRepo_ = std::make_shared<adapters::secondary::InMemorySessionRepository>();

        sessionService_ = std::make_shared<application::SessionService>(
            settings_,
            clock_,
            std::make_shared<application::SnowflakeIdGenerator>(clock_, 1),
            std::make_shared<adapters::secondary::HmacTokenCodec>(settings_->tokenSecret),
            sessionRepo_,
            std::make_shared<application::DeviceEnricher>(geoProvider_)
        );
    }

    void TearDown() override {
        sessionRepo_->clear();
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path, const std::string& body = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    nlohmann::json login(const std::string& userId) {
        CreateSessionHandler handler(sessionService_);
        auto req = createRequest("POST", "/api/v1/sessions",
            nlohmann::json{{"user_id", userId}, {"user_agent", "Mozilla/5.0 (iPhone)"}, {"ip", "8.8.8.8"}}.dump());
        SimpleResponse res;
        handler.handle(req, res);
        EXPECT_EQ(res.getStatus(), 201);
        return nlohmann::json::parse(res.getBody());
    }

    struct Result {
        int status = 0;
        nlohmann::json body;
    };

    Result revoke(const std::string& sessionId, const std::string& accessToken) {
        RevokeSessionHandler handler(sessionService_);
        auto req = createRequest("DELETE", "/api/v1/sessions/" + sessionId);
        req.setPathPattern("/api/v1/sessions/*");
        if (!accessToken.empty()) {
            req.setHeader("Authorization", "Bearer " + accessToken);
        }
        SimpleResponse res;
        handler.handle(req, res);
        return Result{res.getStatus(), nlohmann::json::parse(res.getBody())};
    }

    Result revokeUser(const std::string& userId, const std::string& accessToken) {
        RevokeUserSessionsHandler handler(sessionService_);
        auto req = createRequest("POST", "/api/v1/sessions/revoke-user",
            nlohmann::json{{"user_id", userId}}.dump());
        if (!accessToken.empty()) {
            req.setHeader("Authorization", "Bearer " + accessToken);
        }
        SimpleResponse res;
        handler.handle(req, res);
        return Result{res.getStatus(), nlohmann::json::parse(res.getBody())};
    }

    std::shared_ptr<TestAuthSettings> settings_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<StubGeolocationProvider> geoProvider_;
    std::shared_ptr<adapters::secondary::InMemorySessionRepository> sessionRepo_;
    std::shared_ptr<application::SessionService> sessionService_;
};

// ============================================
// HEALTH
// ============================================

TEST_F(SessionEndpointTest, HealthHandler_ReportsActiveSessions) {
    login("user-1");

    HealthHandler handler(sessionRepo_);
    auto req = createRequest("GET", "/health");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["active_sessions"], 1);
}

// ============================================
// CREATE
// ============================================

TEST_F(SessionEndpointTest, CreateSession_Success) {
    auto json = login("user-1");

    EXPECT_FALSE(json["access_token"].get<std::string>().empty());
    EXPECT_FALSE(json["refresh_token"].get<std::string>().empty());
    EXPECT_EQ(json["expires_in"], 900);
    EXPECT_EQ(json["token_type"], "Bearer");
    EXPECT_EQ(sessionRepo_->count(), 1u);
}

TEST_F(SessionEndpointTest, CreateSession_RememberMeAndRoles) {
    CreateSessionHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions",
        R"({"user_id": "user-1", "ip": "8.8.8.8", "remember_me": true, "roles": ["admin"]})");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 201);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["expires_in"], 2592000);

    auto data = sessionService_->validateAccessToken(json["access_token"].get<std::string>());
    EXPECT_EQ(data.roles, std::vector<std::string>{"admin"});
}

TEST_F(SessionEndpointTest, CreateSession_UserAgentFromHeader) {
    CreateSessionHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions", R"({"user_id": "user-1", "ip": "8.8.8.8"})");
    req.setHeader("User-Agent", "Mozilla/5.0 (Windows NT 10.0; Win64; x64)");
    SimpleResponse res;
    handler.handle(req, res);

    ASSERT_EQ(res.getStatus(), 201);
    auto json = nlohmann::json::parse(res.getBody());
    auto data = sessionService_->validateAccessToken(json["access_token"].get<std::string>());
    EXPECT_EQ(data.deviceInfo.deviceType, domain::DeviceType::DESKTOP);
}

TEST_F(SessionEndpointTest, CreateSession_MissingUserId_Returns400) {
    CreateSessionHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions", R"({"ip": "8.8.8.8"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(sessionRepo_->count(), 0u);
}

TEST_F(SessionEndpointTest, CreateSession_InvalidJson_Returns400) {
    CreateSessionHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions", "{not json");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================
// VALIDATE
// ============================================

TEST_F(SessionEndpointTest, Validate_TokenInBody) {
    auto tokens = login("user-1");

    ValidateTokenHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/validate",
        nlohmann::json{{"token", tokens["access_token"]}}.dump());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_TRUE(json["valid"].get<bool>());
    EXPECT_EQ(json["user_id"], "user-1");
    EXPECT_FALSE(json["session_id"].get<std::string>().empty());
}

TEST_F(SessionEndpointTest, Validate_BearerHeader) {
    auto tokens = login("user-1");

    ValidateTokenHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/validate");
    req.setHeader("Authorization", "Bearer " + tokens["access_token"].get<std::string>());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(SessionEndpointTest, Validate_Expired_Returns401WithCode) {
    auto tokens = login("user-1");
    clock_->advanceSeconds(901);

    ValidateTokenHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/validate",
        nlohmann::json{{"token", tokens["access_token"]}}.dump());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_FALSE(json["valid"].get<bool>());
    EXPECT_EQ(json["code"], "TOKEN_EXPIRED");
}

TEST_F(SessionEndpointTest, Validate_MissingToken_Returns400) {
    ValidateTokenHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/validate", "{}");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================
// REFRESH
// ============================================

TEST_F(SessionEndpointTest, Refresh_Success) {
    auto tokens = login("user-1");

    RefreshTokenHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/refresh",
        nlohmann::json{{"refresh_token", tokens["refresh_token"]}}.dump());
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_NE(json["access_token"], tokens["access_token"]);
    EXPECT_EQ(sessionRepo_->count(), 2u);
}

TEST_F(SessionEndpointTest, Refresh_InvalidToken_Returns401) {
    RefreshTokenHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/refresh", R"({"refresh_token": "bogus"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["code"], "INVALID_REFRESH_TOKEN");
}

// ============================================
// REVOKE / CLEANUP
// ============================================

TEST_F(SessionEndpointTest, RevokeSession_OwnToken_Revokes) {
    auto tokens = login("user-1");
    auto accessToken = tokens["access_token"].get<std::string>();
    auto sessionId = sessionService_->validateAccessToken(accessToken).sessionId;

    auto res = revoke(sessionId, accessToken);

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body["revoked"], true);
    EXPECT_EQ(res.body["session_id"], sessionId);
    EXPECT_EQ(sessionRepo_->count(), 0u);

    // Токен отозванной сессии больше ничего не открывает
    auto again = revoke(sessionId, accessToken);
    EXPECT_EQ(again.status, 401);
    EXPECT_EQ(again.body["code"], "SESSION_NOT_FOUND");
}

TEST_F(SessionEndpointTest, RevokeSession_WithoutToken_Returns401) {
    auto tokens = login("user-1");
    auto sessionId = sessionService_->validateAccessToken(tokens["access_token"].get<std::string>()).sessionId;

    auto res = revoke(sessionId, "");

    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(sessionRepo_->count(), 1u);
}

TEST_F(SessionEndpointTest, RevokeSession_ForgedToken_Returns401) {
    auto tokens = login("user-1");
    auto sessionId = sessionService_->validateAccessToken(tokens["access_token"].get<std::string>()).sessionId;

    auto res = revoke(sessionId, "forged.token");

    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(res.body["code"], "INVALID_TOKEN");
    EXPECT_EQ(sessionRepo_->count(), 1u);
}

TEST_F(SessionEndpointTest, RevokeSession_TokenOfAnotherSession_Returns403) {
    auto victim = login("user-1");
    auto attacker = login("user-2");
    auto victimSessionId =
        sessionService_->validateAccessToken(victim["access_token"].get<std::string>()).sessionId;

    auto res = revoke(victimSessionId, attacker["access_token"].get<std::string>());

    EXPECT_EQ(res.status, 403);
    EXPECT_TRUE(sessionService_->getSession(victimSessionId).has_value());
}

TEST_F(SessionEndpointTest, RevokeUserSessions_Owner_ReturnsCount) {
    auto tokens = login("user-1");
    login("user-1");
    login("user-2");

    auto res = revokeUser("user-1", tokens["access_token"].get<std::string>());

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body["revoked"], 2);
    EXPECT_EQ(sessionRepo_->count(), 1u);
}

TEST_F(SessionEndpointTest, RevokeUserSessions_Admin_MayRevokeOthers) {
    login("user-1");
    ports::input::CreateSessionRequest adminRequest;
    adminRequest.userId = "admin-1";
    adminRequest.deviceInfo = domain::DeviceInfo("curl/8.4.0", "8.8.8.8");
    adminRequest.roles = {"admin"};
    auto admin = sessionService_->createSession(adminRequest);

    auto res = revokeUser("user-1", admin.accessToken);

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body["revoked"], 1);
    EXPECT_EQ(sessionRepo_->count(), 1u);
}

TEST_F(SessionEndpointTest, RevokeUserSessions_WithoutToken_Returns401) {
    login("user-1");

    auto res = revokeUser("user-1", "");

    EXPECT_EQ(res.status, 401);
    EXPECT_EQ(sessionRepo_->count(), 1u);
}

TEST_F(SessionEndpointTest, RevokeUserSessions_AnotherUser_Returns403) {
    login("user-1");
    auto attacker = login("user-2");

    auto res = revokeUser("user-1", attacker["access_token"].get<std::string>());

    EXPECT_EQ(res.status, 403);
    EXPECT_EQ(sessionRepo_->count(), 2u);
}

TEST_F(SessionEndpointTest, CleanupSessions_ReturnsRemoved) {
    login("user-1");
    clock_->advanceSeconds(31 * 24 * 60 * 60);
    login("user-2");

    CleanupSessionsHandler handler(sessionService_);
    auto req = createRequest("POST", "/api/v1/sessions/cleanup");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["removed"], 1);
    EXPECT_EQ(sessionRepo_->count(), 1u);
}
