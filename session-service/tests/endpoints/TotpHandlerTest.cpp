#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/TotpHandler.hpp"
#include "ports/input/ITotpService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace session;
using namespace session::adapters::primary;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockTotpService : public ports::input::ITotpService {
public:
    MOCK_METHOD(std::string, generateSecret, (), (override));
    MOCK_METHOD(bool, verifyTotp, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::vector<std::string>, generateBackupCodes, (int), (override));
    MOCK_METHOD(bool, verifyBackupCode, (const std::string&), (override));
};

// ============================================================================
// Test Fixture
// ============================================================================

class TotpHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        totpService_ = std::make_shared<MockTotpService>();
        handler_ = std::make_unique<TotpHandler>(totpService_);
    }

    struct Result {
        int status;
        std::string body;

        int getStatus() const { return status; }
        const std::string& getBody() const { return body; }
    };

    Result post(const std::string& path, const std::string& body = "") {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath(path);
        req.setBody(body);
        SimpleResponse res;
        handler_->handle(req, res);
        return {res.getStatus(), res.getBody()};
    }

    std::shared_ptr<MockTotpService> totpService_;
    std::unique_ptr<TotpHandler> handler_;
};

// ============================================================================
// ТЕСТЫ
// ============================================================================

TEST_F(TotpHandlerTest, Secret_ReturnsGeneratedSecret) {
    EXPECT_CALL(*totpService_, generateSecret()).WillOnce(Return("c2VjcmV0"));

    auto res = post("/api/v1/totp/secret");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["secret"], "c2VjcmV0");
}

TEST_F(TotpHandlerTest, Verify_PassesSecretAndCode) {
    EXPECT_CALL(*totpService_, verifyTotp("c2VjcmV0", "123456")).WillOnce(Return(true));

    auto res = post("/api/v1/totp/verify", R"({"secret": "c2VjcmV0", "code": "123456"})");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(nlohmann::json::parse(res.getBody())["valid"].get<bool>());
}

TEST_F(TotpHandlerTest, Verify_MissingCode_Returns400) {
    EXPECT_CALL(*totpService_, verifyTotp(_, _)).Times(0);

    auto res = post("/api/v1/totp/verify", R"({"secret": "c2VjcmV0"})");

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(TotpHandlerTest, BackupCodes_DefaultCount) {
    EXPECT_CALL(*totpService_, generateBackupCodes(8))
        .WillOnce(Return(std::vector<std::string>(8, "0A1B2C3D")));

    auto res = post("/api/v1/totp/backup-codes");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["codes"].size(), 8u);
}

TEST_F(TotpHandlerTest, BackupCodes_CountOutOfRange_Returns400) {
    EXPECT_CALL(*totpService_, generateBackupCodes(_)).Times(0);

    EXPECT_EQ(post("/api/v1/totp/backup-codes", R"({"count": 0})").getStatus(), 400);
    EXPECT_EQ(post("/api/v1/totp/backup-codes", R"({"count": 33})").getStatus(), 400);
}

TEST_F(TotpHandlerTest, VerifyBackupCode) {
    EXPECT_CALL(*totpService_, verifyBackupCode("0A1B2C3D")).WillOnce(Return(true));

    auto res = post("/api/v1/totp/backup-codes/verify", R"({"code": "0A1B2C3D"})");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(nlohmann::json::parse(res.getBody())["valid"].get<bool>());
}

TEST_F(TotpHandlerTest, UnknownPath_Returns404) {
    EXPECT_EQ(post("/api/v1/totp/other").getStatus(), 404);
}

TEST_F(TotpHandlerTest, InvalidJson_Returns400) {
    EXPECT_EQ(post("/api/v1/totp/verify", "{oops").getStatus(), 400);
}
