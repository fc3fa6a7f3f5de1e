#include <gtest/gtest.h>

#include "adapters/secondary/HmacTokenCodec.hpp"
#include "domain/TokenData.hpp"
#include "utils/Base64.hpp"

#include <algorithm>

using namespace session;
using namespace session::adapters::secondary;

namespace {

domain::AuthErrorCode verifyError(const HmacTokenCodec& codec, const std::string& token) {
    try {
        codec.verifyToken(token);
    } catch (const domain::AuthError& e) {
        return e.code();
    }
    ADD_FAILURE() << "Token unexpectedly verified: " << token;
    return domain::AuthErrorCode::INVALID_TOKEN;
}

} // namespace

class HmacTokenCodecTest : public ::testing::Test {
protected:
    HmacTokenCodec codec_{"unit-test-secret"};

    nlohmann::json samplePayload() {
        domain::TokenData data;
        data.sessionId = "123456789012345678";
        data.userId = "user-1";
        data.roles = {"admin"};
        data.deviceInfo = domain::DeviceInfo("curl/8.0", "10.0.0.1");
        data.exp = 1700000900;
        data.iat = 1700000000;
        return data;
    }
};

// ============================================
// ROUND TRIP
// ============================================

TEST_F(HmacTokenCodecTest, GenerateAndVerify_ReturnsSamePayload) {
    auto payload = samplePayload();
    auto token = codec_.generateToken(payload);

    EXPECT_EQ(std::count(token.begin(), token.end(), '.'), 1);
    EXPECT_EQ(codec_.verifyToken(token), payload);

    auto data = codec_.verifyToken(token).get<domain::TokenData>();
    EXPECT_EQ(data.sessionId, "123456789012345678");
    EXPECT_EQ(data.deviceInfo.ip, "10.0.0.1");
}

TEST_F(HmacTokenCodecTest, Token_IsUnpaddedBase64Url) {
    auto token = codec_.generateToken(samplePayload());
    EXPECT_EQ(token.find('='), std::string::npos);
    EXPECT_EQ(token.find('+'), std::string::npos);
    EXPECT_EQ(token.find('/'), std::string::npos);
}

TEST_F(HmacTokenCodecTest, Sign_MatchesSignatureSegment) {
    auto token = codec_.generateToken(samplePayload());
    auto dot = token.find('.');
    EXPECT_EQ(codec_.sign(token.substr(0, dot)), token.substr(dot + 1));
}

// ============================================
// TAMPERING
// ============================================

TEST_F(HmacTokenCodecTest, Verify_AnySignatureCharacterChanged_Rejected) {
    auto token = codec_.generateToken(samplePayload());
    auto dot = token.find('.');

    for (size_t i = dot + 1; i < token.size(); ++i) {
        std::string tampered = token;
        tampered[i] = (tampered[i] == 'A') ? 'B' : 'A';
        EXPECT_EQ(verifyError(codec_, tampered), domain::AuthErrorCode::INVALID_TOKEN_SIGNATURE)
            << "position " << i;
    }
}

TEST_F(HmacTokenCodecTest, Verify_PayloadCharacterChanged_Rejected) {
    auto token = codec_.generateToken(samplePayload());
    std::string tampered = token;
    tampered[3] = (tampered[3] == 'A') ? 'B' : 'A';

    EXPECT_EQ(verifyError(codec_, tampered), domain::AuthErrorCode::INVALID_TOKEN_SIGNATURE);
}

TEST_F(HmacTokenCodecTest, Verify_DifferentSecret_Rejected) {
    HmacTokenCodec other("another-secret");
    auto token = other.generateToken(samplePayload());

    EXPECT_EQ(verifyError(codec_, token), domain::AuthErrorCode::INVALID_TOKEN_SIGNATURE);
}

TEST_F(HmacTokenCodecTest, Verify_TruncatedSignature_Rejected) {
    auto token = codec_.generateToken(samplePayload());
    token.pop_back();

    EXPECT_EQ(verifyError(codec_, token), domain::AuthErrorCode::INVALID_TOKEN_SIGNATURE);
}

// ============================================
// FORMAT / PAYLOAD
// ============================================

TEST_F(HmacTokenCodecTest, Verify_WrongSegmentCount_InvalidFormat) {
    EXPECT_EQ(verifyError(codec_, "no-dot-here"), domain::AuthErrorCode::INVALID_TOKEN_FORMAT);
    EXPECT_EQ(verifyError(codec_, "a.b.c"), domain::AuthErrorCode::INVALID_TOKEN_FORMAT);
    EXPECT_EQ(verifyError(codec_, ""), domain::AuthErrorCode::INVALID_TOKEN_FORMAT);
}

TEST_F(HmacTokenCodecTest, Verify_SignedGarbageBase64_PayloadCorrupt) {
    std::string payload = "!!not-base64!!";
    EXPECT_EQ(verifyError(codec_, payload + "." + codec_.sign(payload)),
              domain::AuthErrorCode::TOKEN_PAYLOAD_CORRUPT);
}

TEST_F(HmacTokenCodecTest, Verify_SignedNonJson_PayloadCorrupt) {
    std::string payload = utils::Base64::encodeUrl(std::string("definitely not json"));
    EXPECT_EQ(verifyError(codec_, payload + "." + codec_.sign(payload)),
              domain::AuthErrorCode::TOKEN_PAYLOAD_CORRUPT);
}

// ============================================
// SECRET
// ============================================

TEST_F(HmacTokenCodecTest, EmptySecret_GenerateAndVerifyFail) {
    HmacTokenCodec unconfigured("");

    try {
        unconfigured.generateToken(samplePayload());
        FAIL() << "Expected AuthError";
    } catch (const domain::AuthError& e) {
        EXPECT_EQ(e.code(), domain::AuthErrorCode::TOKEN_SECRET_NOT_CONFIGURED);
    }

    auto token = codec_.generateToken(samplePayload());
    EXPECT_EQ(verifyError(unconfigured, token), domain::AuthErrorCode::TOKEN_SECRET_NOT_CONFIGURED);
}
