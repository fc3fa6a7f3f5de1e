#pragma once

#include "ports/input/ITotpService.hpp"
#include "ports/output/IClock.hpp"
#include "utils/Base64.hpp"
#include "utils/Crypto.hpp"
#include <cstdint>
#include <iomanip>
#include <memory>
#include <regex>
#include <sstream>

namespace session::application {

/**
 * @brief TOTP (RFC 6238) поверх HOTP (RFC 4226)
 *
 * Шаг 30 секунд, 6 цифр, HMAC-SHA1.
 * Окно проверки: предыдущий, текущий и следующий шаг.
 */
class TotpService : public ports::input::ITotpService {
public:
    static constexpr std::int64_t STEP_SECONDS = 30;
    static constexpr int DIGITS = 6;
    static constexpr size_t SECRET_BYTES = 20;

    explicit TotpService(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock))
    {}

    std::string generateSecret() override {
        return utils::Base64::encode(utils::Crypto::randomBytes(SECRET_BYTES));
    }

    bool verifyTotp(const std::string& secretBase64, const std::string& code) override {
        auto secret = utils::Base64::decode(secretBase64);
        if (!secret || secret->empty()) {
            return false;
        }
        return verifyCode(*secret, code, clock_->nowSeconds());
    }

    std::vector<std::string> generateBackupCodes(int count = 8) override {
        std::vector<std::string> codes;
        codes.reserve(count > 0 ? static_cast<size_t>(count) : 0);
        for (int i = 0; i < count; ++i) {
            codes.push_back(utils::Crypto::toHex(utils::Crypto::randomBytes(4), true));
        }
        return codes;
    }

    bool verifyBackupCode(const std::string& code) override {
        static const std::regex format("^[0-9A-F]{8}$");
        return std::regex_match(code, format);
    }

    /**
     * @brief Код для момента timestamp (Unix-секунды)
     */
    static std::string generateCode(const utils::Crypto::Bytes& secret, std::int64_t timestamp) {
        auto counter = static_cast<std::uint64_t>(timestamp / STEP_SECONDS);

        utils::Crypto::Bytes message(8);
        for (int i = 7; i >= 0; --i) {
            message[i] = static_cast<std::uint8_t>(counter & 0xFF);
            counter >>= 8;
        }

        auto hash = utils::Crypto::hmacSha1(secret, message);

        // Динамическое усечение (RFC 4226, 5.3)
        size_t offset = hash.back() & 0x0F;
        std::uint32_t binary = ((hash[offset] & 0x7F) << 24)
                             | ((hash[offset + 1] & 0xFF) << 16)
                             | ((hash[offset + 2] & 0xFF) << 8)
                             | (hash[offset + 3] & 0xFF);

        std::ostringstream oss;
        oss << std::setw(DIGITS) << std::setfill('0') << (binary % 1000000);
        return oss.str();
    }

    static bool verifyCode(const utils::Crypto::Bytes& secret, const std::string& code, std::int64_t now) {
        for (std::int64_t delta : {-STEP_SECONDS, std::int64_t{0}, STEP_SECONDS}) {
            if (utils::Crypto::constantTimeEquals(generateCode(secret, now + delta), code)) {
                return true;
            }
        }
        return false;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace session::application
