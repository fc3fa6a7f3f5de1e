#pragma once

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace session::utils {

/**
 * @brief Тонкая обёртка над OpenSSL libcrypto
 */
class Crypto {
public:
    using Bytes = std::vector<std::uint8_t>;

    static Bytes hmacSha256(const std::string& key, const std::string& message) {
        return hmac(EVP_sha256(), reinterpret_cast<const unsigned char*>(key.data()), key.size(),
                    reinterpret_cast<const unsigned char*>(message.data()), message.size());
    }

    static Bytes hmacSha1(const Bytes& key, const Bytes& message) {
        return hmac(EVP_sha1(), key.data(), key.size(), message.data(), message.size());
    }

    static Bytes sha256(const std::string& input) {
        Bytes digest(SHA256_DIGEST_LENGTH);
        SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest.data());
        return digest;
    }

    /**
     * @brief Криптостойкие случайные байты
     * @throws std::runtime_error если RAND_bytes не смог набрать энтропию
     */
    static Bytes randomBytes(size_t count) {
        Bytes bytes(count);
        if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        return bytes;
    }

    static std::string toHex(const Bytes& bytes, bool upper = false) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        if (upper) {
            oss << std::uppercase;
        }
        for (auto b : bytes) {
            oss << std::setw(2) << static_cast<int>(b);
        }
        return oss.str();
    }

    /**
     * @brief Сравнение за постоянное время
     *
     * Разная длина — сразу false (длина подписи не секрет).
     */
    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        if (a.empty()) {
            return true;
        }
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

private:
    static Bytes hmac(const EVP_MD* md,
                      const unsigned char* key, size_t keyLen,
                      const unsigned char* data, size_t dataLen) {
        Bytes out(EVP_MAX_MD_SIZE);
        unsigned int outLen = 0;
        if (HMAC(md, key, static_cast<int>(keyLen), data, dataLen, out.data(), &outLen) == nullptr) {
            throw std::runtime_error("HMAC computation failed");
        }
        out.resize(outLen);
        return out;
    }
};

} // namespace session::utils
