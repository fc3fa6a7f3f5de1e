#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace session::utils {

/**
 * @brief Base64 / Base64url без внешних зависимостей
 *
 * encodeUrl/decodeUrl — RFC 4648 §5 без паддинга (сегменты токена).
 * encode/decode — стандартный алфавит с паддингом (TOTP-секреты).
 *
 * Декодеры строгие: любой посторонний символ → std::nullopt.
 */
class Base64 {
public:
    static std::string encodeUrl(const std::string& input) {
        return encodeImpl(reinterpret_cast<const unsigned char*>(input.data()), input.size(), URL_CHARS, false);
    }

    static std::string encodeUrl(const std::vector<std::uint8_t>& input) {
        return encodeImpl(input.data(), input.size(), URL_CHARS, false);
    }

    static std::string encode(const std::vector<std::uint8_t>& input) {
        return encodeImpl(input.data(), input.size(), STD_CHARS, true);
    }

    static std::optional<std::string> decodeUrl(const std::string& input) {
        auto bytes = decodeImpl(input, true);
        if (!bytes) return std::nullopt;
        return std::string(bytes->begin(), bytes->end());
    }

    static std::optional<std::vector<std::uint8_t>> decode(const std::string& input) {
        return decodeImpl(input, false);
    }

private:
    static constexpr const char* URL_CHARS =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    static constexpr const char* STD_CHARS =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    static std::string encodeImpl(const unsigned char* data, size_t size, const char* chars, bool pad) {
        std::string result;
        result.reserve((size + 2) / 3 * 4);
        int val = 0, valb = -6;
        for (size_t i = 0; i < size; ++i) {
            val = ((val << 8) + data[i]) & 0xFFFFFF;
            valb += 8;
            while (valb >= 0) {
                result.push_back(chars[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6) {
            result.push_back(chars[(val << -valb) & 0x3F]);
        }
        if (pad) {
            while (result.size() % 4 != 0) {
                result.push_back('=');
            }
        }
        return result;
    }

    static int lookup(unsigned char c, bool url) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (url) {
            if (c == '-') return 62;
            if (c == '_') return 63;
        } else {
            if (c == '+') return 62;
            if (c == '/') return 63;
        }
        return -1;
    }

    static std::optional<std::vector<std::uint8_t>> decodeImpl(const std::string& input, bool url) {
        size_t len = input.size();
        if (!url) {
            // Паддинг допустим только в конце и не больше двух символов
            size_t padding = 0;
            while (len > 0 && input[len - 1] == '=' && padding < 2) {
                --len;
                ++padding;
            }
            if (padding > 0 && input.size() % 4 != 0) {
                return std::nullopt;
            }
        }
        if (len % 4 == 1) {
            return std::nullopt;
        }

        std::vector<std::uint8_t> result;
        result.reserve(len * 3 / 4);
        int val = 0, valb = -8;
        for (size_t i = 0; i < len; ++i) {
            int d = lookup(static_cast<unsigned char>(input[i]), url);
            if (d < 0) {
                return std::nullopt;
            }
            val = ((val << 6) + d) & 0xFFFFFF;
            valb += 6;
            if (valb >= 0) {
                result.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        return result;
    }
};

} // namespace session::utils
