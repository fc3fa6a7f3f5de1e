#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace session::ports::input {

/**
 * @brief Одноразовые коды второго фактора
 */
class ITotpService {
public:
    virtual ~ITotpService() = default;

    /**
     * @brief Новый секрет: 20 случайных байт в base64
     */
    virtual std::string generateSecret() = 0;

    /**
     * @brief Проверить код по base64-секрету на текущий момент
     * @return false также для невалидного секрета
     */
    virtual bool verifyTotp(const std::string& secretBase64, const std::string& code) = 0;

    /**
     * @brief Резервные коды: 8 hex-символов в верхнем регистре
     */
    virtual std::vector<std::string> generateBackupCodes(int count = 8) = 0;

    /**
     * @brief Проверка только формата, без учёта использованных кодов
     */
    virtual bool verifyBackupCode(const std::string& code) = 0;
};

} // namespace session::ports::input
