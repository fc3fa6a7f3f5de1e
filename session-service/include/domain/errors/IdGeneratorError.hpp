#pragma once

#include <stdexcept>
#include <string>

namespace session::domain {

/**
 * @brief Фатальные ошибки генератора ID
 *
 * Повтор не поможет: хост сконфигурирован неверно или часы сломаны.
 */
enum class IdGeneratorErrorCode {
    WORKER_ID_OUT_OF_RANGE,
    CLOCK_REGRESSION
};

inline std::string toString(IdGeneratorErrorCode code) {
    switch (code) {
        case IdGeneratorErrorCode::WORKER_ID_OUT_OF_RANGE: return "WORKER_ID_OUT_OF_RANGE";
        case IdGeneratorErrorCode::CLOCK_REGRESSION:       return "CLOCK_REGRESSION";
    }
    return "ID_GENERATOR_ERROR";
}

class IdGeneratorError : public std::runtime_error {
public:
    IdGeneratorError(IdGeneratorErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    IdGeneratorErrorCode code() const { return code_; }

private:
    IdGeneratorErrorCode code_;
};

} // namespace session::domain
