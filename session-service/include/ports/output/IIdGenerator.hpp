#pragma once

#include "domain/SnowflakeId.hpp"

namespace session::ports::output {

/**
 * @brief Генератор уникальных идентификаторов
 */
class IIdGenerator {
public:
    virtual ~IIdGenerator() = default;

    /**
     * @brief Выдать следующий ID
     * @throws domain::IdGeneratorError при откате часов
     */
    virtual domain::SnowflakeId generateId() = 0;
};

} // namespace session::ports::output
