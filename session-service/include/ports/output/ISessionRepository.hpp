#pragma once

#include "domain/SessionData.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace session::ports::output {

/**
 * @brief Интерфейс хранилища сессий
 *
 * Ключ — десятичная строка Snowflake ID.
 * Реализации: InMemorySessionRepository (единственная; персистентность не нужна).
 */
class ISessionRepository {
public:
    using Entry = std::pair<std::string, domain::SessionData>;

    virtual ~ISessionRepository() = default;

    virtual void save(const std::string& sessionId, const domain::SessionData& session) = 0;
    virtual std::optional<domain::SessionData> findById(const std::string& sessionId) = 0;
    virtual std::vector<Entry> findByUserId(const std::string& userId) = 0;
    virtual std::vector<Entry> findAll() = 0;

    /**
     * @return true если сессия существовала
     */
    virtual bool deleteById(const std::string& sessionId) = 0;

    virtual size_t count() const = 0;
};

} // namespace session::ports::output
