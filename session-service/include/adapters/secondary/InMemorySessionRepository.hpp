#pragma once

#include "ports/output/ISessionRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace session::adapters::secondary {

/**
 * @brief Таблица сессий в памяти процесса
 *
 * Каждая операция атомарна сама по себе (ThreadSafeMap).
 * Составные read-modify-write сценарии сериализует SessionService.
 * После рестарта таблица пуста — все токены получат SESSION_NOT_FOUND.
 */
class InMemorySessionRepository : public ports::output::ISessionRepository {
public:
    void save(const std::string& sessionId, const domain::SessionData& session) override {
        sessions_.insert(sessionId, std::make_shared<domain::SessionData>(session));
    }

    std::optional<domain::SessionData> findById(const std::string& sessionId) override {
        auto found = sessions_.find(sessionId);
        if (!found) return std::nullopt;
        return *found;
    }

    std::vector<Entry> findByUserId(const std::string& userId) override {
        std::vector<Entry> result;
        for (const auto& [id, session] : sessions_.snapshot()) {
            if (session->userId == userId) {
                result.emplace_back(id, *session);
            }
        }
        return result;
    }

    std::vector<Entry> findAll() override {
        std::vector<Entry> result;
        for (const auto& [id, session] : sessions_.snapshot()) {
            result.emplace_back(id, *session);
        }
        return result;
    }

    bool deleteById(const std::string& sessionId) override {
        return sessions_.erase(sessionId);
    }

    size_t count() const override {
        return sessions_.size();
    }

    void clear() {
        sessions_.clear();
    }

private:
    ThreadSafeMap<std::string, domain::SessionData> sessions_;
};

} // namespace session::adapters::secondary
