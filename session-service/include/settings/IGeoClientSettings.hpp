#pragma once

#include <string>

namespace session::settings {

class IGeoClientSettings {
public:
    virtual ~IGeoClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual int getTimeoutMs() const = 0;

    /// Лимит одновременных фоновых запросов
    virtual int getMaxInFlight() const = 0;
};

} // namespace session::settings
