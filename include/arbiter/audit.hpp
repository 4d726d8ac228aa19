#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace spdlog
{
    class logger;
}

namespace arbiter
{
    struct AuditEvent
    {
        std::string ts;
        std::string actor;
        std::string action;
        std::string resource;
        std::string result;
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;
    };

    /**
     * Writes one JSON line per governance action. With audit enabled the lines go
     * to a dedicated file sink; otherwise they are emitted at debug level on the
     * default logger.
     */
    class AuditLogger
    {
    public:
        /** Throws ArbiterError if the audit file cannot be opened */
        explicit AuditLogger(const LoggingConfig &cfg);

        /** Routes events to the default logger only */
        AuditLogger();

        void log(const AuditEvent &event);

    private:
        std::shared_ptr<spdlog::logger> sink_;
    };

} // namespace arbiter
