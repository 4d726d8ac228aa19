#include "arbiter/audit.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace arbiter
{

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"actor", actor},
                              {"action", action},
                              {"resource", resource},
                              {"result", result},
                              {"details", details}};
    }

    AuditLogger::AuditLogger(const LoggingConfig &cfg)
    {
        if (!cfg.audit_enabled)
            return;
        try
        {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.audit_log_path);
            sink_ = std::make_shared<spdlog::logger>("audit", std::move(file));
            sink_->set_pattern("%v");
            sink_->set_level(spdlog::level::info);
            sink_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &e)
        {
            throw ArbiterError::config(std::string("Unable to open audit log: ") + e.what());
        }
    }

    AuditLogger::AuditLogger() = default;

    void AuditLogger::log(const AuditEvent &event)
    {
        auto line = event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (sink_)
            sink_->info(line);
        else
            spdlog::debug("audit {}", line);
    }

} // namespace arbiter
