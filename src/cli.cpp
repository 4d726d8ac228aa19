#include "arbiter/cli.hpp"
#include "arbiter/audit.hpp"
#include "arbiter/config.hpp"
#include "arbiter/crypto.hpp"
#include "arbiter/governance_service.hpp"
#include "arbiter/http_api.hpp"
#include "arbiter/memory_store.hpp"
#include "arbiter/rocksdb_store.hpp"
#include "arbiter/web_server.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

namespace arbiter::cli
{

    namespace
    {
        Result<ArbiterConfig> load_config(const std::string &path)
        {
            return path.empty() ? ConfigLoader::defaults() : ConfigLoader::load(path);
        }

        std::unique_ptr<KeyValueStore> open_store(const ArbiterConfig &cfg, bool in_memory)
        {
            if (in_memory)
            {
                spdlog::warn("Using in-memory store; nothing will be persisted");
                return std::make_unique<MemoryStore>(std::chrono::milliseconds(cfg.storage.lock_timeout_ms));
            }
            spdlog::info("Opening RocksDB store at {}", cfg.storage.rocksdb_path);
            return std::make_unique<RocksDbStore>(cfg.storage, cfg.encryption_key);
        }

        std::shared_ptr<AuditLogger> open_audit(const ArbiterConfig &cfg)
        {
            if (cfg.logging.audit_enabled)
                return std::make_shared<AuditLogger>(cfg.logging);
            return std::make_shared<AuditLogger>();
        }
    } // namespace

    int run(int argc, char *argv[])
    {
        CLI::App app{"Arbiter Risk Council governance ledger"};
        app.require_subcommand(0, 1);

        std::string config_path;
        bool in_memory{false};
        app.add_option("--config", config_path, "Path to config TOML");
        app.add_flag("--memory", in_memory, "Use an in-memory store instead of RocksDB");

        auto cfg_cmd = app.add_subcommand("config-print", "Load and print the effective config as JSON");

        std::optional<uint16_t> serve_port;
        std::optional<std::size_t> serve_threads;
        std::optional<double> serve_rps;
        std::optional<double> serve_burst;
        auto serve_cmd = app.add_subcommand("serve", "Run the governance HTTP API");
        serve_cmd->add_option("--port", serve_port, "Port to bind (overrides server.port)");
        serve_cmd->add_option("--threads", serve_threads, "Number of worker threads");
        serve_cmd->add_option("--rps", serve_rps, "Requests per second per client (token bucket)");
        serve_cmd->add_option("--burst", serve_burst, "Burst capacity per client");

        std::string assessment_id;
        auto verify_cmd = app.add_subcommand("ledger-verify", "Verify an assessment's evidence chain");
        verify_cmd->add_option("assessment", assessment_id, "Assessment id")->required();

        auto export_cmd = app.add_subcommand("ledger-export", "Print an assessment's ledger entries as JSON");
        export_cmd->add_option("assessment", assessment_id, "Assessment id")->required();

        auto status_cmd = app.add_subcommand("status", "Print the quorum verdict for an assessment");
        status_cmd->add_option("assessment", assessment_id, "Assessment id")->required();

        auto keygen_cmd = app.add_subcommand("keygen", "Print a new Base64 AES-256 key for ARBITER_ENCRYPTION_KEY");

        CLI11_PARSE(app, argc, argv);

        if (*keygen_cmd)
        {
            auto key = crypto::AES256GCM::generate_key();
            std::cout << crypto::Base64::encode(crypto::Bytes(key.begin(), key.end())) << std::endl;
            return 0;
        }

        auto cfg = load_config(config_path);
        if (!cfg)
        {
            std::cerr << cfg.error().what() << std::endl;
            return 1;
        }
        spdlog::set_level(spdlog::level::from_str(cfg->logging.level));

        if (*cfg_cmd)
        {
            std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
            return 0;
        }

        if (!*serve_cmd && !*verify_cmd && !*export_cmd && !*status_cmd)
        {
            std::cout << app.help() << std::endl;
            return 0;
        }

        if (serve_port)
            cfg->server.port = *serve_port;
        if (serve_threads)
            cfg->server.threads = *serve_threads;
        if (serve_rps)
            cfg->server.rate_limit_rps = *serve_rps;
        if (serve_burst)
            cfg->server.rate_limit_burst = *serve_burst;

        try
        {
            auto store = open_store(*cfg, in_memory);
            GovernanceService service(*store, *cfg, open_audit(*cfg));

            if (*serve_cmd)
            {
                ApiRouter router(service);
                WebServer server(cfg->server, router);
                server.run();
                return 0;
            }

            if (*verify_cmd)
            {
                auto result = service.verify_ledger(assessment_id);
                if (!result)
                {
                    std::cerr << result.error().what() << std::endl;
                    return 1;
                }
                std::cout << result->to_json().dump(2) << std::endl;
                return result->verified ? 0 : 2;
            }

            if (*export_cmd)
            {
                auto entries = service.ledger().entries(assessment_id);
                if (!entries)
                {
                    std::cerr << entries.error().what() << std::endl;
                    return 1;
                }
                nlohmann::json out = nlohmann::json::array();
                for (const auto &entry : *entries)
                    out.push_back(entry.to_json());
                std::cout << out.dump(2) << std::endl;
                return 0;
            }

            auto report = service.check_approval_status(assessment_id);
            if (!report)
            {
                std::cerr << report.error().what() << std::endl;
                return 1;
            }
            std::cout << report->to_json().dump(2) << std::endl;
            return 0;
        }
        catch (const ArbiterError &e)
        {
            spdlog::critical("{}: {}", error_code_name(e.code), e.what());
            return 1;
        }
        catch (const std::exception &e)
        {
            spdlog::critical("Fatal: {}", e.what());
            return 1;
        }
    }

} // namespace arbiter::cli
