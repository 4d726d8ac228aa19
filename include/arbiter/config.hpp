#pragma once

#include "types.hpp"
#include "crypto.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace arbiter
{

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/arbiter"};
        bool encrypt_at_rest{false};
        uint32_t lock_timeout_ms{1000};
    };

    struct LedgerConfig
    {
        std::size_t default_page_limit{50};
        std::size_t max_page_limit{100};
    };

    struct ServiceConfig
    {
        /** Extra attempts for a decision whose transaction hit lock contention */
        std::size_t max_submit_retries{3};
    };

    struct ServerConfig
    {
        uint16_t port{8080};
        std::size_t threads{4};
        double rate_limit_rps{10.0};
        double rate_limit_burst{60.0};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
        bool audit_enabled{true};
        std::string audit_log_path{"./logs/audit.log"};
    };

    struct ArbiterConfig
    {
        StorageConfig storage{};
        LedgerConfig ledger{};
        ServiceConfig service{};
        ServerConfig server{};
        LoggingConfig logging{};
        std::optional<crypto::AESKey> encryption_key; // from ARBITER_ENCRYPTION_KEY
    };

    /**
     * ConfigLoader reads TOML configuration, applies ARBITER_* environment
     * overrides and validates the result. A [secrets] table may carry a
     * base64 AES-256-GCM blob holding more TOML, decrypted with the
     * environment-supplied key and merged over the clear-text settings.
     */
    class ConfigLoader
    {
    public:
        /** Defaults plus environment overrides, no file */
        static Result<ArbiterConfig> defaults();

        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<ArbiterConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<ArbiterConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection; never includes key material. */
        static nlohmann::json to_json(const ArbiterConfig &cfg);

        static Result<std::string> decrypt_secrets(const std::string &cipher_b64,
                                                   const crypto::AESKey &key);

    private:
        static Result<void> apply_env_overrides(ArbiterConfig &cfg);

        static Result<void> validate(const ArbiterConfig &cfg);
    };

} // namespace arbiter
