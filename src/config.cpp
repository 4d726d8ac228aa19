#include "arbiter/config.hpp"
#include <spdlog/common.h>
#include <toml++/toml.h>
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace arbiter
{
    namespace
    {
        Result<std::optional<crypto::AESKey>> env_encryption_key()
        {
            const char *env = std::getenv("ARBITER_ENCRYPTION_KEY");
            if (!env || !*env)
                return std::optional<crypto::AESKey>();
            auto decoded = crypto::Base64::decode(env);
            if (!decoded)
                return std::unexpected(ArbiterError::config("ARBITER_ENCRYPTION_KEY is not valid base64"));
            if (decoded->size() != crypto::AESKey{}.size())
                return std::unexpected(ArbiterError::config("ARBITER_ENCRYPTION_KEY must decode to 32 bytes"));
            crypto::AESKey key{};
            std::copy_n(decoded->begin(), key.size(), key.begin());
            return std::optional<crypto::AESKey>(key);
        }

        template <typename T>
        Result<T> parse_unsigned(const char *name, std::string_view text)
        {
            T value{};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::unexpected(ArbiterError::config(std::format("{} is not a valid number: '{}'", name, text)));
            return value;
        }

        bool env_flag(const char *value)
        {
            std::string_view v(value);
            return !(v == "0" || v == "false" || v == "no" || v.empty());
        }

        template <typename T, typename NodeView>
        Result<T> non_negative(NodeView node, const char *name, T current)
        {
            if (!node)
                return current;
            auto value = node.template value<int64_t>();
            if (!value || *value < 0)
                return std::unexpected(ArbiterError::config(std::format("{} must be a non-negative integer", name)));
            return static_cast<T>(*value);
        }

        Result<ArbiterConfig> parse_toml(const toml::table &tbl, ArbiterConfig cfg)
        {
            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
                if (auto enc = (*storage)["encrypt_at_rest"].value<bool>())
                    cfg.storage.encrypt_at_rest = *enc;
                auto timeout = non_negative<uint32_t>((*storage)["lock_timeout_ms"], "storage.lock_timeout_ms",
                                                      cfg.storage.lock_timeout_ms);
                if (!timeout)
                    return std::unexpected(timeout.error());
                cfg.storage.lock_timeout_ms = *timeout;
            }

            if (auto ledger = tbl["ledger"].as_table())
            {
                auto def = non_negative<std::size_t>((*ledger)["default_page_limit"], "ledger.default_page_limit",
                                                     cfg.ledger.default_page_limit);
                if (!def)
                    return std::unexpected(def.error());
                auto max = non_negative<std::size_t>((*ledger)["max_page_limit"], "ledger.max_page_limit",
                                                     cfg.ledger.max_page_limit);
                if (!max)
                    return std::unexpected(max.error());
                cfg.ledger.default_page_limit = *def;
                cfg.ledger.max_page_limit = *max;
            }

            if (auto service = tbl["service"].as_table())
            {
                auto retries = non_negative<std::size_t>((*service)["max_submit_retries"], "service.max_submit_retries",
                                                         cfg.service.max_submit_retries);
                if (!retries)
                    return std::unexpected(retries.error());
                cfg.service.max_submit_retries = *retries;
            }

            if (auto server = tbl["server"].as_table())
            {
                auto port = non_negative<uint32_t>((*server)["port"], "server.port", uint32_t{cfg.server.port});
                if (!port)
                    return std::unexpected(port.error());
                if (*port > 65535)
                    return std::unexpected(ArbiterError::config("server.port out of range"));
                cfg.server.port = static_cast<uint16_t>(*port);

                auto threads = non_negative<std::size_t>((*server)["threads"], "server.threads", cfg.server.threads);
                if (!threads)
                    return std::unexpected(threads.error());
                cfg.server.threads = *threads;

                if (auto rps = (*server)["rate_limit_rps"].value<double>())
                    cfg.server.rate_limit_rps = *rps;
                if (auto burst = (*server)["rate_limit_burst"].value<double>())
                    cfg.server.rate_limit_burst = *burst;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
                if (auto enabled = (*logging)["audit_enabled"].value<bool>())
                    cfg.logging.audit_enabled = *enabled;
                if (auto path = (*logging)["audit_log_path"].value<std::string>())
                    cfg.logging.audit_log_path = *path;
            }

            // Encrypted secrets block: secrets.ciphertext (base64 of AES-GCM blob holding TOML)
            if (auto secrets = tbl["secrets"].as_table())
            {
                if (auto cipher_b64 = (*secrets)["ciphertext"].value<std::string>())
                {
                    if (!cfg.encryption_key)
                        return std::unexpected(ArbiterError::config(
                            "config has an encrypted [secrets] block but ARBITER_ENCRYPTION_KEY is not set"));

                    auto plain = ConfigLoader::decrypt_secrets(*cipher_b64, *cfg.encryption_key);
                    if (!plain)
                        return std::unexpected(plain.error());
                    try
                    {
                        auto inner = toml::parse(*plain);
                        return parse_toml(inner, std::move(cfg));
                    }
                    catch (const toml::parse_error &e)
                    {
                        return std::unexpected(ArbiterError::config(
                            std::string("Failed to parse decrypted secrets: ") + std::string(e.description())));
                    }
                }
            }

            return cfg;
        }

    } // namespace

    Result<ArbiterConfig> ConfigLoader::defaults()
    {
        ArbiterConfig cfg{};
        auto key = env_encryption_key();
        if (!key)
            return std::unexpected(key.error());
        cfg.encryption_key = *key;

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<ArbiterConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(ArbiterError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<ArbiterConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        ArbiterConfig cfg{};
        auto key = env_encryption_key();
        if (!key)
            return std::unexpected(key.error());
        cfg.encryption_key = *key;

        toml::table tbl;
        try
        {
            tbl = toml::parse(toml_content);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(ArbiterError::config(std::string("Failed to parse TOML: ") + std::string(e.description())));
        }

        auto parsed = parse_toml(tbl, std::move(cfg));
        if (!parsed)
            return parsed;
        cfg = std::move(*parsed);

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        if (auto valid = validate(cfg); !valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(ArbiterConfig &cfg)
    {
        if (const char *path = std::getenv("ARBITER_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;
        if (const char *enc = std::getenv("ARBITER_ENCRYPT_AT_REST"))
            cfg.storage.encrypt_at_rest = env_flag(enc);
        if (const char *timeout = std::getenv("ARBITER_LOCK_TIMEOUT_MS"))
        {
            auto value = parse_unsigned<uint32_t>("ARBITER_LOCK_TIMEOUT_MS", timeout);
            if (!value)
                return std::unexpected(value.error());
            cfg.storage.lock_timeout_ms = *value;
        }
        if (const char *port = std::getenv("ARBITER_PORT"))
        {
            auto value = parse_unsigned<uint16_t>("ARBITER_PORT", port);
            if (!value)
                return std::unexpected(value.error());
            cfg.server.port = *value;
        }
        if (const char *level = std::getenv("ARBITER_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit_en = std::getenv("ARBITER_AUDIT_ENABLED"))
            cfg.logging.audit_enabled = env_flag(audit_en);
        if (const char *audit_path = std::getenv("ARBITER_AUDIT_LOG"))
            cfg.logging.audit_log_path = audit_path;
        return {};
    }

    Result<void> ConfigLoader::validate(const ArbiterConfig &cfg)
    {
        if (cfg.storage.rocksdb_path.empty())
            return std::unexpected(ArbiterError::config("storage.rocksdb_path must not be empty"));
        if (cfg.storage.lock_timeout_ms == 0)
            return std::unexpected(ArbiterError::config("storage.lock_timeout_ms must be positive"));
        if (cfg.storage.encrypt_at_rest && !cfg.encryption_key)
            return std::unexpected(ArbiterError::config("storage.encrypt_at_rest requires ARBITER_ENCRYPTION_KEY"));
        if (cfg.ledger.max_page_limit == 0)
            return std::unexpected(ArbiterError::config("ledger.max_page_limit must be positive"));
        if (cfg.ledger.default_page_limit == 0 || cfg.ledger.default_page_limit > cfg.ledger.max_page_limit)
            return std::unexpected(ArbiterError::config("ledger.default_page_limit must be in [1, max_page_limit]"));
        if (cfg.server.threads == 0)
            return std::unexpected(ArbiterError::config("server.threads must be positive"));
        if (!(cfg.server.rate_limit_rps > 0.0) || !(cfg.server.rate_limit_burst >= 1.0))
            return std::unexpected(ArbiterError::config("server rate limits must be positive (burst >= 1)"));
        if (spdlog::level::from_str(cfg.logging.level) == spdlog::level::off && cfg.logging.level != "off")
            return std::unexpected(ArbiterError::config("unknown logging.level: " + cfg.logging.level));
        if (cfg.logging.audit_enabled && cfg.logging.audit_log_path.empty())
            return std::unexpected(ArbiterError::config("logging.audit_log_path must not be empty"));
        return {};
    }

    Result<std::string> ConfigLoader::decrypt_secrets(const std::string &cipher_b64,
                                                      const crypto::AESKey &key)
    {
        auto cipher = crypto::Base64::decode(cipher_b64);
        if (!cipher)
            return std::unexpected(ArbiterError::config("secrets.ciphertext is not valid base64"));
        auto plain = crypto::AES256GCM::decrypt(key, *cipher);
        if (!plain)
            return std::unexpected(ArbiterError::config(std::string("secrets.ciphertext: ") + plain.error().what()));
        return std::string(plain->begin(), plain->end());
    }

    nlohmann::json ConfigLoader::to_json(const ArbiterConfig &cfg)
    {
        nlohmann::json j;
        j["storage"] = {
            {"rocksdb_path", cfg.storage.rocksdb_path},
            {"encrypt_at_rest", cfg.storage.encrypt_at_rest},
            {"lock_timeout_ms", cfg.storage.lock_timeout_ms}};
        j["ledger"] = {
            {"default_page_limit", cfg.ledger.default_page_limit},
            {"max_page_limit", cfg.ledger.max_page_limit}};
        j["service"] = {{"max_submit_retries", cfg.service.max_submit_retries}};
        j["server"] = {
            {"port", cfg.server.port},
            {"threads", cfg.server.threads},
            {"rate_limit_rps", cfg.server.rate_limit_rps},
            {"rate_limit_burst", cfg.server.rate_limit_burst}};
        j["logging"] = {
            {"level", cfg.logging.level},
            {"audit_enabled", cfg.logging.audit_enabled},
            {"audit_log_path", cfg.logging.audit_log_path}};
        j["has_encryption_key"] = cfg.encryption_key.has_value();
        return j;
    }

} // namespace arbiter
