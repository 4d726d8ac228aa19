#pragma once

#include "config.hpp"
#include "storage.hpp"
#include <memory>

namespace arbiter
{

    /**
     * RocksDB-backed KeyValueStore on a pessimistic TransactionDB, with optional
     * AES-256-GCM encryption of values at rest. Keys are stored in clear so that
     * prefix scans keep working.
     */
    class RocksDbStore : public KeyValueStore
    {
    public:
        /** Opens (creating if missing) the database; throws ArbiterError on failure */
        explicit RocksDbStore(const StorageConfig &cfg,
                              std::optional<crypto::AESKey> encryption_key = std::nullopt);
        ~RocksDbStore() override;

        std::unique_ptr<StoreTransaction> begin() override;

        Result<std::optional<std::string>> get(std::string_view key) const override;

        Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) const override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace arbiter
