#include "arbiter/rocksdb_store.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>

namespace arbiter
{
    namespace
    {
        ArbiterError from_status(const rocksdb::Status &status, std::string_view op)
        {
            if (status.IsBusy() || status.IsTimedOut() || status.IsTryAgain())
                return ArbiterError::busy(std::format("RocksDB {}: {}", op, status.ToString()));
            return ArbiterError::storage(std::format("RocksDB {} failed: {}", op, status.ToString()));
        }

        crypto::Bytes to_bytes(std::string_view s)
        {
            return crypto::Bytes(s.begin(), s.end());
        }

        bool has_prefix(const rocksdb::Slice &key, std::string_view prefix)
        {
            return key.size() >= prefix.size() && std::string_view(key.data(), prefix.size()) == prefix;
        }

        /** Values at rest are sealed with the record key as associated data */
        class ValueCodec
        {
        public:
            explicit ValueCodec(std::optional<crypto::AESKey> key) : key_(std::move(key)) {}

            Result<std::string> seal(std::string_view key, std::string_view value) const
            {
                if (!key_)
                    return std::string(value);
                auto cipher = crypto::AES256GCM::encrypt(*key_, to_bytes(value), to_bytes(key));
                if (!cipher)
                    return std::unexpected(cipher.error());
                return crypto::Base64::encode(*cipher);
            }

            Result<std::string> open(std::string_view key, std::string_view stored) const
            {
                if (!key_)
                    return std::string(stored);
                auto cipher = crypto::Base64::decode(stored);
                if (!cipher)
                    return std::unexpected(ArbiterError::storage(std::format("corrupt value at {}", key)));
                auto plain = crypto::AES256GCM::decrypt(*key_, *cipher, to_bytes(key));
                if (!plain)
                    return std::unexpected(ArbiterError::crypto(std::format("cannot decrypt value at {}: {}", key, plain.error().what())));
                return std::string(plain->begin(), plain->end());
            }

        private:
            std::optional<crypto::AESKey> key_;
        };

        Result<std::vector<KeyValue>> collect(rocksdb::Iterator &it, std::string_view prefix, const ValueCodec &codec)
        {
            std::vector<KeyValue> out;
            for (it.Seek(rocksdb::Slice(prefix.data(), prefix.size())); it.Valid() && has_prefix(it.key(), prefix); it.Next())
            {
                auto key = it.key().ToString();
                auto value = codec.open(key, std::string_view(it.value().data(), it.value().size()));
                if (!value)
                    return std::unexpected(value.error());
                out.emplace_back(std::move(key), std::move(*value));
            }
            if (!it.status().ok())
                return std::unexpected(from_status(it.status(), "iterate"));
            return out;
        }

        class RocksDbTransaction : public StoreTransaction
        {
        public:
            RocksDbTransaction(rocksdb::TransactionDB &db, const ValueCodec &codec)
                : txn_(db.BeginTransaction(rocksdb::WriteOptions())), codec_(codec)
            {
            }

            ~RocksDbTransaction() override
            {
                rollback();
            }

            Result<std::optional<std::string>> get(std::string_view key) override
            {
                if (finished_)
                    return std::unexpected(ArbiterError::internal("transaction already finished"));
                std::string raw;
                return decode(key, txn_->Get(rocksdb::ReadOptions(), to_slice(key), &raw), raw, "Get");
            }

            Result<std::optional<std::string>> get_for_update(std::string_view key) override
            {
                if (finished_)
                    return std::unexpected(ArbiterError::internal("transaction already finished"));
                std::string raw;
                return decode(key, txn_->GetForUpdate(rocksdb::ReadOptions(), to_slice(key), &raw), raw, "GetForUpdate");
            }

            Result<void> put(std::string_view key, std::string_view value) override
            {
                if (finished_)
                    return std::unexpected(ArbiterError::internal("transaction already finished"));
                auto sealed = codec_.seal(key, value);
                if (!sealed)
                    return std::unexpected(sealed.error());
                auto status = txn_->Put(to_slice(key), rocksdb::Slice(*sealed));
                if (!status.ok())
                    return std::unexpected(from_status(status, "Put"));
                return {};
            }

            Result<void> erase(std::string_view key) override
            {
                if (finished_)
                    return std::unexpected(ArbiterError::internal("transaction already finished"));
                auto status = txn_->Delete(to_slice(key));
                if (!status.ok())
                    return std::unexpected(from_status(status, "Delete"));
                return {};
            }

            Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) override
            {
                if (finished_)
                    return std::unexpected(ArbiterError::internal("transaction already finished"));
                std::unique_ptr<rocksdb::Iterator> it(txn_->GetIterator(rocksdb::ReadOptions()));
                return collect(*it, prefix, codec_);
            }

            Result<void> commit() override
            {
                if (finished_)
                    return std::unexpected(ArbiterError::internal("transaction already finished"));
                auto status = txn_->Commit();
                if (!status.ok())
                {
                    rollback();
                    return std::unexpected(from_status(status, "Commit"));
                }
                finished_ = true;
                return {};
            }

            void rollback() override
            {
                if (finished_)
                    return;
                finished_ = true;
                auto status = txn_->Rollback();
                if (!status.ok())
                    spdlog::warn("RocksDB rollback failed: {}", status.ToString());
            }

        private:
            static rocksdb::Slice to_slice(std::string_view s)
            {
                return rocksdb::Slice(s.data(), s.size());
            }

            Result<std::optional<std::string>> decode(std::string_view key, const rocksdb::Status &status,
                                                      const std::string &raw, std::string_view op) const
            {
                if (status.IsNotFound())
                    return std::optional<std::string>();
                if (!status.ok())
                    return std::unexpected(from_status(status, op));
                auto value = codec_.open(key, raw);
                if (!value)
                    return std::unexpected(value.error());
                return std::optional<std::string>(std::move(*value));
            }

            std::unique_ptr<rocksdb::Transaction> txn_;
            const ValueCodec &codec_;
            bool finished_{false};
        };

    } // namespace

    class RocksDbStore::Impl
    {
    public:
        Impl(const StorageConfig &cfg, std::optional<crypto::AESKey> encryption_key)
            : codec(checked_key(cfg, std::move(encryption_key)))
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            rocksdb::TransactionDBOptions txn_options;
            txn_options.transaction_lock_timeout = static_cast<int64_t>(cfg.lock_timeout_ms);

            rocksdb::TransactionDB *raw = nullptr;
            auto status = rocksdb::TransactionDB::Open(options, txn_options, cfg.rocksdb_path, &raw);
            if (!status.ok())
            {
                throw ArbiterError::storage("RocksDB open failed: " + status.ToString());
            }
            db.reset(raw);
            spdlog::info("Opened RocksDB store at {} (encrypt_at_rest={})", cfg.rocksdb_path, cfg.encrypt_at_rest);
        }

        std::unique_ptr<rocksdb::TransactionDB> db;
        ValueCodec codec;

    private:
        static std::optional<crypto::AESKey> checked_key(const StorageConfig &cfg,
                                                         std::optional<crypto::AESKey> key)
        {
            if (!cfg.encrypt_at_rest)
                return std::nullopt;
            if (!key)
                throw ArbiterError::config("encrypt_at_rest is enabled but no encryption key is configured");
            if (!crypto::AES256GCM::is_available())
                throw ArbiterError::crypto("encrypt_at_rest requires AES-256-GCM hardware support");
            return key;
        }
    };

    RocksDbStore::RocksDbStore(const StorageConfig &cfg, std::optional<crypto::AESKey> encryption_key)
        : impl_(std::make_unique<Impl>(cfg, std::move(encryption_key)))
    {
    }

    RocksDbStore::~RocksDbStore() = default;

    std::unique_ptr<StoreTransaction> RocksDbStore::begin()
    {
        return std::make_unique<RocksDbTransaction>(*impl_->db, impl_->codec);
    }

    Result<std::optional<std::string>> RocksDbStore::get(std::string_view key) const
    {
        std::string raw;
        auto status = impl_->db->Get(rocksdb::ReadOptions(), rocksdb::Slice(key.data(), key.size()), &raw);
        if (status.IsNotFound())
            return std::optional<std::string>();
        if (!status.ok())
            return std::unexpected(from_status(status, "Get"));
        auto value = impl_->codec.open(key, raw);
        if (!value)
            return std::unexpected(value.error());
        return std::optional<std::string>(std::move(*value));
    }

    Result<std::vector<KeyValue>> RocksDbStore::scan_prefix(std::string_view prefix) const
    {
        const rocksdb::Snapshot *snapshot = impl_->db->GetSnapshot();
        rocksdb::ReadOptions options;
        options.snapshot = snapshot;
        Result<std::vector<KeyValue>> out;
        {
            std::unique_ptr<rocksdb::Iterator> it(impl_->db->NewIterator(options));
            out = collect(*it, prefix, impl_->codec);
        }
        impl_->db->ReleaseSnapshot(snapshot);
        return out;
    }

} // namespace arbiter
