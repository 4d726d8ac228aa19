#pragma once

#include "storage.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace arbiter
{

    /**
     * In-process KeyValueStore with the same transactional contract as the
     * RocksDB backend: buffered writes, per-key exclusive locks with a bounded
     * wait, and atomic commit. Used for tests and ephemeral runs.
     */
    class MemoryStore : public KeyValueStore
    {
    public:
        explicit MemoryStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(1000));

        std::unique_ptr<StoreTransaction> begin() override;

        Result<std::optional<std::string>> get(std::string_view key) const override;

        Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) const override;

    private:
        friend class MemoryTransaction;

        std::shared_ptr<std::timed_mutex> lock_for(const std::string &key);

        mutable std::shared_mutex data_mutex_;
        std::map<std::string, std::string, std::less<>> data_;

        std::mutex locks_mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> locks_;

        std::chrono::milliseconds lock_timeout_;
    };

} // namespace arbiter
