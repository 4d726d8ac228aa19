#include "arbiter/memory_store.hpp"
#include <format>

namespace arbiter
{

    class MemoryTransaction : public StoreTransaction
    {
    public:
        explicit MemoryTransaction(MemoryStore &store) : store_(store) {}

        ~MemoryTransaction() override
        {
            rollback();
        }

        Result<std::optional<std::string>> get(std::string_view key) override
        {
            if (finished_)
                return std::unexpected(ArbiterError::internal("transaction already finished"));
            if (auto it = writes_.find(key); it != writes_.end())
                return it->second;
            return store_.get(key);
        }

        Result<std::optional<std::string>> get_for_update(std::string_view key) override
        {
            if (finished_)
                return std::unexpected(ArbiterError::internal("transaction already finished"));
            if (auto res = lock(std::string(key)); !res)
                return std::unexpected(res.error());
            return get(key);
        }

        Result<void> put(std::string_view key, std::string_view value) override
        {
            if (finished_)
                return std::unexpected(ArbiterError::internal("transaction already finished"));
            if (auto res = lock(std::string(key)); !res)
                return res;
            writes_.insert_or_assign(std::string(key), std::optional<std::string>(value));
            return {};
        }

        Result<void> erase(std::string_view key) override
        {
            if (finished_)
                return std::unexpected(ArbiterError::internal("transaction already finished"));
            if (auto res = lock(std::string(key)); !res)
                return res;
            writes_.insert_or_assign(std::string(key), std::nullopt);
            return {};
        }

        Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) override
        {
            if (finished_)
                return std::unexpected(ArbiterError::internal("transaction already finished"));

            auto committed = store_.scan_prefix(prefix);
            if (!committed)
                return committed;

            std::map<std::string, std::string, std::less<>> merged(
                std::make_move_iterator(committed->begin()),
                std::make_move_iterator(committed->end()));
            for (auto it = writes_.lower_bound(prefix); it != writes_.end() && it->first.starts_with(prefix); ++it)
            {
                if (it->second)
                    merged.insert_or_assign(it->first, *it->second);
                else
                    merged.erase(it->first);
            }
            return std::vector<KeyValue>(merged.begin(), merged.end());
        }

        Result<void> commit() override
        {
            if (finished_)
                return std::unexpected(ArbiterError::internal("transaction already finished"));
            {
                std::unique_lock lock(store_.data_mutex_);
                for (auto &[key, value] : writes_)
                {
                    if (value)
                        store_.data_.insert_or_assign(key, std::move(*value));
                    else
                        store_.data_.erase(key);
                }
            }
            writes_.clear();
            release_locks();
            finished_ = true;
            return {};
        }

        void rollback() override
        {
            if (finished_)
                return;
            writes_.clear();
            release_locks();
            finished_ = true;
        }

    private:
        Result<void> lock(const std::string &key)
        {
            if (held_.contains(key))
                return {};
            auto mutex = store_.lock_for(key);
            if (!mutex->try_lock_for(store_.lock_timeout_))
            {
                return std::unexpected(ArbiterError::busy(std::format("lock wait timed out on {}", key)));
            }
            held_.emplace(key, std::move(mutex));
            return {};
        }

        void release_locks()
        {
            for (auto &[_, mutex] : held_)
                mutex->unlock();
            held_.clear();
        }

        MemoryStore &store_;
        std::map<std::string, std::optional<std::string>, std::less<>> writes_;
        std::map<std::string, std::shared_ptr<std::timed_mutex>> held_;
        bool finished_{false};
    };

    MemoryStore::MemoryStore(std::chrono::milliseconds lock_timeout)
        : lock_timeout_(lock_timeout)
    {
    }

    std::unique_ptr<StoreTransaction> MemoryStore::begin()
    {
        return std::make_unique<MemoryTransaction>(*this);
    }

    Result<std::optional<std::string>> MemoryStore::get(std::string_view key) const
    {
        std::shared_lock lock(data_mutex_);
        if (auto it = data_.find(key); it != data_.end())
            return std::optional<std::string>(it->second);
        return std::optional<std::string>();
    }

    Result<std::vector<KeyValue>> MemoryStore::scan_prefix(std::string_view prefix) const
    {
        std::vector<KeyValue> out;
        std::shared_lock lock(data_mutex_);
        for (auto it = data_.lower_bound(prefix); it != data_.end() && it->first.starts_with(prefix); ++it)
        {
            out.emplace_back(it->first, it->second);
        }
        return out;
    }

    std::shared_ptr<std::timed_mutex> MemoryStore::lock_for(const std::string &key)
    {
        std::lock_guard lock(locks_mutex_);
        auto &slot = locks_[key];
        if (!slot)
            slot = std::make_shared<std::timed_mutex>();
        return slot;
    }

} // namespace arbiter
