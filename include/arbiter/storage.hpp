#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <type_traits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arbiter
{

    using KeyValue = std::pair<std::string, std::string>;

    /**
     * A unit of work against a KeyValueStore.
     *
     * Writes are buffered until commit(). get_for_update() takes an exclusive
     * lock on the key that is held until commit() or rollback(); concurrent
     * transactions locking the same key serialize, others proceed in parallel.
     * Destroying an uncommitted transaction rolls it back.
     */
    class StoreTransaction
    {
    public:
        virtual ~StoreTransaction() = default;

        virtual Result<std::optional<std::string>> get(std::string_view key) = 0;

        /**
         * Read a key and lock it for the rest of the transaction.
         * A lock wait that exceeds the store's timeout yields ErrorCode::Busy.
         */
        virtual Result<std::optional<std::string>> get_for_update(std::string_view key) = 0;

        virtual Result<void> put(std::string_view key, std::string_view value) = 0;

        virtual Result<void> erase(std::string_view key) = 0;

        /** Keys starting with prefix in ascending byte order, including this transaction's writes */
        virtual Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) = 0;

        virtual Result<void> commit() = 0;

        virtual void rollback() = 0;
    };

    /**
     * Abstract interface for the persistence tier.
     * Implementations: RocksDbStore (durable) and MemoryStore (in-process).
     */
    class KeyValueStore
    {
    public:
        virtual ~KeyValueStore() = default;

        virtual std::unique_ptr<StoreTransaction> begin() = 0;

        /** Read committed data outside any transaction */
        virtual Result<std::optional<std::string>> get(std::string_view key) const = 0;

        /** Consistent point-in-time scan of committed data */
        virtual Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) const = 0;
    };

    /**
     * Run work(txn) in a fresh transaction and commit it. Attempts that fail
     * with ErrorCode::Busy, in the work or at commit, are rolled back and
     * re-run up to max_retries more times; any other error is returned as is.
     */
    template <typename Work>
    auto run_transaction(KeyValueStore &store, std::size_t max_retries, Work &&work)
        -> std::invoke_result_t<Work &, StoreTransaction &>
    {
        for (std::size_t attempt = 0;; ++attempt)
        {
            auto txn = store.begin();
            auto result = work(*txn);
            if (result)
            {
                auto committed = txn->commit();
                if (committed)
                    return result;
                result = std::unexpected(committed.error());
            }
            if (result.error().code != ErrorCode::Busy || attempt >= max_retries)
                return result;
            spdlog::warn("Transaction contention (attempt {}/{}): {}", attempt + 1, max_retries + 1, result.error().what());
        }
    }

    /**
     * Key layout. Every record family lives under its own prefix; per-assessment
     * families embed the assessment id so that scans never cross assessments.
     */
    namespace keys
    {
        inline constexpr std::size_t kSequenceWidth = 20;
        inline constexpr std::size_t kMaxIdLength = 128;

        /** Identifiers are embedded in keys: non-empty, bounded, no '/' or control bytes */
        Result<void> validate_id(std::string_view field, std::string_view id);

        std::string sequence(uint64_t seq);

        std::string council(std::string_view council_id);
        std::string council_prefix();

        std::string membership(std::string_view membership_id);
        std::string membership_prefix();
        std::string membership_index(std::string_view council_id, std::string_view user_id);
        std::string membership_index_prefix(std::string_view council_id);

        std::string assessment(std::string_view assessment_id);
        std::string assessment_prefix();

        std::string approval(std::string_view assessment_id, uint64_t seq);
        std::string approval_prefix(std::string_view assessment_id);
        std::string approval_head(std::string_view assessment_id);

        std::string ledger_entry(std::string_view assessment_id, uint64_t seq);
        std::string ledger_prefix(std::string_view assessment_id);
        std::string ledger_head(std::string_view assessment_id);
    } // namespace keys

} // namespace arbiter
