#pragma once

#include "config.hpp"
#include "ledger_entry.hpp"
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arbiter
{

    /**
     * Outcome of walking an assessment's chain. A broken chain is reported
     * here, not as an error: failure_index is the 0-based position of the
     * first offending entry, or of the first missing one when the tail
     * pointer names more entries than are stored.
     */
    struct VerificationResult
    {
        bool verified{true};
        std::size_t entries_checked{0};
        std::optional<std::size_t> failure_index;
        std::optional<std::string> expected_hash;
        std::optional<std::string> actual_hash;
        std::optional<std::string> reason; // sequence_gap, prev_hash_mismatch, hash_mismatch, unreadable_entry, head_mismatch

        nlohmann::json to_json() const;
    };

    struct LedgerQuery
    {
        std::string assessment_id;
        std::vector<LedgerEntryType> entry_types; // empty = all
        std::optional<uint64_t> cursor;           // seq of the last entry already seen
        std::optional<std::size_t> limit;
    };

    struct LedgerPage
    {
        std::vector<LedgerEntry> entries;
        std::optional<uint64_t> next_cursor; // absent on the last page

        nlohmann::json to_json() const;
    };

    /**
     * Per-assessment hash-chained, append-only evidence ledger.
     *
     * Appends to one assessment serialize on the lock of its tail pointer
     * (keys::ledger_head), held until the enclosing transaction finishes;
     * appends to different assessments never contend.
     */
    class EvidenceLedger
    {
    public:
        EvidenceLedger(KeyValueStore &store, LedgerConfig cfg = {}, Clock clock = system_clock());

        /**
         * Append inside the caller's transaction. Nothing is visible until the
         * caller commits; a rollback discards the entry and the tail update.
         */
        Result<LedgerEntry> append(StoreTransaction &txn, const LedgerDraft &draft) const;

        /** Append in a transaction of its own */
        Result<LedgerEntry> append(const LedgerDraft &draft);

        /** Read-only walk of the committed chain */
        Result<VerificationResult> verify(std::string_view assessment_id) const;

        /** Ascending page of entries, optionally filtered by type */
        Result<LedgerPage> query(const LedgerQuery &query) const;

        /** Every committed entry in chain order */
        Result<std::vector<LedgerEntry>> entries(std::string_view assessment_id) const;

    private:
        KeyValueStore &store_;
        LedgerConfig cfg_;
        Clock clock_;
    };

} // namespace arbiter
