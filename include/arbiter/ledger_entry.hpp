#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace arbiter
{

    /**
     * Caller-supplied content of a new ledger entry. The ledger fills in the
     * id, sequence, timestamp and chain fields.
     */
    struct LedgerDraft
    {
        std::string assessment_id;
        std::optional<std::string> council_id;
        std::optional<std::string> membership_id;
        std::optional<std::string> approval_id;
        std::string actor_id;
        std::string actor_role;
        LedgerEntryType entry_type{LedgerEntryType::SystemEvent};
        nlohmann::json payload = nlohmann::json::object();
    };

    /**
     * One link of an assessment's evidence chain. Never mutated once written.
     */
    struct LedgerEntry
    {
        std::string id;
        std::string assessment_id;
        std::optional<std::string> council_id;
        std::optional<std::string> membership_id;
        std::optional<std::string> approval_id;
        std::string actor_id;
        std::string actor_role;
        LedgerEntryType entry_type{LedgerEntryType::SystemEvent};
        nlohmann::json payload = nlohmann::json::object();
        std::string hash;                     // SHA-256 hex of the canonical preimage
        std::optional<std::string> prev_hash; // null only for the first entry
        std::string created_at;
        uint64_t seq{0}; // 1-based position within the assessment

        /** Full record, as stored and returned by the API */
        nlohmann::json to_json() const;

        static Result<LedgerEntry> from_json(const nlohmann::json &j);

        /**
         * The hashed content: every logical field including the nested payload
         * and the timestamp. Excludes hash and seq.
         */
        nlohmann::json hash_preimage() const;

        /** RFC 8785 canonical form of hash_preimage() */
        Result<std::string> to_canonical_json() const;

        /** SHA-256 hex of to_canonical_json(); InvalidInput for non-finite payload numbers */
        Result<std::string> compute_hash() const;
    };

    /** Tail pointer of an assessment's chain, stored under keys::ledger_head */
    struct LedgerHead
    {
        uint64_t seq{0};
        std::string hash;
        std::string created_at;

        nlohmann::json to_json() const;
        static Result<LedgerHead> from_json(const nlohmann::json &j);
    };

} // namespace arbiter
