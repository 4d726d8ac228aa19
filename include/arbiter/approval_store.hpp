#pragma once

#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arbiter
{

    /**
     * One vote by a council membership on an assessment step. Immutable once written.
     */
    struct Approval
    {
        std::string id;
        std::string assessment_id;
        std::string council_id;
        std::string membership_id;
        std::string partner_id;
        std::string step;
        ApprovalStatus status{ApprovalStatus::Pending};
        std::optional<std::string> decision_notes;
        std::vector<std::string> reason_codes;
        std::optional<std::string> evidence_snapshot_id;
        nlohmann::json attachments = nlohmann::json::array();
        std::string decided_at;
        uint64_t seq{0}; // insertion order within the assessment

        nlohmann::json to_json() const;
        static Result<Approval> from_json(const nlohmann::json &j);
    };

    /**
     * Vote rows, keyed by assessment and insertion sequence. Writes always join
     * a caller's transaction so that a vote and its ledger entry commit together.
     */
    class ApprovalStore
    {
    public:
        explicit ApprovalStore(KeyValueStore &store);

        /** Assigns seq (and id when empty) and stages the row in txn */
        Result<Approval> insert(StoreTransaction &txn, Approval approval) const;

        /** Committed votes of an assessment in insertion order */
        Result<std::vector<Approval>> list(std::string_view assessment_id) const;

    private:
        KeyValueStore &store_;
    };

} // namespace arbiter
