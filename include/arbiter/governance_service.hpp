#pragma once

#include "approval_store.hpp"
#include "audit.hpp"
#include "config.hpp"
#include "council_registry.hpp"
#include "evidence_ledger.hpp"
#include "quorum_system.hpp"
#include "storage.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arbiter
{

    /** A council member's vote on one step of an assessment */
    struct DecisionRequest
    {
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
        std::string actor_id;
        std::string actor_role;
    };

    struct DecisionReceipt
    {
        Approval approval;
        LedgerEntry ledger_entry;

        nlohmann::json to_json() const;
    };

    /** A non-vote governance event for an assessment's chain */
    struct EventRequest
    {
        std::string assessment_id;
        std::optional<std::string> council_id;
        std::optional<std::string> membership_id;
        std::string actor_id;
        std::string actor_role;
        LedgerEntryType entry_type{LedgerEntryType::SystemEvent};
        nlohmann::json payload = nlohmann::json::object();
    };

    /**
     * Entry point for governance operations.
     *
     * A decision writes its vote row and its ledger entry in one transaction:
     * both become visible together or neither does. Transactions that lose a
     * lock wait are retried up to service.max_submit_retries times.
     */
    class GovernanceService
    {
    public:
        GovernanceService(KeyValueStore &store,
                          const ArbiterConfig &cfg,
                          std::shared_ptr<AuditLogger> audit = nullptr,
                          Clock clock = system_clock());

        CouncilRegistry &councils() { return registry_; }
        const CouncilRegistry &councils() const { return registry_; }

        const EvidenceLedger &ledger() const { return ledger_; }

        /**
         * Record a vote. Rejected with no state change unless the assessment is
         * assigned to council_id, that council is active, and membership_id is
         * an active membership of it.
         */
        Result<DecisionReceipt> submit_decision(const DecisionRequest &request);

        /** Verdict over votes of currently active memberships; NotFound if unassigned */
        Result<ApprovalStatusReport> check_approval_status(std::string_view assessment_id) const;

        Result<VerificationResult> verify_ledger(std::string_view assessment_id) const;

        Result<LedgerPage> query_ledger(const LedgerQuery &query) const;

        /** Append a non-vote event; vote types are rejected */
        Result<LedgerEntry> append_event(const EventRequest &request);

        Result<std::vector<Approval>> list_approvals(std::string_view assessment_id) const;

    private:
        Result<void> validate(const DecisionRequest &request) const;

        void record(std::string_view actor, std::string_view action, std::string_view resource,
                    const ArbiterError *error, nlohmann::json details = nlohmann::json::object()) const;

        KeyValueStore &store_;
        ArbiterConfig cfg_;
        std::shared_ptr<AuditLogger> audit_;
        Clock clock_;
        EvidenceLedger ledger_;
        ApprovalStore approvals_;
        CouncilRegistry registry_;
    };

} // namespace arbiter
