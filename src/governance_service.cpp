#include "arbiter/governance_service.hpp"
#include "arbiter/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace arbiter
{

    using Json = nlohmann::json;

    namespace
    {
        template <typename Record>
        Result<std::optional<Record>> load(StoreTransaction &txn, const std::string &key, bool for_update)
        {
            auto raw = for_update ? txn.get_for_update(key) : txn.get(key);
            if (!raw)
                return std::unexpected(raw.error());
            if (!*raw)
                return std::optional<Record>();
            try
            {
                auto record = Record::from_json(Json::parse(**raw));
                if (!record)
                    return std::unexpected(record.error());
                return std::optional<Record>(std::move(*record));
            }
            catch (const Json::parse_error &e)
            {
                return std::unexpected(ArbiterError::parsing(std::format("Corrupt record at {}: {}", key, e.what())));
            }
        }

        Json decision_payload(const DecisionRequest &request)
        {
            return Json{
                {"step", request.step},
                {"status", to_string(request.status)},
                {"partner_id", request.partner_id},
                {"notes", json::nullable(request.decision_notes)},
                {"reason_codes", request.reason_codes},
                {"evidence_snapshot_id", json::nullable(request.evidence_snapshot_id)},
                {"attachments", request.attachments}};
        }
    } // namespace

    Json DecisionReceipt::to_json() const
    {
        return Json{{"approval", approval.to_json()}, {"ledger_entry", ledger_entry.to_json()}};
    }

    GovernanceService::GovernanceService(KeyValueStore &store,
                                         const ArbiterConfig &cfg,
                                         std::shared_ptr<AuditLogger> audit,
                                         Clock clock)
        : store_(store),
          cfg_(cfg),
          audit_(audit ? std::move(audit) : std::make_shared<AuditLogger>()),
          clock_(std::move(clock)),
          ledger_(store, cfg.ledger, clock_),
          approvals_(store),
          registry_(store, ledger_, cfg.ledger, cfg.service, audit_, clock_)
    {
    }

    void GovernanceService::record(std::string_view actor, std::string_view action, std::string_view resource,
                                   const ArbiterError *error, Json details) const
    {
        AuditEvent event;
        event.ts = format_timestamp(clock_());
        event.actor = std::string(actor);
        event.action = std::string(action);
        event.resource = std::string(resource);
        event.result = error ? std::string(error_code_name(error->code)) : "ok";
        if (error)
            details["error"] = error->what();
        event.details = std::move(details);
        audit_->log(event);
    }

    Result<void> GovernanceService::validate(const DecisionRequest &request) const
    {
        if (auto res = keys::validate_id("assessment_id", request.assessment_id); !res)
            return res;
        if (auto res = keys::validate_id("council_id", request.council_id); !res)
            return res;
        if (auto res = keys::validate_id("membership_id", request.membership_id); !res)
            return res;
        if (request.partner_id.empty())
            return std::unexpected(ArbiterError::validation("partner_id is required"));
        if (request.step.empty())
            return std::unexpected(ArbiterError::validation("step is required"));
        if (request.actor_id.empty())
            return std::unexpected(ArbiterError::validation("actor_id is required"));
        if (request.actor_role.empty())
            return std::unexpected(ArbiterError::validation("actor_role is required"));
        if (!request.attachments.is_array())
            return std::unexpected(ArbiterError::validation("attachments must be an array"));
        if (json::RFC8785Canonicalizer::contains_non_finite(request.attachments))
            return std::unexpected(ArbiterError::invalid_input("attachments contain a non-finite number"));
        return {};
    }

    Result<DecisionReceipt> GovernanceService::submit_decision(const DecisionRequest &request)
    {
        auto receipt = [&]() -> Result<DecisionReceipt>
        {
            if (auto res = validate(request); !res)
                return std::unexpected(res.error());

            return run_transaction(store_, cfg_.service.max_submit_retries, [&](StoreTransaction &txn) -> Result<DecisionReceipt>
                                   {
                // Lock order: assessment, membership, approval head, ledger head
                auto assignment = load<AssessmentAssignment>(txn, keys::assessment(request.assessment_id), true);
                if (!assignment)
                    return std::unexpected(assignment.error());
                if (!*assignment || !(*assignment)->council_id)
                    return std::unexpected(ArbiterError::validation(
                        std::format("assessment {} is not assigned to a council", request.assessment_id)));
                if (*(*assignment)->council_id != request.council_id)
                    return std::unexpected(ArbiterError::validation(
                        std::format("assessment {} is assigned to a different council", request.assessment_id)));

                auto council = load<Council>(txn, keys::council(request.council_id), false);
                if (!council)
                    return std::unexpected(council.error());
                if (!*council)
                    return std::unexpected(ArbiterError::not_found("council not found: " + request.council_id));
                if ((*council)->status == CouncilStatus::Archived)
                    return std::unexpected(ArbiterError::conflict(std::format("council {} is archived", request.council_id)));

                auto membership = load<Membership>(txn, keys::membership(request.membership_id), true);
                if (!membership)
                    return std::unexpected(membership.error());
                if (!*membership)
                    return std::unexpected(ArbiterError::not_found("membership not found: " + request.membership_id));
                if ((*membership)->council_id != request.council_id)
                    return std::unexpected(ArbiterError::validation(
                        std::format("membership {} does not belong to council {}", request.membership_id, request.council_id)));
                if (!(*membership)->is_active())
                    return std::unexpected(ArbiterError::conflict(
                        std::format("membership {} is not active", request.membership_id)));

                Approval approval;
                approval.assessment_id = request.assessment_id;
                approval.council_id = request.council_id;
                approval.membership_id = request.membership_id;
                approval.partner_id = request.partner_id;
                approval.step = request.step;
                approval.status = request.status;
                approval.decision_notes = request.decision_notes;
                approval.reason_codes = request.reason_codes;
                approval.evidence_snapshot_id = request.evidence_snapshot_id;
                approval.attachments = request.attachments;
                approval.decided_at = format_timestamp(clock_());

                auto stored = approvals_.insert(txn, std::move(approval));
                if (!stored)
                    return std::unexpected(stored.error());

                LedgerDraft draft;
                draft.assessment_id = request.assessment_id;
                draft.council_id = request.council_id;
                draft.membership_id = request.membership_id;
                draft.approval_id = stored->id;
                draft.actor_id = request.actor_id;
                draft.actor_role = request.actor_role;
                draft.entry_type = entry_type_for_decision(request.status);
                draft.payload = decision_payload(request);

                auto entry = ledger_.append(txn, draft);
                if (!entry)
                    return std::unexpected(entry.error());

                return DecisionReceipt{std::move(*stored), std::move(*entry)}; });
        }();

        if (receipt)
        {
            spdlog::info("Decision recorded: assessment={} membership={} status={} seq={} hash={}",
                         request.assessment_id, request.membership_id, to_string(request.status),
                         receipt->ledger_entry.seq, receipt->ledger_entry.hash);
            record(request.actor_id, "decision.submit", request.assessment_id, nullptr,
                   {{"approval_id", receipt->approval.id},
                    {"ledger_entry_id", receipt->ledger_entry.id},
                    {"status", to_string(request.status)}});
        }
        else
        {
            const auto &err = receipt.error();
            if (err.is_retryable())
                spdlog::error("Decision for {} failed: {}", request.assessment_id, err.what());
            else
                spdlog::warn("Decision for {} rejected: {}", request.assessment_id, err.what());
            record(request.actor_id, "decision.submit", request.assessment_id, &err,
                   {{"membership_id", request.membership_id}, {"status", to_string(request.status)}});
        }
        return receipt;
    }

    Result<ApprovalStatusReport> GovernanceService::check_approval_status(std::string_view assessment_id) const
    {
        auto assignment = registry_.get_assignment(assessment_id);
        if (!assignment)
            return std::unexpected(assignment.error());
        if (!*assignment || !(*assignment)->council_id)
            return std::unexpected(ArbiterError::not_found(
                std::format("assessment {} is not assigned to a council", assessment_id)));

        auto council = registry_.get_council(*(*assignment)->council_id);
        if (!council)
            return std::unexpected(council.error());

        auto votes = approvals_.list(assessment_id);
        if (!votes)
            return std::unexpected(votes.error());

        std::unordered_map<std::string, bool> active;
        std::vector<Approval> counted;
        for (auto &vote : *votes)
        {
            auto it = active.find(vote.membership_id);
            if (it == active.end())
            {
                auto membership = registry_.get_membership(vote.membership_id);
                bool is_active = false;
                if (membership)
                    is_active = membership->is_active();
                else if (membership.error().code != ErrorCode::NotFound)
                    return std::unexpected(membership.error());
                it = active.emplace(vote.membership_id, is_active).first;
            }
            if (it->second)
                counted.push_back(std::move(vote));
        }

        return QuorumSystem::evaluate(*council, counted);
    }

    Result<VerificationResult> GovernanceService::verify_ledger(std::string_view assessment_id) const
    {
        auto result = ledger_.verify(assessment_id);
        if (result)
        {
            Json details{{"entries_checked", result->entries_checked}, {"verified", result->verified}};
            if (!result->verified)
                details["failure_index"] = *result->failure_index;
            record("system", "ledger.verify", assessment_id, nullptr, std::move(details));
        }
        return result;
    }

    Result<LedgerPage> GovernanceService::query_ledger(const LedgerQuery &query) const
    {
        return ledger_.query(query);
    }

    Result<LedgerEntry> GovernanceService::append_event(const EventRequest &request)
    {
        auto entry = [&]() -> Result<LedgerEntry>
        {
            if (is_vote_entry_type(request.entry_type))
                return std::unexpected(ArbiterError::validation(
                    to_string(request.entry_type) + " entries are recorded by submitting a decision"));
            if (request.council_id)
            {
                if (auto res = keys::validate_id("council_id", *request.council_id); !res)
                    return std::unexpected(res.error());
            }
            if (request.membership_id)
            {
                if (auto res = keys::validate_id("membership_id", *request.membership_id); !res)
                    return std::unexpected(res.error());
            }

            LedgerDraft draft;
            draft.assessment_id = request.assessment_id;
            draft.council_id = request.council_id;
            draft.membership_id = request.membership_id;
            draft.actor_id = request.actor_id;
            draft.actor_role = request.actor_role;
            draft.entry_type = request.entry_type;
            draft.payload = request.payload;

            return run_transaction(store_, cfg_.service.max_submit_retries, [&](StoreTransaction &txn)
                                   { return ledger_.append(txn, draft); });
        }();

        if (entry)
        {
            spdlog::info("Ledger event appended: assessment={} type={} seq={}",
                         entry->assessment_id, to_string(entry->entry_type), entry->seq);
            record(request.actor_id, "ledger.append", request.assessment_id, nullptr,
                   {{"entry_id", entry->id}, {"entry_type", to_string(entry->entry_type)}});
        }
        else
        {
            spdlog::warn("Ledger event for {} rejected: {}", request.assessment_id, entry.error().what());
            record(request.actor_id, "ledger.append", request.assessment_id, &entry.error(),
                   {{"entry_type", to_string(request.entry_type)}});
        }
        return entry;
    }

    Result<std::vector<Approval>> GovernanceService::list_approvals(std::string_view assessment_id) const
    {
        return approvals_.list(assessment_id);
    }

} // namespace arbiter
