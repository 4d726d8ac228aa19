#include "arbiter/council_registry.hpp"
#include "arbiter/crypto.hpp"
#include "arbiter/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace arbiter
{

    using Json = nlohmann::json;

    namespace
    {
        template <typename Record>
        Result<Record> decode(const std::string &key, const std::string &raw)
        {
            try
            {
                return Record::from_json(Json::parse(raw));
            }
            catch (const Json::parse_error &e)
            {
                return std::unexpected(ArbiterError::parsing(std::format("Corrupt record at {}: {}", key, e.what())));
            }
        }

        template <typename Record>
        Result<std::optional<Record>> decode_optional(const std::string &key, Result<std::optional<std::string>> raw)
        {
            if (!raw)
                return std::unexpected(raw.error());
            if (!*raw)
                return std::optional<Record>();
            auto record = decode<Record>(key, **raw);
            if (!record)
                return std::unexpected(record.error());
            return std::optional<Record>(std::move(*record));
        }

        template <typename Record>
        Result<Record> decode_required(const std::string &key,
                                       Result<std::optional<std::string>> raw,
                                       std::string_view what,
                                       std::string_view id)
        {
            auto record = decode_optional<Record>(key, std::move(raw));
            if (!record)
                return std::unexpected(record.error());
            if (!*record)
                return std::unexpected(ArbiterError::not_found(std::format("{} not found: {}", what, id)));
            return std::move(**record);
        }

        Result<void> ensure_active(const Council &council)
        {
            if (council.status == CouncilStatus::Archived)
                return std::unexpected(ArbiterError::conflict(std::format("council {} is archived", council.id)));
            return {};
        }

        Result<void> validate_quorum(int quorum)
        {
            if (quorum < 1)
                return std::unexpected(ArbiterError::validation("quorum must be at least 1"));
            return {};
        }

        Result<void> validate_actor(const Actor &actor)
        {
            if (actor.id.empty())
                return std::unexpected(ArbiterError::validation("actor_id is required"));
            if (actor.role.empty())
                return std::unexpected(ArbiterError::validation("actor_role is required"));
            return {};
        }
    } // namespace

    Json CouncilSummary::to_json() const
    {
        Json j = council.to_json();
        j["counts"] = {{"active_members", active_members},
                       {"revoked_members", revoked_members},
                       {"assessments", assessments}};
        return j;
    }

    Json CouncilPage::to_json() const
    {
        Json items = Json::array();
        for (const auto &c : councils)
            items.push_back(c.to_json());
        return Json{{"councils", items}, {"next_cursor", json::nullable(next_cursor)}};
    }

    CouncilRegistry::CouncilRegistry(KeyValueStore &store,
                                     const EvidenceLedger &ledger,
                                     const LedgerConfig &ledger_cfg,
                                     const ServiceConfig &service_cfg,
                                     std::shared_ptr<AuditLogger> audit,
                                     Clock clock)
        : store_(store),
          ledger_(ledger),
          ledger_cfg_(ledger_cfg),
          service_cfg_(service_cfg),
          audit_(audit ? std::move(audit) : std::make_shared<AuditLogger>()),
          clock_(std::move(clock))
    {
    }

    void CouncilRegistry::record(std::string_view actor, std::string_view action, std::string_view resource,
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

    // ========== Councils ==========

    Result<Council> CouncilRegistry::create_council(const CouncilDraft &draft)
    {
        if (draft.name.empty())
            return std::unexpected(ArbiterError::validation("council name is required"));
        if (auto res = validate_quorum(draft.quorum); !res)
            return std::unexpected(res.error());

        Council council;
        council.id = crypto::SecureRandom::generate_id("cncl");
        council.name = draft.name;
        council.description = draft.description;
        council.org_id = draft.org_id;
        council.quorum = draft.quorum;
        council.require_unanimous = draft.require_unanimous;
        council.approval_policy = draft.approval_policy;
        council.metadata = draft.metadata;
        council.created_at = format_timestamp(clock_());
        council.updated_at = council.created_at;

        auto res = run_transaction(store_, service_cfg_.max_submit_retries, [&](StoreTransaction &txn) -> Result<void>
                                   { return txn.put(keys::council(council.id), council.to_json().dump()); });
        if (!res)
        {
            spdlog::error("Council create failed: {}", res.error().what());
            return std::unexpected(res.error());
        }

        spdlog::info("Council created: {} ({}) quorum={} unanimous={}",
                     council.id, council.name, council.quorum, council.require_unanimous);
        record("system", "council.create", council.id, nullptr, {{"name", council.name}, {"quorum", council.quorum}});
        return council;
    }

    Result<Council> CouncilRegistry::get_council(std::string_view council_id) const
    {
        if (auto res = keys::validate_id("council_id", council_id); !res)
            return std::unexpected(res.error());
        auto key = keys::council(council_id);
        return decode_required<Council>(key, store_.get(key), "council", council_id);
    }

    Result<CouncilSummary> CouncilRegistry::describe_council(std::string_view council_id) const
    {
        auto council = get_council(council_id);
        if (!council)
            return std::unexpected(council.error());

        auto members = list_members(council_id);
        if (!members)
            return std::unexpected(members.error());
        auto assessments = list_council_assessments(council_id);
        if (!assessments)
            return std::unexpected(assessments.error());

        CouncilSummary summary{std::move(*council)};
        summary.active_members = static_cast<std::size_t>(
            std::count_if(members->begin(), members->end(), [](const Membership &m)
                          { return m.is_active(); }));
        summary.revoked_members = members->size() - summary.active_members;
        summary.assessments = assessments->size();
        return summary;
    }

    Result<CouncilPage> CouncilRegistry::list_councils(const CouncilFilter &filter) const
    {
        std::size_t limit = filter.limit.value_or(kDefaultCouncilPageLimit);
        if (limit == 0)
            limit = kDefaultCouncilPageLimit;
        limit = std::min(limit, ledger_cfg_.max_page_limit);

        auto rows = store_.scan_prefix(keys::council_prefix());
        if (!rows)
            return std::unexpected(rows.error());

        CouncilPage page;
        for (const auto &[key, raw] : *rows)
        {
            auto council = decode<Council>(key, raw);
            if (!council)
                return std::unexpected(council.error());
            if (filter.cursor && council->id <= *filter.cursor)
                continue;
            if (filter.status && council->status != *filter.status)
                continue;
            if (filter.org_id && council->org_id != filter.org_id)
                continue;
            if (page.councils.size() == limit)
            {
                page.next_cursor = page.councils.back().id;
                break;
            }
            page.councils.push_back(std::move(*council));
        }
        return page;
    }

    Result<Council> CouncilRegistry::mutate_council(std::string_view council_id,
                                                    const std::function<Result<void>(Council &)> &change)
    {
        if (auto res = keys::validate_id("council_id", council_id); !res)
            return std::unexpected(res.error());

        auto key = keys::council(council_id);
        return run_transaction(store_, service_cfg_.max_submit_retries, [&](StoreTransaction &txn) -> Result<Council>
                               {
            auto council = decode_required<Council>(key, txn.get_for_update(key), "council", council_id);
            if (!council)
                return council;
            if (auto res = ensure_active(*council); !res)
                return std::unexpected(res.error());
            if (auto res = change(*council); !res)
                return std::unexpected(res.error());
            council->updated_at = format_timestamp(clock_());
            if (auto res = txn.put(key, council->to_json().dump()); !res)
                return std::unexpected(res.error());
            return council; });
    }

    Result<Council> CouncilRegistry::update_council(std::string_view council_id, const CouncilUpdate &update)
    {
        if (update.name && update.name->empty())
            return std::unexpected(ArbiterError::validation("council name must not be empty"));
        if (update.quorum)
        {
            if (auto res = validate_quorum(*update.quorum); !res)
                return std::unexpected(res.error());
        }

        auto council = mutate_council(council_id, [&](Council &c) -> Result<void>
                                      {
            if (update.name)
                c.name = *update.name;
            if (update.description)
                c.description = *update.description;
            if (update.quorum)
                c.quorum = *update.quorum;
            if (update.require_unanimous)
                c.require_unanimous = *update.require_unanimous;
            if (update.approval_policy)
                c.approval_policy = *update.approval_policy;
            if (update.metadata)
                c.metadata = *update.metadata;
            return {}; });
        if (council)
            spdlog::info("Council updated: {} quorum={} unanimous={}", council->id, council->quorum, council->require_unanimous);
        record("system", "council.update", council_id, council ? nullptr : &council.error());
        return council;
    }

    Result<Council> CouncilRegistry::archive_council(std::string_view council_id)
    {
        auto council = mutate_council(council_id, [](Council &c) -> Result<void>
                                      {
            c.status = CouncilStatus::Archived;
            return {}; });
        if (council)
            spdlog::info("Council archived: {}", council->id);
        record("system", "council.archive", council_id, council ? nullptr : &council.error());
        return council;
    }

    // ========== Memberships ==========

    Result<Membership> CouncilRegistry::add_member(const MemberDraft &draft)
    {
        if (auto res = keys::validate_id("council_id", draft.council_id); !res)
            return std::unexpected(res.error());
        if (auto res = keys::validate_id("user_id", draft.user_id); !res)
            return std::unexpected(res.error());

        auto council_key = keys::council(draft.council_id);
        auto index_key = keys::membership_index(draft.council_id, draft.user_id);

        bool reactivated = false;
        auto membership = run_transaction(store_, service_cfg_.max_submit_retries, [&](StoreTransaction &txn) -> Result<Membership>
                                          {
            // locked so that archiving the council cannot interleave
            auto council = decode_required<Council>(council_key, txn.get_for_update(council_key), "council", draft.council_id);
            if (!council)
                return std::unexpected(council.error());
            if (auto res = ensure_active(*council); !res)
                return std::unexpected(res.error());

            auto existing_id = txn.get_for_update(index_key);
            if (!existing_id)
                return std::unexpected(existing_id.error());

            auto now = format_timestamp(clock_());
            Membership m;
            if (*existing_id)
            {
                auto key = keys::membership(**existing_id);
                auto current = decode_required<Membership>(key, txn.get_for_update(key), "membership", **existing_id);
                if (!current)
                    return current;
                m = std::move(*current);
                reactivated = true;
            }
            else
            {
                m.id = crypto::SecureRandom::generate_id("mbr");
                m.council_id = draft.council_id;
                m.user_id = draft.user_id;
                m.created_at = now;
                reactivated = false;
            }

            m.status = MembershipStatus::Active;
            m.role = draft.role;
            m.permissions = draft.permissions;
            m.notes = draft.notes;
            m.assigned_by = draft.assigned_by;
            m.assigned_at = now;
            m.revoked_at.reset();

            if (auto res = txn.put(keys::membership(m.id), m.to_json().dump()); !res)
                return std::unexpected(res.error());
            if (auto res = txn.put(index_key, m.id); !res)
                return std::unexpected(res.error());
            return m; });

        if (membership)
        {
            spdlog::info("Member {}: {} user={} council={} role={}",
                         reactivated ? "reactivated" : "added", membership->id, membership->user_id,
                         membership->council_id, to_string(membership->role));
        }
        record(draft.assigned_by.value_or("system"), "membership.add", draft.council_id,
               membership ? nullptr : &membership.error(),
               {{"user_id", draft.user_id}, {"role", to_string(draft.role)}, {"reactivated", membership && reactivated}});
        return membership;
    }

    Result<Membership> CouncilRegistry::mutate_membership(std::string_view membership_id,
                                                          const std::function<Result<void>(Membership &)> &change)
    {
        if (auto res = keys::validate_id("membership_id", membership_id); !res)
            return std::unexpected(res.error());

        auto key = keys::membership(membership_id);
        return run_transaction(store_, service_cfg_.max_submit_retries, [&](StoreTransaction &txn) -> Result<Membership>
                               {
            // council before membership, the same lock order as add_member
            auto snapshot = decode_required<Membership>(key, txn.get(key), "membership", membership_id);
            if (!snapshot)
                return snapshot;
            auto council_key = keys::council(snapshot->council_id);
            auto council = decode_required<Council>(council_key, txn.get_for_update(council_key), "council", snapshot->council_id);
            if (!council)
                return std::unexpected(council.error());
            if (auto res = ensure_active(*council); !res)
                return std::unexpected(res.error());

            auto membership = decode_required<Membership>(key, txn.get_for_update(key), "membership", membership_id);
            if (!membership)
                return membership;

            if (auto res = change(*membership); !res)
                return std::unexpected(res.error());
            if (auto res = txn.put(key, membership->to_json().dump()); !res)
                return std::unexpected(res.error());
            return membership; });
    }

    Result<Membership> CouncilRegistry::update_membership(std::string_view membership_id, const MembershipUpdate &update)
    {
        auto membership = mutate_membership(membership_id, [&](Membership &m) -> Result<void>
                                            {
            if (update.role)
                m.role = *update.role;
            if (update.permissions)
                m.permissions = *update.permissions;
            if (update.notes)
                m.notes = *update.notes;
            if (update.status && *update.status != m.status)
            {
                m.status = *update.status;
                if (m.status == MembershipStatus::Revoked)
                    m.revoked_at = format_timestamp(clock_());
                else
                    m.revoked_at.reset();
            }
            return {}; });
        if (membership)
            spdlog::info("Membership updated: {} role={} status={}", membership->id,
                         to_string(membership->role), to_string(membership->status));
        record("system", "membership.update", membership_id, membership ? nullptr : &membership.error());
        return membership;
    }

    Result<Membership> CouncilRegistry::revoke_member(std::string_view membership_id,
                                                      const std::optional<std::string> &notes)
    {
        auto membership = mutate_membership(membership_id, [&](Membership &m) -> Result<void>
                                            {
            if (notes)
                m.notes = *notes;
            if (m.status != MembershipStatus::Revoked)
            {
                m.status = MembershipStatus::Revoked;
                m.revoked_at = format_timestamp(clock_());
            }
            return {}; });
        if (membership)
            spdlog::info("Membership revoked: {} user={} council={}", membership->id,
                         membership->user_id, membership->council_id);
        record("system", "membership.revoke", membership_id, membership ? nullptr : &membership.error());
        return membership;
    }

    Result<Membership> CouncilRegistry::get_membership(std::string_view membership_id) const
    {
        if (auto res = keys::validate_id("membership_id", membership_id); !res)
            return std::unexpected(res.error());
        auto key = keys::membership(membership_id);
        return decode_required<Membership>(key, store_.get(key), "membership", membership_id);
    }

    Result<std::vector<Membership>> CouncilRegistry::list_members(std::string_view council_id,
                                                                  std::optional<MembershipStatus> status) const
    {
        if (auto council = get_council(council_id); !council)
            return std::unexpected(council.error());

        auto index = store_.scan_prefix(keys::membership_index_prefix(council_id));
        if (!index)
            return std::unexpected(index.error());

        std::vector<Membership> out;
        for (const auto &[_, membership_id] : *index)
        {
            auto membership = get_membership(membership_id);
            if (!membership)
                return std::unexpected(membership.error());
            if (status && membership->status != *status)
                continue;
            out.push_back(std::move(*membership));
        }
        return out;
    }

    // ========== Assessments ==========

    Result<AssessmentAssignment> CouncilRegistry::assign_assessment(std::string_view assessment_id,
                                                                    std::string_view council_id,
                                                                    const Actor &actor)
    {
        if (auto res = keys::validate_id("assessment_id", assessment_id); !res)
            return std::unexpected(res.error());
        if (auto res = keys::validate_id("council_id", council_id); !res)
            return std::unexpected(res.error());
        if (auto res = validate_actor(actor); !res)
            return std::unexpected(res.error());

        auto council_key = keys::council(council_id);
        auto assessment_key = keys::assessment(assessment_id);

        auto assignment = run_transaction(store_, service_cfg_.max_submit_retries, [&](StoreTransaction &txn) -> Result<AssessmentAssignment>
                                          {
            auto council = decode_required<Council>(council_key, txn.get_for_update(council_key), "council", council_id);
            if (!council)
                return std::unexpected(council.error());
            if (auto res = ensure_active(*council); !res)
                return std::unexpected(res.error());

            auto current = decode_optional<AssessmentAssignment>(assessment_key, txn.get_for_update(assessment_key));
            if (!current)
                return std::unexpected(current.error());
            std::optional<std::string> previous = *current ? (*current)->council_id : std::nullopt;

            AssessmentAssignment next{std::string(assessment_id), std::string(council_id), format_timestamp(clock_())};
            if (auto res = txn.put(assessment_key, next.to_json().dump()); !res)
                return std::unexpected(res.error());

            LedgerDraft draft;
            draft.assessment_id = next.assessment_id;
            draft.council_id = next.council_id;
            draft.actor_id = actor.id;
            draft.actor_role = actor.role;
            draft.entry_type = LedgerEntryType::Assignment;
            draft.payload = Json{{"action", "assigned"},
                                 {"council_id", *next.council_id},
                                 {"previous_council_id", json::nullable(previous)}};
            if (auto entry = ledger_.append(txn, draft); !entry)
                return std::unexpected(entry.error());
            return next; });

        if (assignment)
            spdlog::info("Assessment {} assigned to council {} by {}", assessment_id, council_id, actor.id);
        record(actor.id, "assessment.assign", assessment_id, assignment ? nullptr : &assignment.error(),
               {{"council_id", std::string(council_id)}});
        return assignment;
    }

    Result<AssessmentAssignment> CouncilRegistry::unassign_assessment(std::string_view assessment_id, const Actor &actor)
    {
        if (auto res = keys::validate_id("assessment_id", assessment_id); !res)
            return std::unexpected(res.error());
        if (auto res = validate_actor(actor); !res)
            return std::unexpected(res.error());

        auto assessment_key = keys::assessment(assessment_id);
        auto assignment = run_transaction(store_, service_cfg_.max_submit_retries, [&](StoreTransaction &txn) -> Result<AssessmentAssignment>
                                          {
            auto current = decode_optional<AssessmentAssignment>(assessment_key, txn.get_for_update(assessment_key));
            if (!current)
                return std::unexpected(current.error());
            if (!*current || !(*current)->council_id)
                return std::unexpected(ArbiterError::not_found(std::format("assessment {} is not assigned to a council", assessment_id)));

            auto previous = *(*current)->council_id;
            AssessmentAssignment next{std::string(assessment_id), std::nullopt, format_timestamp(clock_())};
            if (auto res = txn.put(assessment_key, next.to_json().dump()); !res)
                return std::unexpected(res.error());

            LedgerDraft draft;
            draft.assessment_id = next.assessment_id;
            draft.council_id = previous;
            draft.actor_id = actor.id;
            draft.actor_role = actor.role;
            draft.entry_type = LedgerEntryType::Assignment;
            draft.payload = Json{{"action", "unassigned"}, {"previous_council_id", previous}};
            if (auto entry = ledger_.append(txn, draft); !entry)
                return std::unexpected(entry.error());
            return next; });

        if (assignment)
            spdlog::info("Assessment {} unassigned by {}", assessment_id, actor.id);
        record(actor.id, "assessment.unassign", assessment_id, assignment ? nullptr : &assignment.error());
        return assignment;
    }

    Result<std::optional<AssessmentAssignment>> CouncilRegistry::get_assignment(std::string_view assessment_id) const
    {
        if (auto res = keys::validate_id("assessment_id", assessment_id); !res)
            return std::unexpected(res.error());
        auto key = keys::assessment(assessment_id);
        return decode_optional<AssessmentAssignment>(key, store_.get(key));
    }

    Result<std::vector<AssessmentAssignment>> CouncilRegistry::list_council_assessments(std::string_view council_id) const
    {
        if (auto council = get_council(council_id); !council)
            return std::unexpected(council.error());

        auto rows = store_.scan_prefix(keys::assessment_prefix());
        if (!rows)
            return std::unexpected(rows.error());

        std::vector<AssessmentAssignment> out;
        for (const auto &[key, raw] : *rows)
        {
            auto assignment = decode<AssessmentAssignment>(key, raw);
            if (!assignment)
                return std::unexpected(assignment.error());
            if (assignment->council_id == council_id)
                out.push_back(std::move(*assignment));
        }
        return out;
    }

} // namespace arbiter
