#pragma once

#include "audit.hpp"
#include "config.hpp"
#include "council.hpp"
#include "evidence_ledger.hpp"
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbiter
{

    struct CouncilDraft
    {
        std::string name;
        std::optional<std::string> description;
        std::optional<std::string> org_id;
        int quorum{1};
        bool require_unanimous{false};
        nlohmann::json approval_policy = nlohmann::json::object();
        nlohmann::json metadata = nlohmann::json::object();
    };

    /** Fields left empty are not changed */
    struct CouncilUpdate
    {
        std::optional<std::string> name;
        std::optional<std::string> description;
        std::optional<int> quorum;
        std::optional<bool> require_unanimous;
        std::optional<nlohmann::json> approval_policy;
        std::optional<nlohmann::json> metadata;
    };

    struct CouncilSummary
    {
        Council council;
        std::size_t active_members{0};
        std::size_t revoked_members{0};
        std::size_t assessments{0};

        nlohmann::json to_json() const;
    };

    struct CouncilFilter
    {
        std::optional<CouncilStatus> status;
        std::optional<std::string> org_id;
        std::optional<std::string> cursor; // id of the last council already seen
        std::optional<std::size_t> limit;
    };

    struct CouncilPage
    {
        std::vector<Council> councils;
        std::optional<std::string> next_cursor;

        nlohmann::json to_json() const;
    };

    struct MemberDraft
    {
        std::string council_id;
        std::string user_id;
        CouncilRole role{CouncilRole::Partner};
        nlohmann::json permissions = nlohmann::json::object();
        std::optional<std::string> notes;
        std::optional<std::string> assigned_by;
    };

    /** Fields left empty are not changed */
    struct MembershipUpdate
    {
        std::optional<CouncilRole> role;
        std::optional<MembershipStatus> status;
        std::optional<nlohmann::json> permissions;
        std::optional<std::string> notes;
    };

    /** Who performed an administrative action, recorded on the ledger entries it produces */
    struct Actor
    {
        std::string id;
        std::string role;
    };

    /**
     * Council, membership and assessment-assignment lifecycle.
     *
     * Councils move ACTIVE -> ARCHIVED only; an archived council rejects every
     * further change with ErrorCode::Conflict. Memberships are unique per
     * (council, user) through a membership-index key that is locked while a
     * member is added, so concurrent adds of one user resolve to a single row.
     */
    class CouncilRegistry
    {
    public:
        static constexpr std::size_t kDefaultCouncilPageLimit = 20;

        CouncilRegistry(KeyValueStore &store,
                        const EvidenceLedger &ledger,
                        const LedgerConfig &ledger_cfg = {},
                        const ServiceConfig &service_cfg = {},
                        std::shared_ptr<AuditLogger> audit = nullptr,
                        Clock clock = system_clock());

        // ---- councils ----

        Result<Council> create_council(const CouncilDraft &draft);

        Result<Council> get_council(std::string_view council_id) const;

        /** Council with member and assessment counts */
        Result<CouncilSummary> describe_council(std::string_view council_id) const;

        /** Councils in id order, filtered by status and org */
        Result<CouncilPage> list_councils(const CouncilFilter &filter) const;

        Result<Council> update_council(std::string_view council_id, const CouncilUpdate &update);

        Result<Council> archive_council(std::string_view council_id);

        // ---- memberships ----

        /**
         * Add a user to a council, or reactivate their existing membership with
         * the new role, permissions, notes and assigner. Never creates a second
         * row for the same (council, user).
         */
        Result<Membership> add_member(const MemberDraft &draft);

        Result<Membership> update_membership(std::string_view membership_id, const MembershipUpdate &update);

        /** Revoke; revoked_at is stamped on the transition only */
        Result<Membership> revoke_member(std::string_view membership_id,
                                         const std::optional<std::string> &notes = std::nullopt);

        Result<Membership> get_membership(std::string_view membership_id) const;

        Result<std::vector<Membership>> list_members(std::string_view council_id,
                                                     std::optional<MembershipStatus> status = std::nullopt) const;

        // ---- assessments ----

        /** Route an assessment to an active council, replacing any previous assignment */
        Result<AssessmentAssignment> assign_assessment(std::string_view assessment_id,
                                                       std::string_view council_id,
                                                       const Actor &actor);

        Result<AssessmentAssignment> unassign_assessment(std::string_view assessment_id, const Actor &actor);

        /** Current assignment; nullopt if the assessment was never assigned */
        Result<std::optional<AssessmentAssignment>> get_assignment(std::string_view assessment_id) const;

        Result<std::vector<AssessmentAssignment>> list_council_assessments(std::string_view council_id) const;

    private:
        Result<Council> mutate_council(std::string_view council_id,
                                       const std::function<Result<void>(Council &)> &change);

        Result<Membership> mutate_membership(std::string_view membership_id,
                                             const std::function<Result<void>(Membership &)> &change);

        void record(std::string_view actor, std::string_view action, std::string_view resource,
                    const ArbiterError *error, nlohmann::json details = nlohmann::json::object()) const;

        KeyValueStore &store_;
        const EvidenceLedger &ledger_;
        LedgerConfig ledger_cfg_;
        ServiceConfig service_cfg_;
        std::shared_ptr<AuditLogger> audit_;
        Clock clock_;
    };

} // namespace arbiter
