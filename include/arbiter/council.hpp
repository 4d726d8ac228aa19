#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace arbiter
{

    /**
     * A Risk Council: the body whose active members vote on assigned assessments.
     */
    struct Council
    {
        std::string id;
        std::string name;
        std::optional<std::string> description;
        std::optional<std::string> org_id;
        CouncilStatus status{CouncilStatus::Active};
        int quorum{1};                 // minimum decisive votes, >= 1
        bool require_unanimous{false}; // any rejection blocks approval
        nlohmann::json approval_policy = nlohmann::json::object();
        nlohmann::json metadata = nlohmann::json::object();
        std::string created_at;
        std::string updated_at;

        nlohmann::json to_json() const;
        static Result<Council> from_json(const nlohmann::json &j);
    };

    /**
     * Membership of a user in a council. Unique per (council_id, user_id);
     * revoking and re-adding reuses the same row.
     */
    struct Membership
    {
        std::string id;
        std::string council_id;
        std::string user_id;
        CouncilRole role{CouncilRole::Partner};
        MembershipStatus status{MembershipStatus::Active};
        nlohmann::json permissions = nlohmann::json::object();
        std::optional<std::string> notes;
        std::optional<std::string> assigned_by;
        std::string assigned_at;
        std::string created_at;
        std::optional<std::string> revoked_at; // set only while Revoked

        bool is_active() const { return status == MembershipStatus::Active; }

        nlohmann::json to_json() const;
        static Result<Membership> from_json(const nlohmann::json &j);
    };

    /** Which council, if any, an assessment is currently routed to */
    struct AssessmentAssignment
    {
        std::string assessment_id;
        std::optional<std::string> council_id;
        std::string updated_at;

        nlohmann::json to_json() const;
        static Result<AssessmentAssignment> from_json(const nlohmann::json &j);
    };

} // namespace arbiter
