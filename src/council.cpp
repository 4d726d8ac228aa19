#include "arbiter/council.hpp"
#include "arbiter/json_canonicalization.hpp"

namespace arbiter
{

    using Json = nlohmann::json;

    // ========== Council ==========

    Json Council::to_json() const
    {
        return Json{
            {"id", id},
            {"name", name},
            {"description", json::nullable(description)},
            {"org_id", json::nullable(org_id)},
            {"status", to_string(status)},
            {"quorum", quorum},
            {"require_unanimous", require_unanimous},
            {"approval_policy", approval_policy},
            {"metadata", metadata},
            {"created_at", created_at},
            {"updated_at", updated_at}};
    }

    Result<Council> Council::from_json(const Json &j)
    {
        try
        {
            Council c;
            c.id = j.at("id").get<std::string>();
            c.name = j.at("name").get<std::string>();
            c.description = json::optional_string(j, "description");
            c.org_id = json::optional_string(j, "org_id");
            auto status = council_status_from_string(j.at("status").get<std::string>());
            if (!status)
                return std::unexpected(status.error());
            c.status = *status;
            c.quorum = j.at("quorum").get<int>();
            c.require_unanimous = j.at("require_unanimous").get<bool>();
            c.approval_policy = j.value("approval_policy", Json::object());
            c.metadata = j.value("metadata", Json::object());
            c.created_at = j.at("created_at").get<std::string>();
            c.updated_at = j.at("updated_at").get<std::string>();
            return c;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(ArbiterError::parsing(std::string("Invalid council record: ") + e.what()));
        }
    }

    // ========== Membership ==========

    Json Membership::to_json() const
    {
        return Json{
            {"id", id},
            {"council_id", council_id},
            {"user_id", user_id},
            {"role", to_string(role)},
            {"status", to_string(status)},
            {"permissions", permissions},
            {"notes", json::nullable(notes)},
            {"assigned_by", json::nullable(assigned_by)},
            {"assigned_at", assigned_at},
            {"created_at", created_at},
            {"revoked_at", json::nullable(revoked_at)}};
    }

    Result<Membership> Membership::from_json(const Json &j)
    {
        try
        {
            Membership m;
            m.id = j.at("id").get<std::string>();
            m.council_id = j.at("council_id").get<std::string>();
            m.user_id = j.at("user_id").get<std::string>();
            auto role = council_role_from_string(j.at("role").get<std::string>());
            if (!role)
                return std::unexpected(role.error());
            m.role = *role;
            auto status = membership_status_from_string(j.at("status").get<std::string>());
            if (!status)
                return std::unexpected(status.error());
            m.status = *status;
            m.permissions = j.value("permissions", Json::object());
            m.notes = json::optional_string(j, "notes");
            m.assigned_by = json::optional_string(j, "assigned_by");
            m.assigned_at = j.at("assigned_at").get<std::string>();
            m.created_at = j.at("created_at").get<std::string>();
            m.revoked_at = json::optional_string(j, "revoked_at");
            return m;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(ArbiterError::parsing(std::string("Invalid membership record: ") + e.what()));
        }
    }

    // ========== AssessmentAssignment ==========

    Json AssessmentAssignment::to_json() const
    {
        return Json{
            {"assessment_id", assessment_id},
            {"council_id", json::nullable(council_id)},
            {"updated_at", updated_at}};
    }

    Result<AssessmentAssignment> AssessmentAssignment::from_json(const Json &j)
    {
        try
        {
            AssessmentAssignment a;
            a.assessment_id = j.at("assessment_id").get<std::string>();
            a.council_id = json::optional_string(j, "council_id");
            a.updated_at = j.at("updated_at").get<std::string>();
            return a;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(ArbiterError::parsing(std::string("Invalid assessment record: ") + e.what()));
        }
    }

} // namespace arbiter
