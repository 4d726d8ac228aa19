#include "arbiter/http_api.hpp"
#include <spdlog/spdlog.h>
#include <charconv>

namespace arbiter
{

    using Json = nlohmann::json;

    namespace http_util
    {
        std::optional<std::string> percent_decode(std::string_view text)
        {
            std::string out;
            out.reserve(text.size());
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];
                if (c == '+')
                {
                    out.push_back(' ');
                }
                else if (c == '%')
                {
                    if (i + 2 >= text.size())
                        return std::nullopt;
                    unsigned value = 0;
                    auto [ptr, ec] = std::from_chars(text.data() + i + 1, text.data() + i + 3, value, 16);
                    if (ec != std::errc{} || ptr != text.data() + i + 3)
                        return std::nullopt;
                    out.push_back(static_cast<char>(value));
                    i += 2;
                }
                else
                {
                    out.push_back(c);
                }
            }
            return out;
        }

        std::optional<std::pair<std::vector<std::string>, std::map<std::string, std::string, std::less<>>>>
        parse_target(std::string_view target)
        {
            std::string_view path = target;
            std::string_view query;
            if (auto q = target.find('?'); q != std::string_view::npos)
            {
                path = target.substr(0, q);
                query = target.substr(q + 1);
            }

            std::vector<std::string> segments;
            while (!path.empty())
            {
                auto slash = path.find('/');
                auto part = path.substr(0, slash);
                if (!part.empty())
                {
                    auto decoded = percent_decode(part);
                    if (!decoded)
                        return std::nullopt;
                    segments.push_back(std::move(*decoded));
                }
                if (slash == std::string_view::npos)
                    break;
                path.remove_prefix(slash + 1);
            }

            std::map<std::string, std::string, std::less<>> params;
            while (!query.empty())
            {
                auto amp = query.find('&');
                auto pair = query.substr(0, amp);
                if (!pair.empty())
                {
                    auto eq = pair.find('=');
                    auto key = percent_decode(pair.substr(0, eq));
                    auto value = percent_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
                    if (!key || !value)
                        return std::nullopt;
                    params.insert_or_assign(std::move(*key), std::move(*value));
                }
                if (amp == std::string_view::npos)
                    break;
                query.remove_prefix(amp + 1);
            }
            return std::make_pair(std::move(segments), std::move(params));
        }
    } // namespace http_util

    namespace
    {
        ApiResponse ok(Json body, int status = 200)
        {
            return ApiResponse{status, std::move(body)};
        }

        ApiResponse bad_request(const std::string &why)
        {
            return ApiResponse{400, Json{{"error", "validation_error"}, {"message", why}}};
        }

        ApiResponse not_found()
        {
            return ApiResponse{404, Json{{"error", "not_found"}, {"message", "no such route"}}};
        }

        ApiResponse method_not_allowed()
        {
            return ApiResponse{405, Json{{"error", "method_not_allowed"}, {"message", "method not allowed"}}};
        }

        std::optional<std::size_t> parse_size(const std::string &text)
        {
            std::size_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::nullopt;
            return value;
        }

        template <typename T>
        std::optional<T> optional_field(const Json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            return it->get<T>();
        }

        template <typename T>
        ApiResponse respond(const Result<T> &result, int status = 200)
        {
            if (!result)
                return ApiRouter::error_response(result.error());
            if constexpr (requires { result->to_json(); })
                return ok(result->to_json(), status);
            else
            {
                Json items = Json::array();
                for (const auto &item : *result)
                    items.push_back(item.to_json());
                return ok(Json{{"items", items}}, status);
            }
        }

        Actor actor_from(const Json &j)
        {
            return Actor{j.at("actor_id").get<std::string>(), j.at("actor_role").get<std::string>()};
        }
    } // namespace

    ApiRouter::ApiRouter(GovernanceService &service) : service_(service) {}

    int ApiRouter::status_for(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidInput:
        case ErrorCode::ConfigError:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::Conflict:
        case ErrorCode::AlreadyExists:
            return 409;
        case ErrorCode::Busy:
        case ErrorCode::StorageError:
            return 503;
        case ErrorCode::ParsingError:
        case ErrorCode::CryptoError:
        case ErrorCode::InternalError:
            return 500;
        }
        return 500;
    }

    ApiResponse ApiRouter::error_response(const ArbiterError &error)
    {
        int status = status_for(error.code);
        std::string message = error.what();
        if (status == 503)
            message = "storage temporarily unavailable; retry the request";
        else if (status == 500)
            message = "internal error";
        Json body{{"error", std::string(error_code_name(error.code))}, {"message", message}};
        if (error.is_retryable())
            body["retryable"] = true;
        return ApiResponse{status, std::move(body)};
    }

    ApiResponse ApiRouter::handle(std::string_view method, std::string_view target, std::string_view body)
    {
        auto parsed = http_util::parse_target(target);
        if (!parsed)
            return bad_request("malformed request target");

        try
        {
            Json payload = Json::object();
            if (!body.empty())
            {
                payload = Json::parse(body);
                if (!payload.is_object())
                    return bad_request("request body must be a JSON object");
            }
            auto response = route(method, parsed->first, parsed->second, payload);
            if (response.status >= 500)
                spdlog::error("{} {} -> {}", method, target, response.status);
            else
                spdlog::debug("{} {} -> {}", method, target, response.status);
            return response;
        }
        catch (const Json::exception &e)
        {
            return bad_request(std::string("invalid request body: ") + e.what());
        }
    }

    ApiResponse ApiRouter::route(std::string_view method,
                                 const std::vector<std::string> &segments,
                                 const Query &query,
                                 const Json &body)
    {
        if (segments.empty())
            return not_found();

        const auto &root = segments[0];
        if (root == "health" && segments.size() == 1)
        {
            if (method != "GET")
                return method_not_allowed();
            return ok({{"status", "ok"}});
        }
        if (root == "councils")
            return councils(method, segments, query, body);
        if (root == "memberships")
            return memberships(method, segments, body);
        if (root == "assessments")
            return assessments(method, segments, query, body);
        return not_found();
    }

    ApiResponse ApiRouter::councils(std::string_view method, const std::vector<std::string> &segments,
                                    const Query &query, const Json &body)
    {
        auto &registry = service_.councils();

        if (segments.size() == 1)
        {
            if (method == "POST")
            {
                const auto &j = body;
                CouncilDraft draft;
                draft.name = j.at("name").get<std::string>();
                draft.description = optional_field<std::string>(j, "description");
                draft.org_id = optional_field<std::string>(j, "org_id");
                draft.quorum = j.value("quorum", 1);
                draft.require_unanimous = j.value("require_unanimous", false);
                draft.approval_policy = j.value("approval_policy", Json::object());
                draft.metadata = j.value("metadata", Json::object());
                return respond(registry.create_council(draft), 201);
            }
            if (method == "GET")
            {
                CouncilFilter filter;
                if (auto it = query.find("status"); it != query.end())
                {
                    auto status = council_status_from_string(it->second);
                    if (!status)
                        return error_response(status.error());
                    filter.status = *status;
                }
                if (auto it = query.find("org_id"); it != query.end())
                    filter.org_id = it->second;
                if (auto it = query.find("cursor"); it != query.end())
                    filter.cursor = it->second;
                if (auto it = query.find("limit"); it != query.end())
                {
                    filter.limit = parse_size(it->second);
                    if (!filter.limit)
                        return bad_request("limit must be a non-negative integer");
                }
                return respond(registry.list_councils(filter));
            }
            return method_not_allowed();
        }

        const auto &council_id = segments[1];
        if (segments.size() == 2)
        {
            if (method == "GET")
                return respond(registry.describe_council(council_id));
            if (method == "PATCH")
            {
                const auto &j = body;
                CouncilUpdate update;
                update.name = optional_field<std::string>(j, "name");
                update.description = optional_field<std::string>(j, "description");
                update.quorum = optional_field<int>(j, "quorum");
                update.require_unanimous = optional_field<bool>(j, "require_unanimous");
                if (j.contains("approval_policy"))
                    update.approval_policy = j["approval_policy"];
                if (j.contains("metadata"))
                    update.metadata = j["metadata"];
                if (j.contains("status"))
                    return bad_request("status changes go through POST /councils/{id}/archive");
                return respond(registry.update_council(council_id, update));
            }
            return method_not_allowed();
        }

        if (segments.size() == 3)
        {
            const auto &action = segments[2];
            if (action == "archive")
            {
                if (method != "POST")
                    return method_not_allowed();
                return respond(registry.archive_council(council_id));
            }
            if (action == "members")
            {
                if (method == "GET")
                {
                    std::optional<MembershipStatus> status;
                    if (auto it = query.find("status"); it != query.end())
                    {
                        auto parsed = membership_status_from_string(it->second);
                        if (!parsed)
                            return error_response(parsed.error());
                        status = *parsed;
                    }
                    return respond(registry.list_members(council_id, status));
                }
                if (method == "POST")
                {
                    const auto &j = body;
                    MemberDraft draft;
                    draft.council_id = council_id;
                    draft.user_id = j.at("user_id").get<std::string>();
                    auto role = council_role_from_string(j.value("role", std::string("PARTNER")));
                    if (!role)
                        return error_response(role.error());
                    draft.role = *role;
                    draft.permissions = j.value("permissions", Json::object());
                    draft.notes = optional_field<std::string>(j, "notes");
                    draft.assigned_by = optional_field<std::string>(j, "assigned_by");
                    return respond(registry.add_member(draft), 201);
                }
                return method_not_allowed();
            }
            if (action == "assessments")
            {
                if (method != "GET")
                    return method_not_allowed();
                return respond(registry.list_council_assessments(council_id));
            }
        }
        return not_found();
    }

    ApiResponse ApiRouter::memberships(std::string_view method, const std::vector<std::string> &segments,
                                       const Json &body)
    {
        auto &registry = service_.councils();
        if (segments.size() < 2)
            return not_found();
        const auto &membership_id = segments[1];

        if (segments.size() == 2)
        {
            if (method == "GET")
                return respond(registry.get_membership(membership_id));
            if (method == "PATCH")
            {
                const auto &j = body;
                MembershipUpdate update;
                if (auto role = optional_field<std::string>(j, "role"))
                {
                    auto parsed = council_role_from_string(*role);
                    if (!parsed)
                        return error_response(parsed.error());
                    update.role = *parsed;
                }
                if (auto status = optional_field<std::string>(j, "status"))
                {
                    auto parsed = membership_status_from_string(*status);
                    if (!parsed)
                        return error_response(parsed.error());
                    update.status = *parsed;
                }
                if (j.contains("permissions"))
                    update.permissions = j["permissions"];
                update.notes = optional_field<std::string>(j, "notes");
                return respond(registry.update_membership(membership_id, update));
            }
            return method_not_allowed();
        }

        if (segments.size() == 3 && segments[2] == "revoke")
        {
            if (method != "POST")
                return method_not_allowed();
            const auto &j = body;
            return respond(registry.revoke_member(membership_id, optional_field<std::string>(j, "notes")));
        }
        return not_found();
    }

    ApiResponse ApiRouter::assessments(std::string_view method, const std::vector<std::string> &segments,
                                       const Query &query, const Json &body)
    {
        if (segments.size() < 3)
            return not_found();
        const auto &assessment_id = segments[1];
        const auto &action = segments[2];

        if (segments.size() == 3)
        {
            if (action == "assign")
            {
                if (method != "POST")
                    return method_not_allowed();
                const auto &j = body;
                return respond(service_.councils().assign_assessment(
                    assessment_id, j.at("council_id").get<std::string>(), actor_from(j)));
            }
            if (action == "unassign")
            {
                if (method != "POST")
                    return method_not_allowed();
                const auto &j = body;
                return respond(service_.councils().unassign_assessment(assessment_id, actor_from(j)));
            }
            if (action == "decisions")
            {
                if (method != "POST")
                    return method_not_allowed();
                const auto &j = body;
                DecisionRequest request;
                request.assessment_id = assessment_id;
                request.council_id = j.at("council_id").get<std::string>();
                request.membership_id = j.at("membership_id").get<std::string>();
                request.partner_id = j.at("partner_id").get<std::string>();
                request.step = j.at("step").get<std::string>();
                auto status = approval_status_from_string(j.at("status").get<std::string>());
                if (!status)
                    return error_response(status.error());
                request.status = *status;
                request.decision_notes = optional_field<std::string>(j, "decision_notes");
                request.reason_codes = j.value("reason_codes", std::vector<std::string>{});
                request.evidence_snapshot_id = optional_field<std::string>(j, "evidence_snapshot_id");
                request.attachments = j.value("attachments", Json::array());
                request.actor_id = j.at("actor_id").get<std::string>();
                request.actor_role = j.at("actor_role").get<std::string>();
                return respond(service_.submit_decision(request), 201);
            }
            if (action == "approvals")
            {
                if (method != "GET")
                    return method_not_allowed();
                return respond(service_.list_approvals(assessment_id));
            }
            if (action == "status")
            {
                if (method != "GET")
                    return method_not_allowed();
                return respond(service_.check_approval_status(assessment_id));
            }
            if (action == "ledger")
            {
                if (method != "GET")
                    return method_not_allowed();
                LedgerQuery q;
                q.assessment_id = assessment_id;
                if (auto it = query.find("entry_types"); it != query.end())
                {
                    std::string_view list = it->second;
                    while (!list.empty())
                    {
                        auto comma = list.find(',');
                        auto name = list.substr(0, comma);
                        if (!name.empty())
                        {
                            auto type = ledger_entry_type_from_string(name);
                            if (!type)
                                return error_response(type.error());
                            q.entry_types.push_back(*type);
                        }
                        if (comma == std::string_view::npos)
                            break;
                        list.remove_prefix(comma + 1);
                    }
                }
                if (auto it = query.find("cursor"); it != query.end())
                {
                    auto cursor = parse_size(it->second);
                    if (!cursor)
                        return bad_request("cursor must be a sequence number");
                    q.cursor = static_cast<uint64_t>(*cursor);
                }
                if (auto it = query.find("limit"); it != query.end())
                {
                    q.limit = parse_size(it->second);
                    if (!q.limit)
                        return bad_request("limit must be a non-negative integer");
                }
                return respond(service_.query_ledger(q));
            }
            return not_found();
        }

        if (segments.size() == 4 && action == "ledger")
        {
            if (segments[3] == "verify")
            {
                if (method != "GET")
                    return method_not_allowed();
                return respond(service_.verify_ledger(assessment_id));
            }
            if (segments[3] == "events")
            {
                if (method != "POST")
                    return method_not_allowed();
                const auto &j = body;
                EventRequest request;
                request.assessment_id = assessment_id;
                request.council_id = optional_field<std::string>(j, "council_id");
                request.membership_id = optional_field<std::string>(j, "membership_id");
                request.actor_id = j.at("actor_id").get<std::string>();
                request.actor_role = j.at("actor_role").get<std::string>();
                auto type = ledger_entry_type_from_string(j.at("entry_type").get<std::string>());
                if (!type)
                    return error_response(type.error());
                request.entry_type = *type;
                request.payload = j.value("payload", Json::object());
                return respond(service_.append_event(request), 201);
            }
        }
        return not_found();
    }

} // namespace arbiter
