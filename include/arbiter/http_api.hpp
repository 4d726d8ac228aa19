#pragma once

#include "governance_service.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbiter
{

    struct ApiResponse
    {
        int status{200};
        nlohmann::json body = nlohmann::json::object();
    };

    /**
     * Transport-independent JSON API over GovernanceService.
     *
     *   GET   /health
     *   POST  /councils                          GET /councils?status=&org_id=&cursor=&limit=
     *   GET   /councils/{id}                     PATCH /councils/{id}
     *   POST  /councils/{id}/archive
     *   GET   /councils/{id}/members?status=     POST /councils/{id}/members
     *   GET   /councils/{id}/assessments
     *   PATCH /memberships/{id}                  POST /memberships/{id}/revoke
     *   POST  /assessments/{id}/assign           POST /assessments/{id}/unassign
     *   POST  /assessments/{id}/decisions        GET  /assessments/{id}/approvals
     *   GET   /assessments/{id}/status
     *   GET   /assessments/{id}/ledger?entry_types=A,B&cursor=&limit=
     *   GET   /assessments/{id}/ledger/verify    POST /assessments/{id}/ledger/events
     */
    class ApiRouter
    {
    public:
        explicit ApiRouter(GovernanceService &service);

        ApiResponse handle(std::string_view method, std::string_view target, std::string_view body);

        /** HTTP status for an error category */
        static int status_for(ErrorCode code);

        /** Error body; storage internals are replaced by a generic retry message */
        static ApiResponse error_response(const ArbiterError &error);

    private:
        using Query = std::map<std::string, std::string, std::less<>>;

        ApiResponse route(std::string_view method,
                          const std::vector<std::string> &segments,
                          const Query &query,
                          const nlohmann::json &body);

        ApiResponse councils(std::string_view method, const std::vector<std::string> &segments,
                             const Query &query, const nlohmann::json &body);

        ApiResponse memberships(std::string_view method, const std::vector<std::string> &segments,
                                const nlohmann::json &body);

        ApiResponse assessments(std::string_view method, const std::vector<std::string> &segments,
                                const Query &query, const nlohmann::json &body);

        GovernanceService &service_;
    };

    namespace http_util
    {
        /** Decode %XX escapes and '+' in a query component; nullopt on a malformed escape */
        std::optional<std::string> percent_decode(std::string_view text);

        /** Split "/a/b?x=1" into decoded path segments and query parameters */
        std::optional<std::pair<std::vector<std::string>, std::map<std::string, std::string, std::less<>>>>
        parse_target(std::string_view target);
    } // namespace http_util

} // namespace arbiter
