#include <catch2/catch_test_macros.hpp>
#include "arbiter/http_api.hpp"
#include "arbiter/memory_store.hpp"

using namespace arbiter;
using Json = nlohmann::json;

namespace
{
    struct Api
    {
        MemoryStore store;
        ArbiterConfig cfg;
        GovernanceService service{store, cfg};
        ApiRouter router{service};

        ApiResponse call(std::string_view method, std::string_view target, const Json &body = Json())
        {
            return router.handle(method, target, body.is_null() ? std::string() : body.dump());
        }

        std::string create_council(int quorum = 1)
        {
            auto res = call("POST", "/councils", {{"name", "Credit"}, {"quorum", quorum}});
            REQUIRE(res.status == 201);
            return res.body["id"].get<std::string>();
        }

        std::string add_member(const std::string &council_id, const std::string &user)
        {
            auto res = call("POST", "/councils/" + council_id + "/members", {{"user_id", user}});
            REQUIRE(res.status == 201);
            return res.body["id"].get<std::string>();
        }
    };

    Json actor()
    {
        return Json{{"actor_id", "admin-1"}, {"actor_role", "ADMIN"}};
    }
}

TEST_CASE("Target parsing decodes segments and query", "[http]")
{
    auto parsed = http_util::parse_target("/assessments/asm%201/ledger?entry_types=APPROVAL%2CREJECTION&limit=5");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->first == std::vector<std::string>{"assessments", "asm 1", "ledger"});
    REQUIRE(parsed->second.at("entry_types") == "APPROVAL,REJECTION");
    REQUIRE(parsed->second.at("limit") == "5");

    REQUIRE(http_util::percent_decode("a+b%2Fc") == std::optional<std::string>("a b/c"));
    REQUIRE_FALSE(http_util::percent_decode("bad%2").has_value());
    REQUIRE_FALSE(http_util::percent_decode("bad%zz").has_value());
}

TEST_CASE("Error categories map to HTTP statuses", "[http]")
{
    REQUIRE(ApiRouter::status_for(ErrorCode::ValidationError) == 400);
    REQUIRE(ApiRouter::status_for(ErrorCode::InvalidInput) == 400);
    REQUIRE(ApiRouter::status_for(ErrorCode::NotFound) == 404);
    REQUIRE(ApiRouter::status_for(ErrorCode::Conflict) == 409);
    REQUIRE(ApiRouter::status_for(ErrorCode::Busy) == 503);
    REQUIRE(ApiRouter::status_for(ErrorCode::InternalError) == 500);

    auto busy = ApiRouter::error_response(ArbiterError::busy("lock wait timed out on ledger-head/asm-1"));
    REQUIRE(busy.status == 503);
    REQUIRE(busy.body["retryable"] == true);
    REQUIRE(busy.body["message"].get<std::string>().find("ledger-head") == std::string::npos);

    auto internal = ApiRouter::error_response(ArbiterError::parsing("Corrupt record at council/x"));
    REQUIRE(internal.status == 500);
    REQUIRE(internal.body["message"] == "internal error");

    auto conflict = ApiRouter::error_response(ArbiterError::conflict("council c is archived"));
    REQUIRE(conflict.body["error"] == "conflict");
    REQUIRE(conflict.body["message"] == "council c is archived");
    REQUIRE_FALSE(conflict.body.contains("retryable"));
}

TEST_CASE("Health and unknown routes", "[http]")
{
    Api api;
    REQUIRE(api.call("GET", "/health").status == 200);
    REQUIRE(api.call("POST", "/health").status == 405);
    REQUIRE(api.call("GET", "/nowhere").status == 404);
    REQUIRE(api.call("GET", "/").status == 404);
}

TEST_CASE("Malformed bodies are rejected", "[http]")
{
    Api api;
    REQUIRE(api.router.handle("POST", "/councils", "{not json").status == 400);
    REQUIRE(api.router.handle("POST", "/councils", "[1,2]").status == 400);
    REQUIRE(api.call("POST", "/councils", {{"description", "no name"}}).status == 400);
    REQUIRE(api.call("POST", "/councils", {{"name", 42}}).status == 400);
}

TEST_CASE("Path identifiers must be valid UTF-8", "[http]")
{
    Api api;
    auto council_id = api.create_council();
    Json assign = actor();
    assign["council_id"] = council_id;

    auto res = api.call("POST", "/assessments/%FF/assign", assign);
    REQUIRE(res.status == 400);
    REQUIRE(res.body["error"] == "validation_error");
    REQUIRE(res.body["message"] == "assessment_id is not valid UTF-8");

    REQUIRE(api.call("GET", "/assessments/asm-%C3%A9/status").status == 404);
}

TEST_CASE("Council lifecycle over the API", "[http]")
{
    Api api;
    auto council_id = api.create_council(2);

    auto described = api.call("GET", "/councils/" + council_id);
    REQUIRE(described.status == 200);
    REQUIRE(described.body["quorum"] == 2);
    REQUIRE(described.body["counts"]["active_members"] == 0);

    auto patched = api.call("PATCH", "/councils/" + council_id, {{"quorum", 3}});
    REQUIRE(patched.status == 200);
    REQUIRE(patched.body["quorum"] == 3);
    REQUIRE(api.call("PATCH", "/councils/" + council_id, {{"status", "ARCHIVED"}}).status == 400);

    auto listed = api.call("GET", "/councils?status=ACTIVE");
    REQUIRE(listed.status == 200);
    REQUIRE(listed.body["councils"].size() == 1);
    REQUIRE(listed.body["next_cursor"].is_null());
    REQUIRE(api.call("GET", "/councils?status=BOGUS").status == 400);

    REQUIRE(api.call("POST", "/councils/" + council_id + "/archive").status == 200);
    REQUIRE(api.call("POST", "/councils/" + council_id + "/archive").status == 409);
    REQUIRE(api.call("GET", "/councils/cncl_missing").status == 404);
}

TEST_CASE("Membership routes", "[http]")
{
    Api api;
    auto council_id = api.create_council();
    auto membership_id = api.add_member(council_id, "user-1");

    REQUIRE(api.call("POST", "/councils/" + council_id + "/members", {{"user_id", "user-2"}, {"role", "BOSS"}}).status == 400);

    auto revoked = api.call("POST", "/memberships/" + membership_id + "/revoke", {{"notes", "rotated"}});
    REQUIRE(revoked.status == 200);
    REQUIRE(revoked.body["status"] == "REVOKED");

    auto members = api.call("GET", "/councils/" + council_id + "/members?status=REVOKED");
    REQUIRE(members.status == 200);
    REQUIRE(members.body["items"].size() == 1);

    auto patched = api.call("PATCH", "/memberships/" + membership_id, {{"status", "ACTIVE"}, {"role", "CHAIR"}});
    REQUIRE(patched.status == 200);
    REQUIRE(patched.body["role"] == "CHAIR");
    REQUIRE(patched.body["revoked_at"].is_null());

    REQUIRE(api.call("GET", "/memberships/" + membership_id).status == 200);
    REQUIRE(api.call("GET", "/memberships/mbr_missing").status == 404);
}

TEST_CASE("Decision flow over the API", "[http]")
{
    Api api;
    auto council_id = api.create_council(1);
    auto membership_id = api.add_member(council_id, "partner-1");

    Json assign = actor();
    assign["council_id"] = council_id;
    REQUIRE(api.call("POST", "/assessments/asm-1/assign", assign).status == 200);

    Json decision = actor();
    decision.update({{"council_id", council_id},
                     {"membership_id", membership_id},
                     {"partner_id", "partner-1"},
                     {"step", "credit_review"},
                     {"status", "APPROVED"},
                     {"reason_codes", Json::array({"R1", "R2"})}});
    auto submitted = api.call("POST", "/assessments/asm-1/decisions", decision);
    REQUIRE(submitted.status == 201);
    REQUIRE(submitted.body["ledger_entry"]["entry_type"] == "APPROVAL");

    auto status = api.call("GET", "/assessments/asm-1/status");
    REQUIRE(status.status == 200);
    REQUIRE(status.body["approved"] == true);

    auto approvals = api.call("GET", "/assessments/asm-1/approvals");
    REQUIRE(approvals.body["items"].size() == 1);

    auto ledger = api.call("GET", "/assessments/asm-1/ledger?entry_types=APPROVAL&limit=10");
    REQUIRE(ledger.status == 200);
    REQUIRE(ledger.body["entries"].size() == 1);
    REQUIRE(ledger.body["entries"][0]["payload"]["reason_codes"] == Json::array({"R1", "R2"}));

    auto full = api.call("GET", "/assessments/asm-1/ledger?limit=1");
    REQUIRE(full.body["entries"][0]["entry_type"] == "ASSIGNMENT");
    REQUIRE(full.body["next_cursor"] == 1);

    auto verified = api.call("GET", "/assessments/asm-1/ledger/verify");
    REQUIRE(verified.status == 200);
    REQUIRE(verified.body["verified"] == true);
    REQUIRE(verified.body["entries_checked"] == 2);

    REQUIRE(api.call("GET", "/assessments/asm-1/ledger?entry_types=NOPE").status == 400);
    REQUIRE(api.call("GET", "/assessments/asm-1/ledger?cursor=abc").status == 400);
}

TEST_CASE("Decision rejections map to client errors", "[http]")
{
    Api api;
    auto council_id = api.create_council();
    auto membership_id = api.add_member(council_id, "partner-1");

    Json decision = actor();
    decision.update({{"council_id", council_id},
                     {"membership_id", membership_id},
                     {"partner_id", "partner-1"},
                     {"step", "credit_review"},
                     {"status", "APPROVED"}});

    // not yet assigned
    REQUIRE(api.call("POST", "/assessments/asm-1/decisions", decision).status == 400);

    Json assign = actor();
    assign["council_id"] = council_id;
    REQUIRE(api.call("POST", "/assessments/asm-1/assign", assign).status == 200);

    auto bad_status = decision;
    bad_status["status"] = "MAYBE";
    REQUIRE(api.call("POST", "/assessments/asm-1/decisions", bad_status).status == 400);

    REQUIRE(api.call("POST", "/memberships/" + membership_id + "/revoke").status == 200);
    REQUIRE(api.call("POST", "/assessments/asm-1/decisions", decision).status == 409);

    REQUIRE(api.call("GET", "/assessments/asm-unrouted/status").status == 404);
    REQUIRE(api.call("POST", "/assessments/asm-1/unassign", actor()).status == 200);
    REQUIRE(api.call("POST", "/assessments/asm-1/unassign", actor()).status == 404);
}

TEST_CASE("Generic ledger events", "[http]")
{
    Api api;
    Json event = actor();
    event["entry_type"] = "SYSTEM_EVENT";
    event["payload"] = {{"note", "migrated"}};
    auto appended = api.call("POST", "/assessments/asm-7/ledger/events", event);
    REQUIRE(appended.status == 201);
    REQUIRE(appended.body["seq"] == 1);
    REQUIRE(appended.body["prev_hash"].is_null());

    event["entry_type"] = "APPROVAL";
    REQUIRE(api.call("POST", "/assessments/asm-7/ledger/events", event).status == 400);
    REQUIRE(api.call("GET", "/assessments/asm-7/ledger/events").status == 405);
}
