#include <catch2/catch_test_macros.hpp>
#include "arbiter/governance_service.hpp"
#include "arbiter/memory_store.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>

using namespace arbiter;
using Json = nlohmann::json;

namespace
{
    /** Wraps a MemoryStore and injects write or commit failures */
    class FaultyStore : public KeyValueStore
    {
    public:
        std::string fail_puts_with_prefix;
        std::atomic<int> busy_commits{0};
        std::atomic<int> commits_attempted{0};

        std::unique_ptr<StoreTransaction> begin() override
        {
            return std::make_unique<Txn>(*this, inner_.begin());
        }

        Result<std::optional<std::string>> get(std::string_view key) const override
        {
            return inner_.get(key);
        }

        Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) const override
        {
            return inner_.scan_prefix(prefix);
        }

    private:
        class Txn : public StoreTransaction
        {
        public:
            Txn(FaultyStore &owner, std::unique_ptr<StoreTransaction> inner)
                : owner_(owner), inner_(std::move(inner)) {}

            Result<std::optional<std::string>> get(std::string_view key) override { return inner_->get(key); }

            Result<std::optional<std::string>> get_for_update(std::string_view key) override
            {
                return inner_->get_for_update(key);
            }

            Result<void> put(std::string_view key, std::string_view value) override
            {
                if (!owner_.fail_puts_with_prefix.empty() && key.starts_with(owner_.fail_puts_with_prefix))
                    return std::unexpected(ArbiterError::storage("injected write failure"));
                return inner_->put(key, value);
            }

            Result<void> erase(std::string_view key) override { return inner_->erase(key); }

            Result<std::vector<KeyValue>> scan_prefix(std::string_view prefix) override
            {
                return inner_->scan_prefix(prefix);
            }

            Result<void> commit() override
            {
                ++owner_.commits_attempted;
                if (owner_.busy_commits > 0)
                {
                    --owner_.busy_commits;
                    return std::unexpected(ArbiterError::busy("injected commit conflict"));
                }
                return inner_->commit();
            }

            void rollback() override { inner_->rollback(); }

        private:
            FaultyStore &owner_;
            std::unique_ptr<StoreTransaction> inner_;
        };

        MemoryStore inner_;
    };

    struct Fixture
    {
        FaultyStore store;
        ArbiterConfig cfg;
        GovernanceService service{store, cfg};
        Actor admin{"admin-1", "ADMIN"};
        std::string council_id;
        std::vector<std::string> members;

        explicit Fixture(int quorum = 2, bool unanimous = false, int member_count = 3)
        {
            CouncilDraft draft;
            draft.name = "Credit Council";
            draft.quorum = quorum;
            draft.require_unanimous = unanimous;
            council_id = service.councils().create_council(draft).value().id;
            for (int i = 0; i < member_count; ++i)
            {
                MemberDraft m;
                m.council_id = council_id;
                m.user_id = "partner-" + std::to_string(i);
                members.push_back(service.councils().add_member(m).value().id);
            }
            REQUIRE(service.councils().assign_assessment("asm-1", council_id, admin).has_value());
        }

        DecisionRequest decision(std::size_t member, ApprovalStatus status) const
        {
            DecisionRequest r;
            r.assessment_id = "asm-1";
            r.council_id = council_id;
            r.membership_id = members.at(member);
            r.partner_id = "partner-" + std::to_string(member);
            r.step = "credit_review";
            r.status = status;
            r.reason_codes = {"R1"};
            r.actor_id = r.partner_id;
            r.actor_role = "PARTNER";
            return r;
        }
    };
}

TEST_CASE("A decision writes its vote and ledger entry together", "[service]")
{
    Fixture f;
    auto request = f.decision(0, ApprovalStatus::Approved);
    request.decision_notes = "limits within appetite";
    request.attachments = Json::array({{{"name", "memo.pdf"}}});

    auto receipt = f.service.submit_decision(request);
    REQUIRE(receipt.has_value());
    REQUIRE(receipt->approval.id.starts_with("apr_"));
    REQUIRE(receipt->approval.seq == 1);
    REQUIRE(receipt->ledger_entry.entry_type == LedgerEntryType::Approval);
    REQUIRE(receipt->ledger_entry.approval_id == std::optional<std::string>(receipt->approval.id));
    REQUIRE(receipt->ledger_entry.payload["step"] == "credit_review");
    REQUIRE(receipt->ledger_entry.payload["reason_codes"] == Json::array({"R1"}));
    REQUIRE(receipt->ledger_entry.payload["notes"] == "limits within appetite");
    REQUIRE(receipt->ledger_entry.payload["attachments"] == request.attachments);
    // the assignment entry came first
    REQUIRE(receipt->ledger_entry.seq == 2);

    auto approvals = f.service.list_approvals("asm-1");
    REQUIRE(approvals->size() == 1);
    REQUIRE(approvals->front().attachments[0]["name"] == "memo.pdf");

    auto receipt_json = receipt->to_json();
    REQUIRE(receipt_json["approval"]["status"] == "APPROVED");
    REQUIRE(receipt_json["ledger_entry"]["hash"] == receipt->ledger_entry.hash);

    REQUIRE(f.service.verify_ledger("asm-1")->verified);
}

TEST_CASE("Decision types map to ledger entry types", "[service]")
{
    Fixture f;
    REQUIRE(f.service.submit_decision(f.decision(0, ApprovalStatus::Rejected))->ledger_entry.entry_type ==
            LedgerEntryType::Rejection);
    REQUIRE(f.service.submit_decision(f.decision(1, ApprovalStatus::Pending))->ledger_entry.entry_type ==
            LedgerEntryType::StatusChange);
}

TEST_CASE("Invalid decisions leave no state behind", "[service]")
{
    Fixture f;
    auto ledger_before = f.service.ledger().entries("asm-1")->size();

    SECTION("unassigned assessment")
    {
        auto request = f.decision(0, ApprovalStatus::Approved);
        request.assessment_id = "asm-unrouted";
        REQUIRE(f.service.submit_decision(request).error().code == ErrorCode::ValidationError);
        REQUIRE(f.service.list_approvals("asm-unrouted")->empty());
        REQUIRE(f.service.ledger().entries("asm-unrouted")->empty());
    }

    SECTION("assessment routed to another council")
    {
        CouncilDraft other;
        other.name = "Other";
        auto other_id = f.service.councils().create_council(other).value().id;
        auto request = f.decision(0, ApprovalStatus::Approved);
        request.council_id = other_id;
        REQUIRE(f.service.submit_decision(request).error().code == ErrorCode::ValidationError);
    }

    SECTION("revoked membership")
    {
        REQUIRE(f.service.councils().revoke_member(f.members[0]).has_value());
        REQUIRE(f.service.submit_decision(f.decision(0, ApprovalStatus::Approved)).error().code == ErrorCode::Conflict);
    }

    SECTION("membership of another council")
    {
        CouncilDraft other;
        other.name = "Other";
        auto other_id = f.service.councils().create_council(other).value().id;
        MemberDraft m{other_id, "outsider"};
        auto outsider = f.service.councils().add_member(m).value();
        auto request = f.decision(0, ApprovalStatus::Approved);
        request.membership_id = outsider.id;
        REQUIRE(f.service.submit_decision(request).error().code == ErrorCode::ValidationError);
    }

    SECTION("unknown membership")
    {
        auto request = f.decision(0, ApprovalStatus::Approved);
        request.membership_id = "mbr_missing";
        REQUIRE(f.service.submit_decision(request).error().code == ErrorCode::NotFound);
    }

    SECTION("archived council")
    {
        REQUIRE(f.service.councils().archive_council(f.council_id).has_value());
        REQUIRE(f.service.submit_decision(f.decision(0, ApprovalStatus::Approved)).error().code == ErrorCode::Conflict);
    }

    SECTION("missing fields")
    {
        auto request = f.decision(0, ApprovalStatus::Approved);
        request.step.clear();
        REQUIRE(f.service.submit_decision(request).error().code == ErrorCode::ValidationError);
    }

    REQUIRE(f.service.list_approvals("asm-1")->empty());
    REQUIRE(f.service.ledger().entries("asm-1")->size() == ledger_before);
}

TEST_CASE("A failed ledger write discards the vote", "[service]")
{
    Fixture f;
    f.store.fail_puts_with_prefix = "ledger/";

    auto receipt = f.service.submit_decision(f.decision(0, ApprovalStatus::Approved));
    REQUIRE_FALSE(receipt.has_value());
    REQUIRE(receipt.error().code == ErrorCode::StorageError);

    f.store.fail_puts_with_prefix.clear();
    REQUIRE(f.service.list_approvals("asm-1")->empty());
    REQUIRE(f.service.ledger().entries("asm-1")->size() == 1);

    // the approval sequence was not consumed
    auto next = f.service.submit_decision(f.decision(0, ApprovalStatus::Approved));
    REQUIRE(next.has_value());
    REQUIRE(next->approval.seq == 1);
}

TEST_CASE("Commit contention is retried", "[service]")
{
    Fixture f;
    f.store.commits_attempted = 0;
    f.store.busy_commits = 2;

    auto receipt = f.service.submit_decision(f.decision(0, ApprovalStatus::Approved));
    REQUIRE(receipt.has_value());
    REQUIRE(f.store.commits_attempted.load() == 3);
    REQUIRE(f.service.list_approvals("asm-1")->size() == 1);
    REQUIRE(f.service.verify_ledger("asm-1")->verified);

    SECTION("retries are bounded by configuration")
    {
        f.store.busy_commits = 100;
        auto failed = f.service.submit_decision(f.decision(1, ApprovalStatus::Approved));
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(failed.error().code == ErrorCode::Busy);
        REQUIRE(f.service.list_approvals("asm-1")->size() == 1);
    }
}

TEST_CASE("Status counts only currently active members", "[service]")
{
    Fixture f(2);
    REQUIRE(f.service.submit_decision(f.decision(0, ApprovalStatus::Approved)).has_value());
    REQUIRE(f.service.submit_decision(f.decision(1, ApprovalStatus::Approved)).has_value());

    auto before = f.service.check_approval_status("asm-1");
    REQUIRE(before.has_value());
    REQUIRE(before->approved);
    REQUIRE(before->total_approvals == 2);

    REQUIRE(f.service.councils().revoke_member(f.members[1]).has_value());

    auto after = f.service.check_approval_status("asm-1");
    REQUIRE(after->pending);
    REQUIRE(after->total_approvals == 1);

    // the vote row and its evidence are untouched
    REQUIRE(f.service.list_approvals("asm-1")->size() == 2);
    REQUIRE(f.service.verify_ledger("asm-1")->verified);

    MemberDraft again{f.council_id, "partner-1"};
    REQUIRE(f.service.councils().add_member(again).has_value());
    REQUIRE(f.service.check_approval_status("asm-1")->approved);
}

TEST_CASE("Unanimous councils reject on any rejection", "[service]")
{
    Fixture f(2, true);
    REQUIRE(f.service.submit_decision(f.decision(0, ApprovalStatus::Approved)).has_value());
    REQUIRE(f.service.submit_decision(f.decision(1, ApprovalStatus::Rejected)).has_value());
    REQUIRE(f.service.submit_decision(f.decision(2, ApprovalStatus::Approved)).has_value());

    auto status = f.service.check_approval_status("asm-1");
    REQUIRE(status->rejected);
    REQUIRE(status->requires_unanimous);
}

TEST_CASE("Status of an unassigned assessment is NotFound", "[service]")
{
    Fixture f;
    REQUIRE(f.service.check_approval_status("asm-unrouted").error().code == ErrorCode::NotFound);
}

TEST_CASE("Generic events cannot forge votes", "[service]")
{
    Fixture f;
    EventRequest event;
    event.assessment_id = "asm-1";
    event.actor_id = "admin-1";
    event.actor_role = "ADMIN";
    event.entry_type = LedgerEntryType::Approval;
    REQUIRE(f.service.append_event(event).error().code == ErrorCode::ValidationError);

    event.entry_type = LedgerEntryType::PolicyChange;
    event.payload = {{"quorum", 3}};
    auto entry = f.service.append_event(event);
    REQUIRE(entry.has_value());
    REQUIRE(entry->entry_type == LedgerEntryType::PolicyChange);

    LedgerQuery query;
    query.assessment_id = "asm-1";
    query.entry_types = {LedgerEntryType::PolicyChange};
    auto page = f.service.query_ledger(query);
    REQUIRE(page->entries.size() == 1);
    REQUIRE(page->entries[0].payload["quorum"] == 3);
}

TEST_CASE("Governance actions are written to the audit log", "[service]")
{
    auto path = std::filesystem::temp_directory_path() / crypto::SecureRandom::generate_id("arbiter-audit");
    LoggingConfig logging;
    logging.audit_log_path = path.string();
    {
        MemoryStore store;
        ArbiterConfig cfg;
        GovernanceService service(store, cfg, std::make_shared<AuditLogger>(logging));
        CouncilDraft draft;
        draft.name = "Audited";
        REQUIRE(service.councils().create_council(draft).has_value());
        EventRequest event;
        event.assessment_id = "asm-9";
        event.actor_id = "auditor";
        event.actor_role = "ADMIN";
        event.entry_type = LedgerEntryType::Rejection;
        REQUIRE_FALSE(service.append_event(event).has_value());
    }

    std::ifstream in(path);
    std::vector<Json> lines;
    for (std::string line; std::getline(in, line);)
        lines.push_back(Json::parse(line));
    std::filesystem::remove(path);

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["action"] == "council.create");
    REQUIRE(lines[0]["result"] == "ok");
    REQUIRE(lines[1]["action"] == "ledger.append");
    REQUIRE(lines[1]["actor"] == "auditor");
    REQUIRE(lines[1]["result"] != "ok");
}
