#include "arbiter/approval_store.hpp"
#include "arbiter/council.hpp"
#include "arbiter/crypto.hpp"
#include "arbiter/json_canonicalization.hpp"
#include <charconv>

namespace arbiter
{

    using Json = nlohmann::json;

    Json Approval::to_json() const
    {
        return Json{
            {"id", id},
            {"assessment_id", assessment_id},
            {"council_id", council_id},
            {"membership_id", membership_id},
            {"partner_id", partner_id},
            {"step", step},
            {"status", to_string(status)},
            {"decision_notes", json::nullable(decision_notes)},
            {"reason_codes", reason_codes},
            {"evidence_snapshot_id", json::nullable(evidence_snapshot_id)},
            {"attachments", attachments},
            {"decided_at", decided_at},
            {"seq", seq}};
    }

    Result<Approval> Approval::from_json(const Json &j)
    {
        try
        {
            Approval a;
            a.id = j.at("id").get<std::string>();
            a.assessment_id = j.at("assessment_id").get<std::string>();
            a.council_id = j.at("council_id").get<std::string>();
            a.membership_id = j.at("membership_id").get<std::string>();
            a.partner_id = j.at("partner_id").get<std::string>();
            a.step = j.at("step").get<std::string>();
            auto status = approval_status_from_string(j.at("status").get<std::string>());
            if (!status)
                return std::unexpected(status.error());
            a.status = *status;
            a.decision_notes = json::optional_string(j, "decision_notes");
            a.reason_codes = j.value("reason_codes", std::vector<std::string>{});
            a.evidence_snapshot_id = json::optional_string(j, "evidence_snapshot_id");
            a.attachments = j.value("attachments", Json::array());
            a.decided_at = j.at("decided_at").get<std::string>();
            a.seq = j.at("seq").get<uint64_t>();
            return a;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(ArbiterError::parsing(std::string("Invalid approval record: ") + e.what()));
        }
    }

    ApprovalStore::ApprovalStore(KeyValueStore &store) : store_(store) {}

    Result<Approval> ApprovalStore::insert(StoreTransaction &txn, Approval approval) const
    {
        if (auto res = keys::validate_id("assessment_id", approval.assessment_id); !res)
            return std::unexpected(res.error());

        auto head_key = keys::approval_head(approval.assessment_id);
        auto head = txn.get_for_update(head_key);
        if (!head)
            return std::unexpected(head.error());

        uint64_t last = 0;
        if (*head)
        {
            const auto &text = **head;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), last);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::unexpected(ArbiterError::parsing(std::format("Corrupt approval head at {}", head_key)));
        }

        approval.seq = last + 1;
        if (approval.id.empty())
            approval.id = crypto::SecureRandom::generate_id("apr");

        if (auto res = txn.put(keys::approval(approval.assessment_id, approval.seq), approval.to_json().dump()); !res)
            return std::unexpected(res.error());
        if (auto res = txn.put(head_key, std::to_string(approval.seq)); !res)
            return std::unexpected(res.error());
        return approval;
    }

    Result<std::vector<Approval>> ApprovalStore::list(std::string_view assessment_id) const
    {
        if (auto res = keys::validate_id("assessment_id", assessment_id); !res)
            return std::unexpected(res.error());

        auto rows = store_.scan_prefix(keys::approval_prefix(assessment_id));
        if (!rows)
            return std::unexpected(rows.error());

        std::vector<Approval> out;
        out.reserve(rows->size());
        for (const auto &[key, raw] : *rows)
        {
            Json parsed;
            try
            {
                parsed = Json::parse(raw);
            }
            catch (const Json::parse_error &e)
            {
                return std::unexpected(ArbiterError::parsing(std::format("Corrupt record at {}: {}", key, e.what())));
            }
            auto approval = Approval::from_json(parsed);
            if (!approval)
                return std::unexpected(approval.error());
            out.push_back(std::move(*approval));
        }
        return out;
    }

} // namespace arbiter
