#include "arbiter/ledger_entry.hpp"
#include "arbiter/council.hpp"
#include "arbiter/crypto.hpp"
#include "arbiter/json_canonicalization.hpp"

namespace arbiter
{

    using Json = nlohmann::json;

    Json LedgerEntry::hash_preimage() const
    {
        return Json{
            {"id", id},
            {"assessment_id", assessment_id},
            {"council_id", json::nullable(council_id)},
            {"membership_id", json::nullable(membership_id)},
            {"approval_id", json::nullable(approval_id)},
            {"actor_id", actor_id},
            {"actor_role", actor_role},
            {"entry_type", to_string(entry_type)},
            {"payload", payload},
            {"prev_hash", json::nullable(prev_hash)},
            {"created_at", created_at}};
    }

    Json LedgerEntry::to_json() const
    {
        Json j = hash_preimage();
        j["hash"] = hash;
        j["seq"] = seq;
        return j;
    }

    Result<LedgerEntry> LedgerEntry::from_json(const Json &j)
    {
        try
        {
            LedgerEntry e;
            e.id = j.at("id").get<std::string>();
            e.assessment_id = j.at("assessment_id").get<std::string>();
            e.council_id = json::optional_string(j, "council_id");
            e.membership_id = json::optional_string(j, "membership_id");
            e.approval_id = json::optional_string(j, "approval_id");
            e.actor_id = j.at("actor_id").get<std::string>();
            e.actor_role = j.at("actor_role").get<std::string>();
            auto type = ledger_entry_type_from_string(j.at("entry_type").get<std::string>());
            if (!type)
                return std::unexpected(type.error());
            e.entry_type = *type;
            e.payload = j.at("payload");
            e.hash = j.at("hash").get<std::string>();
            e.prev_hash = json::optional_string(j, "prev_hash");
            e.created_at = j.at("created_at").get<std::string>();
            e.seq = j.at("seq").get<uint64_t>();
            return e;
        }
        catch (const Json::exception &ex)
        {
            return std::unexpected(ArbiterError::parsing(std::string("Invalid ledger entry: ") + ex.what()));
        }
    }

    Result<std::string> LedgerEntry::to_canonical_json() const
    {
        return json::RFC8785Canonicalizer::canonicalize(hash_preimage());
    }

    Result<std::string> LedgerEntry::compute_hash() const
    {
        auto canonical = to_canonical_json();
        if (!canonical)
            return std::unexpected(canonical.error());
        return crypto::SHA256::hex_digest(*canonical);
    }

    Json LedgerHead::to_json() const
    {
        return Json{{"seq", seq}, {"hash", hash}, {"created_at", created_at}};
    }

    Result<LedgerHead> LedgerHead::from_json(const Json &j)
    {
        try
        {
            return LedgerHead{
                j.at("seq").get<uint64_t>(),
                j.at("hash").get<std::string>(),
                j.at("created_at").get<std::string>()};
        }
        catch (const Json::exception &ex)
        {
            return std::unexpected(ArbiterError::parsing(std::string("Invalid ledger head: ") + ex.what()));
        }
    }

} // namespace arbiter
