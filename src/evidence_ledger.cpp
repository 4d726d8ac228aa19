#include "arbiter/evidence_ledger.hpp"
#include "arbiter/council.hpp"
#include "arbiter/crypto.hpp"
#include "arbiter/json_canonicalization.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace arbiter
{

    using Json = nlohmann::json;

    namespace
    {
        Result<Json> parse_record(const std::string &key, const std::string &raw)
        {
            try
            {
                return Json::parse(raw);
            }
            catch (const Json::parse_error &e)
            {
                return std::unexpected(ArbiterError::parsing(std::format("Corrupt record at {}: {}", key, e.what())));
            }
        }

        Result<void> validate_draft(const LedgerDraft &draft)
        {
            if (auto res = keys::validate_id("assessment_id", draft.assessment_id); !res)
                return res;
            if (draft.actor_id.empty())
                return std::unexpected(ArbiterError::validation("actor_id is required"));
            if (draft.actor_role.empty())
                return std::unexpected(ArbiterError::validation("actor_role is required"));
            if (json::RFC8785Canonicalizer::contains_non_finite(draft.payload))
                return std::unexpected(ArbiterError::invalid_input("payload contains a non-finite number"));
            return {};
        }

        VerificationResult failure(std::size_t index,
                                   std::string reason,
                                   std::optional<std::string> expected,
                                   std::optional<std::string> actual)
        {
            VerificationResult r;
            r.verified = false;
            r.entries_checked = index + 1;
            r.failure_index = index;
            r.expected_hash = std::move(expected);
            r.actual_hash = std::move(actual);
            r.reason = std::move(reason);
            return r;
        }
    } // namespace

    Json VerificationResult::to_json() const
    {
        Json j{{"verified", verified}, {"entries_checked", entries_checked}};
        if (!verified)
        {
            j["failure_index"] = failure_index ? Json(*failure_index) : Json(nullptr);
            j["expected_hash"] = json::nullable(expected_hash);
            j["actual_hash"] = json::nullable(actual_hash);
            j["reason"] = json::nullable(reason);
        }
        return j;
    }

    Json LedgerPage::to_json() const
    {
        Json items = Json::array();
        for (const auto &e : entries)
            items.push_back(e.to_json());
        return Json{{"entries", items},
                    {"next_cursor", next_cursor ? Json(*next_cursor) : Json(nullptr)}};
    }

    EvidenceLedger::EvidenceLedger(KeyValueStore &store, LedgerConfig cfg, Clock clock)
        : store_(store), cfg_(cfg), clock_(std::move(clock))
    {
    }

    Result<LedgerEntry> EvidenceLedger::append(StoreTransaction &txn, const LedgerDraft &draft) const
    {
        if (auto valid = validate_draft(draft); !valid)
            return std::unexpected(valid.error());

        // Lock the tail first: everything below is serialized per assessment
        auto head_key = keys::ledger_head(draft.assessment_id);
        auto head_raw = txn.get_for_update(head_key);
        if (!head_raw)
            return std::unexpected(head_raw.error());

        std::optional<LedgerHead> head;
        if (*head_raw)
        {
            auto parsed = parse_record(head_key, **head_raw);
            if (!parsed)
                return std::unexpected(parsed.error());
            auto h = LedgerHead::from_json(*parsed);
            if (!h)
                return std::unexpected(h.error());
            head = std::move(*h);
        }

        LedgerEntry entry;
        entry.id = crypto::SecureRandom::generate_id("led");
        entry.assessment_id = draft.assessment_id;
        entry.council_id = draft.council_id;
        entry.membership_id = draft.membership_id;
        entry.approval_id = draft.approval_id;
        entry.actor_id = draft.actor_id;
        entry.actor_role = draft.actor_role;
        entry.entry_type = draft.entry_type;
        entry.payload = draft.payload;
        entry.seq = head ? head->seq + 1 : 1;
        entry.prev_hash = head ? std::optional<std::string>(head->hash) : std::nullopt;

        // ISO-8601 strings of equal shape order lexicographically
        entry.created_at = format_timestamp(clock_());
        if (head && entry.created_at < head->created_at)
            entry.created_at = head->created_at;

        auto hash = entry.compute_hash();
        if (!hash)
            return std::unexpected(hash.error());
        entry.hash = std::move(*hash);

        auto entry_key = keys::ledger_entry(entry.assessment_id, entry.seq);
        if (auto res = txn.put(entry_key, entry.to_json().dump()); !res)
            return std::unexpected(res.error());

        LedgerHead next{entry.seq, entry.hash, entry.created_at};
        if (auto res = txn.put(head_key, next.to_json().dump()); !res)
            return std::unexpected(res.error());

        spdlog::debug("Ledger append {} seq={} type={} hash={}",
                      entry.assessment_id, entry.seq, to_string(entry.entry_type), entry.hash);
        return entry;
    }

    Result<LedgerEntry> EvidenceLedger::append(const LedgerDraft &draft)
    {
        auto txn = store_.begin();
        auto entry = append(*txn, draft);
        if (!entry)
            return entry;
        if (auto res = txn->commit(); !res)
        {
            spdlog::error("Ledger append commit failed for {}: {}", draft.assessment_id, res.error().what());
            return std::unexpected(res.error());
        }
        return entry;
    }

    Result<std::vector<LedgerEntry>> EvidenceLedger::entries(std::string_view assessment_id) const
    {
        if (auto res = keys::validate_id("assessment_id", assessment_id); !res)
            return std::unexpected(res.error());

        auto rows = store_.scan_prefix(keys::ledger_prefix(assessment_id));
        if (!rows)
            return std::unexpected(rows.error());

        std::vector<LedgerEntry> out;
        out.reserve(rows->size());
        for (const auto &[key, raw] : *rows)
        {
            auto parsed = parse_record(key, raw);
            if (!parsed)
                return std::unexpected(parsed.error());
            auto entry = LedgerEntry::from_json(*parsed);
            if (!entry)
                return std::unexpected(entry.error());
            out.push_back(std::move(*entry));
        }
        return out;
    }

    Result<VerificationResult> EvidenceLedger::verify(std::string_view assessment_id) const
    {
        if (auto res = keys::validate_id("assessment_id", assessment_id); !res)
            return std::unexpected(res.error());

        // Holding the tail lock keeps appends out while the rows and the head are compared
        auto txn = store_.begin();
        auto head_key = keys::ledger_head(assessment_id);
        auto head_raw = txn->get_for_update(head_key);
        if (!head_raw)
            return std::unexpected(head_raw.error());

        auto rows = txn->scan_prefix(keys::ledger_prefix(assessment_id));
        if (!rows)
            return std::unexpected(rows.error());

        VerificationResult result;
        std::optional<std::string> previous;
        for (std::size_t i = 0; i < rows->size(); ++i)
        {
            const auto &raw = (*rows)[i].second;

            Json parsed;
            try
            {
                parsed = Json::parse(raw);
            }
            catch (const Json::parse_error &)
            {
                result = failure(i, "unreadable_entry", std::nullopt, std::nullopt);
                break;
            }
            auto entry = LedgerEntry::from_json(parsed);
            if (!entry)
            {
                result = failure(i, "unreadable_entry", std::nullopt, std::nullopt);
                break;
            }

            if (entry->seq != i + 1 || (*rows)[i].first != keys::ledger_entry(assessment_id, entry->seq))
            {
                result = failure(i, "sequence_gap", std::nullopt, entry->hash);
                break;
            }

            // linkage: first entry has no predecessor, later ones name the previous hash
            if (entry->prev_hash != previous)
            {
                result = failure(i, "prev_hash_mismatch", previous, entry->prev_hash);
                break;
            }

            auto recomputed = entry->compute_hash();
            if (!recomputed)
            {
                result = failure(i, "unreadable_entry", std::nullopt, entry->hash);
                break;
            }
            if (*recomputed != entry->hash)
            {
                result = failure(i, "hash_mismatch", *recomputed, entry->hash);
                break;
            }

            previous = entry->hash;
            result.entries_checked = i + 1;
        }

        // The tail pointer must name the last row; a missing or stale one means entries were removed
        if (result.verified)
        {
            std::optional<LedgerHead> head;
            bool readable = true;
            if (*head_raw)
            {
                auto parsed = parse_record(head_key, **head_raw);
                auto h = parsed ? LedgerHead::from_json(*parsed) : Result<LedgerHead>(std::unexpected(parsed.error()));
                if (h)
                    head = std::move(*h);
                else
                    readable = false;
            }

            std::size_t count = rows->size();
            bool consistent = readable && (head ? (head->seq == count && previous == head->hash)
                                                : count == 0);
            if (!consistent)
            {
                std::size_t index = head ? std::min<std::size_t>(count, static_cast<std::size_t>(head->seq)) : 0;
                result = failure(index, "head_mismatch",
                                 head ? std::optional<std::string>(head->hash) : std::nullopt,
                                 previous);
                result.entries_checked = count;
            }
        }
        txn->rollback();

        if (!result.verified)
        {
            spdlog::critical("Ledger verification FAILED for {} at index {} ({}): expected={} actual={}",
                             assessment_id, *result.failure_index, *result.reason,
                             result.expected_hash.value_or("null"), result.actual_hash.value_or("null"));
        }
        else
        {
            spdlog::debug("Ledger verified for {} ({} entries)", assessment_id, result.entries_checked);
        }
        return result;
    }

    Result<LedgerPage> EvidenceLedger::query(const LedgerQuery &query) const
    {
        std::size_t limit = query.limit.value_or(cfg_.default_page_limit);
        if (limit == 0)
            limit = cfg_.default_page_limit;
        limit = std::min(limit, cfg_.max_page_limit);

        auto all = entries(query.assessment_id);
        if (!all)
            return std::unexpected(all.error());

        LedgerPage page;
        for (auto &entry : *all)
        {
            if (query.cursor && entry.seq <= *query.cursor)
                continue;
            if (!query.entry_types.empty() &&
                std::find(query.entry_types.begin(), query.entry_types.end(), entry.entry_type) == query.entry_types.end())
                continue;
            if (page.entries.size() == limit)
            {
                page.next_cursor = page.entries.back().seq;
                break;
            }
            page.entries.push_back(std::move(entry));
        }
        return page;
    }

} // namespace arbiter
