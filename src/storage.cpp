#include "arbiter/storage.hpp"
#include "arbiter/json_canonicalization.hpp"
#include <format>

namespace arbiter::keys
{

    Result<void> validate_id(std::string_view field, std::string_view id)
    {
        if (id.empty())
            return std::unexpected(ArbiterError::validation(std::format("{} is required", field)));
        if (id.size() > kMaxIdLength)
            return std::unexpected(ArbiterError::validation(std::format("{} exceeds {} characters", field, kMaxIdLength)));
        for (unsigned char c : id)
        {
            if (c == '/' || c < 0x20 || c == 0x7F)
                return std::unexpected(ArbiterError::validation(std::format("{} contains an invalid character", field)));
        }
        if (!json::is_valid_utf8(id))
            return std::unexpected(ArbiterError::validation(std::format("{} is not valid UTF-8", field)));
        return {};
    }

    std::string sequence(uint64_t seq)
    {
        // zero padded so byte order equals numeric order
        return std::format("{:0{}}", seq, kSequenceWidth);
    }

    std::string council(std::string_view council_id)
    {
        return std::format("council/{}", council_id);
    }

    std::string council_prefix()
    {
        return "council/";
    }

    std::string membership(std::string_view membership_id)
    {
        return std::format("membership/{}", membership_id);
    }

    std::string membership_prefix()
    {
        return "membership/";
    }

    std::string membership_index(std::string_view council_id, std::string_view user_id)
    {
        return std::format("membership-index/{}/{}", council_id, user_id);
    }

    std::string membership_index_prefix(std::string_view council_id)
    {
        return std::format("membership-index/{}/", council_id);
    }

    std::string assessment(std::string_view assessment_id)
    {
        return std::format("assessment/{}", assessment_id);
    }

    std::string assessment_prefix()
    {
        return "assessment/";
    }

    std::string approval(std::string_view assessment_id, uint64_t seq)
    {
        return std::format("approval/{}/{}", assessment_id, sequence(seq));
    }

    std::string approval_prefix(std::string_view assessment_id)
    {
        return std::format("approval/{}/", assessment_id);
    }

    std::string approval_head(std::string_view assessment_id)
    {
        return std::format("approval-head/{}", assessment_id);
    }

    std::string ledger_entry(std::string_view assessment_id, uint64_t seq)
    {
        return std::format("ledger/{}/{}", assessment_id, sequence(seq));
    }

    std::string ledger_prefix(std::string_view assessment_id)
    {
        return std::format("ledger/{}/", assessment_id);
    }

    std::string ledger_head(std::string_view assessment_id)
    {
        return std::format("ledger-head/{}", assessment_id);
    }

} // namespace arbiter::keys
