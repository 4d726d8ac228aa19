#include "arbiter/types.hpp"
#include <ctime>

namespace arbiter
{

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::ValidationError:
            return "validation_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::Busy:
            return "busy";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::AlreadyExists:
            return "already_exists";
        case ErrorCode::Conflict:
            return "conflict";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::ParsingError:
            return "parsing_error";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    Clock system_clock()
    {
        return [] { return std::chrono::system_clock::now(); };
    }

    std::string format_timestamp(std::chrono::system_clock::time_point tp)
    {
        auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        if (ms.count() < 0)
        {
            // pre-epoch instants: to_time_t rounds toward zero
            ms += std::chrono::milliseconds(1000);
            --time_t_tp;
        }

        std::tm tm_buf;
        gmtime_r(&time_t_tp, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    std::string to_string(CouncilStatus status)
    {
        switch (status)
        {
        case CouncilStatus::Active:
            return "ACTIVE";
        case CouncilStatus::Archived:
            return "ARCHIVED";
        }
        return "UNKNOWN";
    }

    std::string to_string(CouncilRole role)
    {
        switch (role)
        {
        case CouncilRole::Chair:
            return "CHAIR";
        case CouncilRole::Partner:
            return "PARTNER";
        case CouncilRole::Observer:
            return "OBSERVER";
        }
        return "UNKNOWN";
    }

    std::string to_string(MembershipStatus status)
    {
        switch (status)
        {
        case MembershipStatus::Active:
            return "ACTIVE";
        case MembershipStatus::Revoked:
            return "REVOKED";
        }
        return "UNKNOWN";
    }

    std::string to_string(ApprovalStatus status)
    {
        switch (status)
        {
        case ApprovalStatus::Approved:
            return "APPROVED";
        case ApprovalStatus::Rejected:
            return "REJECTED";
        case ApprovalStatus::Pending:
            return "PENDING";
        }
        return "UNKNOWN";
    }

    std::string to_string(LedgerEntryType type)
    {
        switch (type)
        {
        case LedgerEntryType::Approval:
            return "APPROVAL";
        case LedgerEntryType::Rejection:
            return "REJECTION";
        case LedgerEntryType::StatusChange:
            return "STATUS_CHANGE";
        case LedgerEntryType::Assignment:
            return "ASSIGNMENT";
        case LedgerEntryType::MemberAdded:
            return "MEMBER_ADDED";
        case LedgerEntryType::MemberRevoked:
            return "MEMBER_REVOKED";
        case LedgerEntryType::PolicyChange:
            return "POLICY_CHANGE";
        case LedgerEntryType::SystemEvent:
            return "SYSTEM_EVENT";
        }
        return "UNKNOWN";
    }

    Result<CouncilStatus> council_status_from_string(std::string_view s)
    {
        if (s == "ACTIVE")
            return CouncilStatus::Active;
        if (s == "ARCHIVED")
            return CouncilStatus::Archived;
        return std::unexpected(ArbiterError::invalid_input(std::format("Invalid council status: {}", s)));
    }

    Result<CouncilRole> council_role_from_string(std::string_view s)
    {
        if (s == "CHAIR")
            return CouncilRole::Chair;
        if (s == "PARTNER")
            return CouncilRole::Partner;
        if (s == "OBSERVER")
            return CouncilRole::Observer;
        return std::unexpected(ArbiterError::invalid_input(std::format("Invalid council role: {}", s)));
    }

    Result<MembershipStatus> membership_status_from_string(std::string_view s)
    {
        if (s == "ACTIVE")
            return MembershipStatus::Active;
        if (s == "REVOKED")
            return MembershipStatus::Revoked;
        return std::unexpected(ArbiterError::invalid_input(std::format("Invalid membership status: {}", s)));
    }

    Result<ApprovalStatus> approval_status_from_string(std::string_view s)
    {
        if (s == "APPROVED")
            return ApprovalStatus::Approved;
        if (s == "REJECTED")
            return ApprovalStatus::Rejected;
        if (s == "PENDING")
            return ApprovalStatus::Pending;
        return std::unexpected(ArbiterError::invalid_input(std::format("Invalid approval status: {}", s)));
    }

    Result<LedgerEntryType> ledger_entry_type_from_string(std::string_view s)
    {
        if (s == "APPROVAL")
            return LedgerEntryType::Approval;
        if (s == "REJECTION")
            return LedgerEntryType::Rejection;
        if (s == "STATUS_CHANGE")
            return LedgerEntryType::StatusChange;
        if (s == "ASSIGNMENT")
            return LedgerEntryType::Assignment;
        if (s == "MEMBER_ADDED")
            return LedgerEntryType::MemberAdded;
        if (s == "MEMBER_REVOKED")
            return LedgerEntryType::MemberRevoked;
        if (s == "POLICY_CHANGE")
            return LedgerEntryType::PolicyChange;
        if (s == "SYSTEM_EVENT")
            return LedgerEntryType::SystemEvent;
        return std::unexpected(ArbiterError::invalid_input(std::format("Invalid ledger entry type: {}", s)));
    }

    bool is_vote_entry_type(LedgerEntryType type)
    {
        return type == LedgerEntryType::Approval || type == LedgerEntryType::Rejection;
    }

    LedgerEntryType entry_type_for_decision(ApprovalStatus status)
    {
        switch (status)
        {
        case ApprovalStatus::Approved:
            return LedgerEntryType::Approval;
        case ApprovalStatus::Rejected:
            return LedgerEntryType::Rejection;
        case ApprovalStatus::Pending:
            // an abstention-style vote is not a verdict-bearing event
            return LedgerEntryType::StatusChange;
        }
        return LedgerEntryType::StatusChange;
    }

} // namespace arbiter
