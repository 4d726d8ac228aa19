#pragma once

#include <chrono>
#include <expected>
#include <format>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace arbiter
{

    /**
     * Lifecycle state of a Risk Council.
     * ACTIVE -> ARCHIVED is the only transition; ARCHIVED is terminal.
     */
    enum class CouncilStatus
    {
        Active,
        Archived
    };

    enum class CouncilRole
    {
        Chair,
        Partner,
        Observer
    };

    /**
     * Membership status. Only Active memberships may vote or count toward quorum.
     */
    enum class MembershipStatus
    {
        Active,
        Revoked
    };

    enum class ApprovalStatus
    {
        Approved,
        Rejected,
        Pending
    };

    /**
     * Kind of governance event recorded in an assessment's evidence chain.
     * Approval and Rejection are produced by decision submission only.
     */
    enum class LedgerEntryType
    {
        Approval,
        Rejection,
        StatusChange,
        Assignment,
        MemberAdded,
        MemberRevoked,
        PolicyChange,
        SystemEvent
    };

    /**
     * Error categories for Arbiter operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        ValidationError,
        StorageError,
        Busy,
        NotFound,
        AlreadyExists,
        Conflict,
        InvalidInput,
        ParsingError,
        InternalError
    };

    std::string_view error_code_name(ErrorCode code);

    /**
     * Arbiter error with code and message
     */
    class ArbiterError : public std::runtime_error
    {
    public:
        ErrorCode code;

        ArbiterError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        /** Persistence failures and lock contention may succeed on retry */
        bool is_retryable() const
        {
            return code == ErrorCode::StorageError || code == ErrorCode::Busy;
        }

        static ArbiterError config(const std::string &msg)
        {
            return ArbiterError(ErrorCode::ConfigError, msg);
        }

        static ArbiterError crypto(const std::string &msg)
        {
            return ArbiterError(ErrorCode::CryptoError, msg);
        }

        static ArbiterError validation(const std::string &msg)
        {
            return ArbiterError(ErrorCode::ValidationError, msg);
        }

        static ArbiterError storage(const std::string &msg)
        {
            return ArbiterError(ErrorCode::StorageError, msg);
        }

        static ArbiterError busy(const std::string &msg)
        {
            return ArbiterError(ErrorCode::Busy, msg);
        }

        static ArbiterError not_found(const std::string &msg)
        {
            return ArbiterError(ErrorCode::NotFound, msg);
        }

        static ArbiterError already_exists(const std::string &msg)
        {
            return ArbiterError(ErrorCode::AlreadyExists, msg);
        }

        static ArbiterError conflict(const std::string &msg)
        {
            return ArbiterError(ErrorCode::Conflict, msg);
        }

        static ArbiterError invalid_input(const std::string &msg)
        {
            return ArbiterError(ErrorCode::InvalidInput, msg);
        }

        static ArbiterError parsing(const std::string &msg)
        {
            return ArbiterError(ErrorCode::ParsingError, msg);
        }

        static ArbiterError internal(const std::string &msg)
        {
            return ArbiterError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, ArbiterError>;

    /** Wall clock source; injectable so ledger timestamps are reproducible in tests */
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    Clock system_clock();

    /** ISO 8601 UTC with millisecond precision, e.g. 2025-01-31T12:00:00.000Z */
    std::string format_timestamp(std::chrono::system_clock::time_point tp);

    std::string to_string(CouncilStatus status);
    std::string to_string(CouncilRole role);
    std::string to_string(MembershipStatus status);
    std::string to_string(ApprovalStatus status);
    std::string to_string(LedgerEntryType type);

    Result<CouncilStatus> council_status_from_string(std::string_view s);
    Result<CouncilRole> council_role_from_string(std::string_view s);
    Result<MembershipStatus> membership_status_from_string(std::string_view s);
    Result<ApprovalStatus> approval_status_from_string(std::string_view s);
    Result<LedgerEntryType> ledger_entry_type_from_string(std::string_view s);

    /** Vote entry types can only be appended together with an approval record */
    bool is_vote_entry_type(LedgerEntryType type);

    /** Ledger entry type recorded for a submitted decision */
    LedgerEntryType entry_type_for_decision(ApprovalStatus status);

} // namespace arbiter
