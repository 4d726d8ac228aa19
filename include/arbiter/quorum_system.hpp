#pragma once

#include "approval_store.hpp"
#include "council.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <vector>

namespace arbiter
{

    /** Verdict for an assessment together with the tallies it was computed from */
    struct ApprovalStatusReport
    {
        bool approved{false};
        bool rejected{false};
        bool pending{true};
        bool quorum_met{false};
        std::size_t total_approvals{0};
        std::size_t total_rejections{0};
        std::size_t total_pending{0};
        int required_quorum{1};
        bool requires_unanimous{false};

        nlohmann::json to_json() const;
    };

    class QuorumSystem
    {
    public:
        /**
         * Compute the verdict from votes of currently active memberships.
         *
         * Majority: approved once approvals reach the quorum; rejected when
         * there is a rejection and approvals fall short. Unanimous: approved
         * when the quorum is met with no rejection; any rejection rejects.
         * Exactly one of approved, rejected and pending holds.
         */
        static ApprovalStatusReport evaluate(const Council &council, const std::vector<Approval> &active_votes);

        static ApprovalStatusReport evaluate(int quorum,
                                             bool require_unanimous,
                                             std::size_t approvals,
                                             std::size_t rejections,
                                             std::size_t pending);
    };

} // namespace arbiter
