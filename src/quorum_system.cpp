#include "arbiter/quorum_system.hpp"

namespace arbiter
{

    nlohmann::json ApprovalStatusReport::to_json() const
    {
        return nlohmann::json{
            {"approved", approved},
            {"rejected", rejected},
            {"pending", pending},
            {"quorum_met", quorum_met},
            {"total_approvals", total_approvals},
            {"total_rejections", total_rejections},
            {"total_pending", total_pending},
            {"required_quorum", required_quorum},
            {"requires_unanimous", requires_unanimous}};
    }

    ApprovalStatusReport QuorumSystem::evaluate(const Council &council, const std::vector<Approval> &active_votes)
    {
        std::size_t approvals = 0;
        std::size_t rejections = 0;
        std::size_t pending = 0;
        for (const auto &vote : active_votes)
        {
            switch (vote.status)
            {
            case ApprovalStatus::Approved:
                ++approvals;
                break;
            case ApprovalStatus::Rejected:
                ++rejections;
                break;
            case ApprovalStatus::Pending:
                ++pending;
                break;
            }
        }
        return evaluate(council.quorum, council.require_unanimous, approvals, rejections, pending);
    }

    ApprovalStatusReport QuorumSystem::evaluate(int quorum,
                                                bool require_unanimous,
                                                std::size_t approvals,
                                                std::size_t rejections,
                                                std::size_t pending)
    {
        ApprovalStatusReport r;
        r.required_quorum = quorum;
        r.requires_unanimous = require_unanimous;
        r.total_approvals = approvals;
        r.total_rejections = rejections;
        r.total_pending = pending;

        // stored councils always have quorum >= 1
        const std::size_t q = quorum < 1 ? 1 : static_cast<std::size_t>(quorum);
        r.quorum_met = approvals + rejections >= q;

        if (require_unanimous)
        {
            r.approved = r.quorum_met && rejections == 0 && approvals >= q;
            r.rejected = rejections > 0;
        }
        else
        {
            r.approved = approvals >= q;
            r.rejected = rejections > 0 && approvals < q;
        }
        r.pending = !r.approved && !r.rejected;
        return r;
    }

} // namespace arbiter
