#include "proposal_log.hpp"

#include <mutex>
#include <utility>

namespace safe::proposer {
    void ProposalLog::append(types::ProposeRequest request) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.push_back(std::move(request));
    }

    std::vector<types::ProposeRequest> ProposalLog::snapshot() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_;
    }

    std::size_t ProposalLog::size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }
}  // namespace safe::proposer
