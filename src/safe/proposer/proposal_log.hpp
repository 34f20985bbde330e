#ifndef SAFE_RELAY_SAFE_PROPOSER_PROPOSAL_LOG_HPP
#define SAFE_RELAY_SAFE_PROPOSER_PROPOSAL_LOG_HPP

#include <cstddef>
#include <shared_mutex>
#include <vector>

#include "../types/transaction.hpp"

namespace safe::proposer {
    // Append-only audit trail of every request built. Never read back to
    // decide protocol behavior.
    class ProposalLog {
       public:
        void append(types::ProposeRequest request);

        [[nodiscard]] std::vector<types::ProposeRequest> snapshot() const;
        [[nodiscard]] std::size_t size() const;

       private:
        mutable std::shared_mutex mutex_;
        std::vector<types::ProposeRequest> entries_;
    };
}  // namespace safe::proposer

#endif
