#ifndef SAFE_RELAY_SAFE_PROPOSER_PROPOSAL_FLOW_HPP
#define SAFE_RELAY_SAFE_PROPOSER_PROPOSAL_FLOW_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "../../http/api/safe_api.hpp"
#include "../signer/interface.hpp"
#include "../types/primitives.hpp"
#include "../types/responses.hpp"
#include "../types/transaction.hpp"

namespace safe::proposer {
    enum class ProposalState : std::uint8_t {
        BUILT,
        HASHED,
        SIGNED,
        SUBMITTED,
        CONFIRMED,
        ERRORED,
    };

    const char* to_string(ProposalState state);

    // One proposal moving BUILT -> HASHED -> SIGNED -> SUBMITTED -> CONFIRMED.
    // A step called out of order throws std::logic_error and leaves the state
    // alone. A step that fails moves to ERRORED, which nothing leaves.
    class ProposalFlow {
       public:
        ProposalFlow(types::SafeTransactionData tx, types::Address safe, std::uint64_t chain_id);

        // Picks up a request signed elsewhere, already in SIGNED. The digest is
        // recomputed and a request whose contractTransactionHash differs is
        // refused with PreconditionError (HASH_MISMATCH).
        static ProposalFlow resume_signed(types::ProposeRequest request, types::Address safe, std::uint64_t chain_id);

        [[nodiscard]] ProposalState state() const { return state_; }

        const types::Hash32& hash();
        const types::ProposeRequest& sign(signer::ISigner& signer, std::optional<std::string> origin = std::nullopt);
        void submit(http::safe_api::SafeAPI& api);
        const types::MsigTxResponse& confirm(http::safe_api::SafeAPI& api);

        // Throw std::logic_error when the step that produces them has not run.
        [[nodiscard]] const types::Hash32& safe_tx_hash() const;
        [[nodiscard]] const types::ProposeRequest& request() const;
        [[nodiscard]] const types::MsigTxResponse& record() const;

       private:
        void expect(ProposalState expected, const char* step) const;

        template <typename Fn>
        void run_step(ProposalState next, Fn&& fn);

        types::SafeTransactionData tx_;
        types::Address safe_;
        std::uint64_t chain_id_;
        ProposalState state_ = ProposalState::BUILT;

        std::optional<types::Hash32> safe_tx_hash_;
        std::optional<types::ProposeRequest> request_;
        std::optional<types::MsigTxResponse> record_;
    };
}  // namespace safe::proposer

#endif
