#include "proposal_flow.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "../eip712/hasher.hpp"
#include "../signer/sign.hpp"
#include "precondition_error.hpp"

namespace safe::proposer {
    const char* to_string(ProposalState state) {
        switch (state) {
            case ProposalState::BUILT:
                return "built";
            case ProposalState::HASHED:
                return "hashed";
            case ProposalState::SIGNED:
                return "signed";
            case ProposalState::SUBMITTED:
                return "submitted";
            case ProposalState::CONFIRMED:
                return "confirmed";
            case ProposalState::ERRORED:
                return "errored";
        }
        return "unknown";
    }

    ProposalFlow::ProposalFlow(types::SafeTransactionData tx, types::Address safe, std::uint64_t chain_id)
        : tx_(std::move(tx)), safe_(safe), chain_id_(chain_id) {}

    ProposalFlow ProposalFlow::resume_signed(types::ProposeRequest request, types::Address safe, std::uint64_t chain_id) {
        ProposalFlow flow(request.tx_, safe, chain_id);
        const types::Hash32 digest = eip712::safe_tx_hash(flow.tx_, flow.safe_, flow.chain_id_);
        if (digest != request.contract_transaction_hash_) {
            throw PreconditionError(PreconditionError::Reason::HASH_MISMATCH, "Hash mismatch: request specified " +
                                                                                  request.contract_transaction_hash_.to_hex() + ", transaction hashes to " +
                                                                                  digest.to_hex());
        }
        flow.safe_tx_hash_ = digest;
        flow.request_ = std::move(request);
        flow.state_ = ProposalState::SIGNED;
        return flow;
    }

    void ProposalFlow::expect(ProposalState expected, const char* step) const {
        if (state_ != expected) {
            throw std::logic_error(std::string("Cannot ") + step + " a proposal in state " + to_string(state_) + ", expected " + to_string(expected));
        }
    }

    template <typename Fn>
    void ProposalFlow::run_step(ProposalState next, Fn&& fn) {
        try {
            fn();
        } catch (const std::exception&) {
            state_ = ProposalState::ERRORED;
            throw;
        }
        state_ = next;
    }

    const types::Hash32& ProposalFlow::hash() {
        expect(ProposalState::BUILT, "hash");
        run_step(ProposalState::HASHED, [this] { safe_tx_hash_ = eip712::safe_tx_hash(tx_, safe_, chain_id_); });
        return *safe_tx_hash_;
    }

    const types::ProposeRequest& ProposalFlow::sign(signer::ISigner& signer, std::optional<std::string> origin) {
        expect(ProposalState::HASHED, "sign");
        run_step(ProposalState::SIGNED, [this, &signer, &origin] {
            types::ProposeRequest request;
            request.tx_ = tx_;
            request.contract_transaction_hash_ = *safe_tx_hash_;
            request.signature_ = signer::sign_digest(signer, *safe_tx_hash_, std::move(origin));
            request_ = std::move(request);
        });
        return *request_;
    }

    void ProposalFlow::submit(http::safe_api::SafeAPI& api) {
        expect(ProposalState::SIGNED, "submit");
        run_step(ProposalState::SUBMITTED, [this, &api] { api.post_proposal(safe_, *request_); });
    }

    const types::MsigTxResponse& ProposalFlow::confirm(http::safe_api::SafeAPI& api) {
        expect(ProposalState::SUBMITTED, "confirm");
        run_step(ProposalState::CONFIRMED, [this, &api] { record_ = api.transaction_info(*safe_tx_hash_); });
        return *record_;
    }

    const types::Hash32& ProposalFlow::safe_tx_hash() const {
        if (!safe_tx_hash_) {
            throw std::logic_error("Proposal has not been hashed");
        }
        return *safe_tx_hash_;
    }

    const types::ProposeRequest& ProposalFlow::request() const {
        if (!request_) {
            throw std::logic_error("Proposal has not been signed");
        }
        return *request_;
    }

    const types::MsigTxResponse& ProposalFlow::record() const {
        if (!record_) {
            throw std::logic_error("Proposal has not been confirmed");
        }
        return *record_;
    }
}  // namespace safe::proposer
