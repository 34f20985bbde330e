#include "safe_proposer.hpp"

#include <string>
#include <utility>

#include "../../utils/logging.hpp"
#include "precondition_error.hpp"
#include "proposal_flow.hpp"

namespace safe::proposer {
    SafeProposer::SafeProposer(std::shared_ptr<http::safe_api::SafeAPI> api, std::shared_ptr<signer::ISigner> signer, std::uint64_t chain_id,
                               ProposerOptions options)
        : api_(std::move(api)), signer_(std::move(signer)), chain_id_(chain_id), options_(std::move(options)) {
        if (signer_ == nullptr) {
            throw PreconditionError(PreconditionError::Reason::NO_SIGNER, "Operation requires signer");
        }
        if (api_->service().chain_id_ != chain_id_) {
            throw PreconditionError(PreconditionError::Reason::WRONG_CHAIN, "Wrong chain: signing for chain id " + std::to_string(chain_id_) +
                                                                                ", service indexes chain id " + std::to_string(api_->service().chain_id_));
        }
    }

    types::ProposeRequest SafeProposer::build_request(const types::SafeTransactionData& tx, const types::Address& safe) {
        ProposalFlow flow(tx, safe, chain_id_);
        flow.hash();
        types::ProposeRequest request = flow.sign(*signer_, options_.origin_);

        log_.append(request);
        return request;
    }

    types::MsigTxResponse SafeProposer::submit_proposal(const types::ProposeRequest& request, const types::Address& safe) {
        const types::Address available = signer_->address();
        if (request.signature_.sender_ != available) {
            throw PreconditionError(PreconditionError::Reason::WRONG_SIGNER, "Wrong signer: request specified " + request.signature_.sender_.to_checksum() +
                                                                                 ", client has " + available.to_checksum());
        }

        ProposalFlow flow = ProposalFlow::resume_signed(request, safe, chain_id_);
        flow.submit(*api_);
        logging::get()->info("Submitted proposal {} to safe {}", flow.safe_tx_hash().to_hex(), safe.to_checksum());

        const types::MsigTxResponse& record = flow.confirm(*api_);
        logging::get()->info("Confirmed proposal {} on safe {} with {} confirmation(s)", record.safe_tx_hash_.to_hex(), safe.to_checksum(),
                             record.confirmations_.size());
        return record;
    }

    types::MsigTxResponse SafeProposer::propose_tx(const types::SafeTransactionData& tx, const types::Address& safe) {
        return submit_proposal(build_request(tx, safe), safe);
    }

    types::MsigTxResponse SafeProposer::propose(const types::MetaTransactionData& tx, const types::Address& safe) {
        types::SafeTransactionData full;
        full.core_ = tx;
        full.gas_ = options_.default_gas_;
        full.nonce_ = fetch_nonce(safe);
        return propose_tx(full, safe);
    }

    types::Signature SafeProposer::sign_transaction(const types::EthTransactionRequest& tx, const types::Address& safe) {
        if (!tx.to_) {
            throw PreconditionError(PreconditionError::Reason::MISSING_TO, "Transaction must specify to address");
        }

        types::SafeTransactionData full;
        full.core_.to_ = *tx.to_;
        full.core_.value_ = tx.value_;
        full.core_.data_ = tx.data_;
        full.gas_ = options_.default_gas_;
        full.nonce_ = api_->safe_info(safe).nonce_;

        const types::ProposeRequest request = build_request(full, safe);
        if (options_.submit_to_api_) {
            submit_proposal(request, safe);
        }
        return request.signature_.signature_;
    }

    types::MsigTxResponse SafeProposer::reconcile(const types::Hash32& safe_tx_hash) { return api_->transaction_info(safe_tx_hash); }

    std::uint64_t SafeProposer::fetch_nonce(const types::Address& safe) {
        if (options_.nonce_source_ == NonceSource::SAFE_INFO) {
            return api_->safe_info(safe).nonce_;
        }
        return api_->next_nonce(safe);
    }
}  // namespace safe::proposer
