#ifndef SAFE_RELAY_SAFE_PROPOSER_SAFE_PROPOSER_HPP
#define SAFE_RELAY_SAFE_PROPOSER_SAFE_PROPOSER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../http/api/safe_api.hpp"
#include "../signer/interface.hpp"
#include "../types/primitives.hpp"
#include "../types/responses.hpp"
#include "../types/transaction.hpp"
#include "proposal_log.hpp"

namespace safe::proposer {
    enum class NonceSource : std::uint8_t {
        HISTORY,    // highest known nonce + 1 over the full history
        SAFE_INFO,  // the on-chain nonce reported by the safe info endpoint
    };

    struct ProposerOptions {
        bool submit_to_api_ = true;
        NonceSource nonce_source_ = NonceSource::HISTORY;
        types::GasConfig default_gas_{};
        std::optional<std::string> origin_;
    };

    // Signing client for one service deployment. Nonces are fetched fresh for
    // every proposal; concurrent callers proposing for the same safe must
    // serialize themselves.
    class SafeProposer {
       public:
        // Throws PreconditionError before any I/O: NO_SIGNER when signer is null,
        // WRONG_CHAIN when chain_id is not the chain the service indexes.
        SafeProposer(std::shared_ptr<http::safe_api::SafeAPI> api, std::shared_ptr<signer::ISigner> signer, std::uint64_t chain_id,
                     ProposerOptions options = {});

        [[nodiscard]] std::uint64_t chain_id() const { return chain_id_; }

        // Hash, sign and log. No I/O.
        types::ProposeRequest build_request(const types::SafeTransactionData& tx, const types::Address& safe);

        // POST, then read the canonical record back by its safeTxHash.
        types::MsigTxResponse submit_proposal(const types::ProposeRequest& request, const types::Address& safe);

        types::MsigTxResponse propose_tx(const types::SafeTransactionData& tx, const types::Address& safe);

        types::MsigTxResponse propose(const types::MetaTransactionData& tx, const types::Address& safe);

        // Wallet-middleware path: wraps a plain transaction request into a safe
        // proposal at the on-chain nonce and returns the owner signature.
        types::Signature sign_transaction(const types::EthTransactionRequest& tx, const types::Address& safe);

        // Re-reads a record whose submission outcome is unknown.
        types::MsigTxResponse reconcile(const types::Hash32& safe_tx_hash);

        [[nodiscard]] std::vector<types::ProposeRequest> proposals() const { return log_.snapshot(); }

       private:
        std::uint64_t fetch_nonce(const types::Address& safe);

        std::shared_ptr<http::safe_api::SafeAPI> api_;
        std::shared_ptr<signer::ISigner> signer_;
        std::uint64_t chain_id_;
        ProposerOptions options_;
        ProposalLog log_;
    };
}  // namespace safe::proposer

#endif
