#include "sign.hpp"

#include <exception>
#include <utility>

#include "../eip712/hasher.hpp"
#include "signer_error.hpp"

namespace safe::signer {
    types::ProposeSignature sign_digest(ISigner& signer, const types::Hash32& digest, std::optional<std::string> origin) {
        types::ProposeSignature out;
        out.origin_ = std::move(origin);

        try {
            out.sender_ = signer.address();
            out.signature_ = signer.sign_digest(digest);
        } catch (const SignerError&) {
            throw;
        } catch (const std::exception& e) {
            throw SignerError(e.what());
        }

        return out;
    }

    types::ProposeSignature sign_transaction(ISigner& signer, const types::SafeTransactionData& tx, const types::Address& safe, std::uint64_t chain_id,
                                             std::optional<std::string> origin) {
        return sign_digest(signer, eip712::safe_tx_hash(tx, safe, chain_id), std::move(origin));
    }
}  // namespace safe::signer
