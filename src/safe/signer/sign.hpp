#ifndef SAFE_RELAY_SAFE_SIGNER_SIGN_HPP
#define SAFE_RELAY_SAFE_SIGNER_SIGN_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "../types/primitives.hpp"
#include "../types/transaction.hpp"
#include "interface.hpp"

namespace safe::signer {
    // Signs an already computed safeTxHash. Every failure of the signing
    // capability surfaces as SignerError and nothing is retried.
    types::ProposeSignature sign_digest(ISigner& signer, const types::Hash32& digest, std::optional<std::string> origin = std::nullopt);

    types::ProposeSignature sign_transaction(ISigner& signer, const types::SafeTransactionData& tx, const types::Address& safe, std::uint64_t chain_id,
                                             std::optional<std::string> origin = std::nullopt);
}  // namespace safe::signer

#endif
