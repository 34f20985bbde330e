#ifndef SAFE_RELAY_SAFE_EIP712_HASHER_HPP
#define SAFE_RELAY_SAFE_EIP712_HASHER_HPP

#include <cstdint>

#include "../types/primitives.hpp"
#include "../types/transaction.hpp"

namespace safe::eip712 {
    types::Hash32 domain_separator(std::uint64_t chain_id, const types::Address& safe);

    types::Hash32 struct_hash(const types::SafeTransactionData& tx);

    // keccak256(0x19 || 0x01 || domainSeparator || structHash), the safeTxHash.
    types::Hash32 safe_tx_hash(const types::SafeTransactionData& tx, const types::Address& safe, std::uint64_t chain_id);
}  // namespace safe::eip712

#endif
