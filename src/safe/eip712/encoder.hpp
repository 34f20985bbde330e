#ifndef SAFE_RELAY_SAFE_EIP712_ENCODER_HPP
#define SAFE_RELAY_SAFE_EIP712_ENCODER_HPP

#include <array>
#include <cstdint>

#include "../../utils/constants.hpp"
#include "../types/primitives.hpp"
#include "../types/transaction.hpp"

namespace safe::eip712 {
    using Word = std::array<std::uint8_t, constants::ABI_WORD_SIZE>;

    inline constexpr const char* SAFE_TX_TYPE =
        "SafeTx(address to,uint256 value,bytes data,uint8 operation,uint256 safeTxGas,uint256 baseGas,uint256 gasPrice,address gasToken,address "
        "refundReceiver,uint256 nonce)";
    inline constexpr const char* DOMAIN_TYPE = "EIP712Domain(uint256 chainId,address verifyingContract)";

    // Computed once, on first use.
    const types::Hash32& safe_tx_typehash();
    const types::Hash32& domain_typehash();

    Word encode_word(const types::uint256& value);
    Word encode_word(const types::Address& address);
    Word encode_word(const types::Hash32& hash);

    // ABI encoding of the SafeTx tuple in schema order. An unset operation
    // encodes as Call and absent data as keccak256 of the empty string.
    types::Bytes encode_struct(const types::SafeTransactionData& tx);

    types::Bytes encode_domain(std::uint64_t chain_id, const types::Address& verifying_contract);
}  // namespace safe::eip712

#endif
