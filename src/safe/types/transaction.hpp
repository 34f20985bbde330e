#ifndef SAFE_RELAY_SAFE_TYPES_TRANSACTION_HPP
#define SAFE_RELAY_SAFE_TYPES_TRANSACTION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "primitives.hpp"

namespace safe::types {
    enum class Operation : std::uint8_t {
        CALL = 0,
        DELEGATE_CALL = 1,
    };

    // Wire decoding: 1 is DelegateCall, anything else is Call.
    inline Operation operation_from_wire(std::uint64_t raw) { return raw == 1 ? Operation::DELEGATE_CALL : Operation::CALL; }

    // Throws std::invalid_argument for anything but "call" / "delegatecall".
    Operation parse_operation(std::string_view text);

    struct MetaTransactionData {
        Address to_;
        uint256 value_{};
        std::optional<Bytes> data_;
        std::optional<Operation> operation_;

        [[nodiscard]] Operation effective_operation() const { return operation_.value_or(Operation::CALL); }
    };

    struct GasConfig {
        uint256 safe_tx_gas_{};
        uint256 base_gas_{};
        uint256 gas_price_{};
        Address gas_token_{};
        Address refund_receiver_{};
    };

    struct SafeTransactionData {
        MetaTransactionData core_;
        GasConfig gas_;
        std::uint64_t nonce_ = 0;
    };

    struct ProposeSignature {
        Address sender_;
        Signature signature_;
        std::optional<std::string> origin_;
    };

    struct ProposeRequest {
        SafeTransactionData tx_;
        Hash32 contract_transaction_hash_;
        ProposeSignature signature_;
    };

    // Plain transaction request as a wallet middleware would receive it.
    struct EthTransactionRequest {
        std::optional<Address> to_;
        uint256 value_{};
        std::optional<Bytes> data_;
    };
}  // namespace safe::types

#endif
