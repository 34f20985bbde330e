#ifndef SAFE_RELAY_SAFE_TYPES_RESPONSES_HPP
#define SAFE_RELAY_SAFE_TYPES_RESPONSES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "primitives.hpp"
#include "transaction.hpp"

namespace safe::types {
    // Snapshot of on-chain state, never cached since the nonce moves.
    struct SafeInfoResponse {
        Address address_;
        std::uint64_t nonce_ = 0;
        std::uint32_t threshold_ = 0;
        std::vector<Address> owners_;
        Address master_copy_;
        std::vector<std::string> modules_;
        Address fallback_handler_;
        Address guard_;
        std::optional<std::string> version_;
    };

    template <typename T>
    struct Paginated {
        std::uint64_t count_ = 0;
        std::optional<std::string> next_;
        std::optional<std::string> previous_;
        std::vector<T> results_;
    };

    struct DecodedParameter {
        std::string name_;
        std::string type_;
    };

    struct DecodedData {
        std::string method_;
        std::vector<DecodedParameter> parameters_;
    };

    struct MsigConfirmation {
        Address owner_;
        std::string submission_date_;
        std::optional<Hash32> transaction_hash_;
        std::string signature_;
        std::string signature_type_;
    };

    struct MsigTxResponse {
        Address safe_;
        Address to_;
        uint256 value_{};
        std::optional<Bytes> data_;
        Operation operation_ = Operation::CALL;
        Address gas_token_;
        uint256 safe_tx_gas_{};
        uint256 base_gas_{};
        uint256 gas_price_{};
        Address refund_receiver_;
        std::uint64_t nonce_ = 0;
        std::optional<std::string> execution_date_;
        std::string submission_date_;
        std::string modified_;
        std::optional<std::uint64_t> block_number_;
        std::optional<Hash32> transaction_hash_;
        Hash32 safe_tx_hash_;
        std::optional<Address> executor_;
        bool is_executed_ = false;
        std::optional<bool> is_successful_;
        std::optional<uint256> eth_gas_price_;
        std::optional<uint256> max_fee_per_gas_;
        std::optional<uint256> max_priority_fee_per_gas_;
        std::optional<std::uint64_t> gas_used_;
        std::optional<uint256> fee_;
        std::optional<std::string> origin_;
        std::optional<DecodedData> data_decoded_;
        std::optional<std::uint32_t> confirmations_required_;
        std::vector<MsigConfirmation> confirmations_;
        bool trusted_ = false;
        std::optional<std::string> signatures_;
    };

    enum class TokenType : std::uint8_t {
        ERC20,
        ERC721,
        ERC1155,
    };

    struct TokenInfo {
        TokenType type_ = TokenType::ERC20;
        std::string address_;
        std::string name_;
        std::string symbol_;
        std::optional<std::uint32_t> decimals_;
        std::string logo_uri_;
    };

    using MsigHistoryResponse = Paginated<MsigTxResponse>;
    using TokenInfoResponse = Paginated<TokenInfo>;
}  // namespace safe::types

#endif
