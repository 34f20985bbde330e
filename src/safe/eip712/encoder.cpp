#include "encoder.hpp"

#include <algorithm>
#include <string_view>

#include "../crypto/keccak.hpp"

namespace safe::eip712 {
    namespace {
        void append(types::Bytes& out, const Word& word) { out.insert(out.end(), word.begin(), word.end()); }
    }  // namespace

    const types::Hash32& safe_tx_typehash() {
        static const types::Hash32 hash{crypto::keccak256(std::string_view(SAFE_TX_TYPE))};
        return hash;
    }

    const types::Hash32& domain_typehash() {
        static const types::Hash32 hash{crypto::keccak256(std::string_view(DOMAIN_TYPE))};
        return hash;
    }

    Word encode_word(const types::uint256& value) {
        Word w{};
        intx::be::unsafe::store(w.data(), value);
        return w;
    }

    Word encode_word(const types::Address& address) {
        Word w{};
        std::copy(address.bytes_.begin(), address.bytes_.end(), w.begin() + (constants::ABI_WORD_SIZE - constants::ADDRESS_SIZE));
        return w;
    }

    Word encode_word(const types::Hash32& hash) { return hash.bytes_; }

    types::Bytes encode_struct(const types::SafeTransactionData& tx) {
        const types::Bytes empty;
        const types::Bytes& data = tx.core_.data_ ? *tx.core_.data_ : empty;
        const types::Hash32 data_hash{crypto::keccak256(data)};
        const auto operation = static_cast<std::uint8_t>(tx.core_.effective_operation());

        types::Bytes out;
        out.reserve(11 * constants::ABI_WORD_SIZE);
        append(out, encode_word(safe_tx_typehash()));
        append(out, encode_word(tx.core_.to_));
        append(out, encode_word(tx.core_.value_));
        append(out, encode_word(data_hash));
        append(out, encode_word(types::uint256{operation}));
        append(out, encode_word(tx.gas_.safe_tx_gas_));
        append(out, encode_word(tx.gas_.base_gas_));
        append(out, encode_word(tx.gas_.gas_price_));
        append(out, encode_word(tx.gas_.gas_token_));
        append(out, encode_word(tx.gas_.refund_receiver_));
        append(out, encode_word(types::uint256{tx.nonce_}));
        return out;
    }

    types::Bytes encode_domain(std::uint64_t chain_id, const types::Address& verifying_contract) {
        types::Bytes out;
        out.reserve(3 * constants::ABI_WORD_SIZE);
        append(out, encode_word(domain_typehash()));
        append(out, encode_word(types::uint256{chain_id}));
        append(out, encode_word(verifying_contract));
        return out;
    }
}  // namespace safe::eip712
