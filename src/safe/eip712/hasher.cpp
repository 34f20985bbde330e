#include "hasher.hpp"

#include <algorithm>
#include <array>

#include "../../utils/constants.hpp"
#include "../crypto/keccak.hpp"
#include "encoder.hpp"

namespace safe::eip712 {
    types::Hash32 domain_separator(std::uint64_t chain_id, const types::Address& safe) {
        return types::Hash32{crypto::keccak256(encode_domain(chain_id, safe))};
    }

    types::Hash32 struct_hash(const types::SafeTransactionData& tx) { return types::Hash32{crypto::keccak256(encode_struct(tx))}; }

    types::Hash32 safe_tx_hash(const types::SafeTransactionData& tx, const types::Address& safe, std::uint64_t chain_id) {
        const types::Hash32 domain = domain_separator(chain_id, safe);
        const types::Hash32 message = struct_hash(tx);

        std::array<std::uint8_t, 2 + 2 * constants::HASH_SIZE> preimage{};
        preimage[0] = constants::EIP191_PREFIX;
        preimage[1] = constants::EIP712_VERSION;
        std::copy(domain.bytes_.begin(), domain.bytes_.end(), preimage.begin() + 2);
        std::copy(message.bytes_.begin(), message.bytes_.end(), preimage.begin() + 2 + constants::HASH_SIZE);

        return types::Hash32{crypto::keccak256(preimage)};
    }
}  // namespace safe::eip712
