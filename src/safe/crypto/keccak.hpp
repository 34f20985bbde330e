#ifndef SAFE_RELAY_SAFE_CRYPTO_KECCAK_HPP
#define SAFE_RELAY_SAFE_CRYPTO_KECCAK_HPP

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace safe::crypto {
    using Digest = std::array<std::uint8_t, 32>;

    Digest keccak256(std::span<const std::uint8_t> data);

    Digest keccak256(std::string_view data);
}  // namespace safe::crypto

#endif
