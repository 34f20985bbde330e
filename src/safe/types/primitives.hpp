#ifndef SAFE_RELAY_SAFE_TYPES_PRIMITIVES_HPP
#define SAFE_RELAY_SAFE_TYPES_PRIMITIVES_HPP

#include <intx/intx.hpp>

#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/constants.hpp"

namespace safe::types {
    using uint256 = intx::uint256;
    using Bytes = std::vector<std::uint8_t>;

    struct Address {
        std::array<std::uint8_t, constants::ADDRESS_SIZE> bytes_{};

        // Accepts 0x-prefixed or bare 40 hex digits in any case.
        static Address from_hex(std::string_view hex);

        // EIP-55 mixed-case form, the only form put on the wire.
        [[nodiscard]] std::string to_checksum() const;
        [[nodiscard]] std::string to_hex() const;
        [[nodiscard]] bool is_zero() const;

        auto operator<=>(const Address&) const = default;
    };

    struct Hash32 {
        std::array<std::uint8_t, constants::HASH_SIZE> bytes_{};

        static Hash32 from_hex(std::string_view hex);

        [[nodiscard]] std::string to_hex() const;

        auto operator<=>(const Hash32&) const = default;
    };

    // Recoverable ECDSA signature, r || s || v on the wire.
    struct Signature {
        Hash32 r_;
        Hash32 s_;
        std::uint8_t v_ = 0;

        static Signature from_hex(std::string_view hex);

        [[nodiscard]] std::array<std::uint8_t, constants::SIGNATURE_SIZE> to_bytes() const;
        [[nodiscard]] std::string to_hex() const;

        auto operator<=>(const Signature&) const = default;
    };

    // Decimal, or 0x-prefixed hex. Throws std::invalid_argument / std::out_of_range.
    uint256 parse_u256(std::string_view text);

    std::string to_decimal(const uint256& value);
}  // namespace safe::types

#endif
