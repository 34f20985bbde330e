#include "primitives.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include "../../utils/hex_utils.hpp"
#include "../crypto/keccak.hpp"

namespace safe::types {
    Address Address::from_hex(std::string_view hex) {
        const std::string_view digits = hex_utils::strip_prefix(hex);
        if (digits.size() != constants::ADDRESS_SIZE * 2) {
            throw std::invalid_argument("Invalid address: " + std::string(hex));
        }

        Address a;
        a.bytes_ = hex_utils::from_hex_fixed<constants::ADDRESS_SIZE>(digits);
        return a;
    }

    std::string Address::to_hex() const { return hex_utils::to_hex(bytes_); }

    std::string Address::to_checksum() const {
        std::string lower = hex_utils::to_hex(bytes_, false);
        const crypto::Digest hash = crypto::keccak256(std::string_view(lower));

        for (size_t i = 0; i < lower.size(); ++i) {
            const std::uint8_t byte = hash[i / 2];
            const std::uint8_t nibble = (i % 2 == 0) ? (byte >> 4) : (byte & 0x0F);
            if (nibble >= 8 && std::isalpha(static_cast<unsigned char>(lower[i])) != 0) {
                lower[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(lower[i])));
            }
        }
        return "0x" + lower;
    }

    bool Address::is_zero() const {
        for (const std::uint8_t b : bytes_) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    Hash32 Hash32::from_hex(std::string_view hex) {
        Hash32 h;
        h.bytes_ = hex_utils::from_hex_fixed<constants::HASH_SIZE>(hex);
        return h;
    }

    std::string Hash32::to_hex() const { return hex_utils::to_hex(bytes_); }

    Signature Signature::from_hex(std::string_view hex) {
        const auto raw = hex_utils::from_hex_fixed<constants::SIGNATURE_SIZE>(hex);

        Signature sig;
        std::copy_n(raw.begin(), constants::HASH_SIZE, sig.r_.bytes_.begin());
        std::copy_n(raw.begin() + constants::HASH_SIZE, constants::HASH_SIZE, sig.s_.bytes_.begin());
        sig.v_ = raw[constants::SIGNATURE_SIZE - 1];
        return sig;
    }

    std::array<std::uint8_t, constants::SIGNATURE_SIZE> Signature::to_bytes() const {
        std::array<std::uint8_t, constants::SIGNATURE_SIZE> out{};
        std::copy(r_.bytes_.begin(), r_.bytes_.end(), out.begin());
        std::copy(s_.bytes_.begin(), s_.bytes_.end(), out.begin() + constants::HASH_SIZE);
        out[constants::SIGNATURE_SIZE - 1] = v_;
        return out;
    }

    std::string Signature::to_hex() const { return hex_utils::to_hex(to_bytes()); }

    uint256 parse_u256(std::string_view text) {
        if (text.empty()) {
            throw std::invalid_argument("Empty integer literal");
        }
        if (hex_utils::strip_prefix(text).empty()) {
            throw std::invalid_argument("Empty hex integer literal: " + std::string(text));
        }
        return intx::from_string<uint256>(std::string(text));
    }

    std::string to_decimal(const uint256& value) { return intx::to_string(value, constants::BASE_10); }
}  // namespace safe::types
