#include "hex_utils.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace hex_utils {
    namespace {
        constexpr const char* HEX_DIGITS = "0123456789abcdef";

        int nibble(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }
    }  // namespace

    std::string_view strip_prefix(std::string_view hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            hex.remove_prefix(2);
        }
        return hex;
    }

    std::string to_hex(std::span<const std::uint8_t> bytes, bool add_prefix) {
        std::string out;
        out.reserve(bytes.size() * 2 + 2);
        if (add_prefix) {
            out = "0x";
        }
        for (const std::uint8_t b : bytes) {
            out.push_back(HEX_DIGITS[b >> 4]);
            out.push_back(HEX_DIGITS[b & 0x0F]);
        }
        return out;
    }

    std::vector<std::uint8_t> from_hex(std::string_view hex) {
        hex = strip_prefix(hex);

        if (hex.size() % 2 != 0) {
            throw std::invalid_argument("Hex string has odd length: " + std::string(hex));
        }

        std::vector<std::uint8_t> out;
        out.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2) {
            const int hi = nibble(hex[i]);
            const int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("Invalid hex character in: " + std::string(hex));
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return out;
    }
}  // namespace hex_utils
