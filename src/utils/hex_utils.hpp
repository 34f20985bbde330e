#ifndef SAFE_RELAY_HEX_UTILS_HPP
#define SAFE_RELAY_HEX_UTILS_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hex_utils {
    std::string_view strip_prefix(std::string_view hex);

    std::string to_hex(std::span<const std::uint8_t> bytes, bool add_prefix = true);

    // Throws std::invalid_argument on odd length or non-hex characters.
    std::vector<std::uint8_t> from_hex(std::string_view hex);

    template <std::size_t N>
    std::array<std::uint8_t, N> from_hex_fixed(std::string_view hex) {
        const auto bytes = from_hex(hex);
        if (bytes.size() != N) {
            throw std::invalid_argument("Expected " + std::to_string(N) + " bytes of hex, got " + std::to_string(bytes.size()));
        }

        std::array<std::uint8_t, N> out{};
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }
}  // namespace hex_utils

#endif
