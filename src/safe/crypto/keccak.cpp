#include "keccak.hpp"

#include <ethash/keccak.hpp>

#include <algorithm>
#include <vector>

namespace safe::crypto {
    Digest keccak256(std::span<const std::uint8_t> data) {
        const ethash::hash256 h = ethash::keccak256(data.data(), data.size());

        Digest out{};
        std::copy_n(h.bytes, out.size(), out.begin());
        return out;
    }

    Digest keccak256(std::string_view data) {
        const std::vector<std::uint8_t> bytes(data.begin(), data.end());
        return keccak256(std::span<const std::uint8_t>(bytes));
    }
}  // namespace safe::crypto
