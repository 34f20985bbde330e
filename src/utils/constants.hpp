
#ifndef SAFE_RELAY_CONSTANTS_HPP
#define SAFE_RELAY_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr std::size_t ADDRESS_SIZE = 20;
    inline constexpr std::size_t HASH_SIZE = 32;
    inline constexpr std::size_t ABI_WORD_SIZE = 32;
    inline constexpr std::size_t SIGNATURE_SIZE = 65;
    inline constexpr std::uint8_t ECDSA_V_OFFSET = 27;
    inline constexpr std::uint8_t EIP191_PREFIX = 0x19;
    inline constexpr std::uint8_t EIP712_VERSION = 0x01;
    inline constexpr long HTTP_CLIENT_ERROR = 400;
    inline constexpr long HTTP_UNPROCESSABLE_ENTITY = 422;
    inline constexpr long DEFAULT_TIMEOUT_MS = 30'000L;
    inline constexpr std::uint64_t DEFAULT_CHAIN_ID = 1;
    inline constexpr const char* LOGGER_NAME = "safe_relay";
    inline constexpr const char* OP_CALL = "call";
    inline constexpr const char* OP_DELEGATE_CALL = "delegatecall";

}  // namespace constants

#endif
