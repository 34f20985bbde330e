#ifndef SAFE_RELAY_ENV_CONFIG_HPP
#define SAFE_RELAY_ENV_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "../http/provider/networks.hpp"
#include "../safe/types/primitives.hpp"
#include "../utils/constants.hpp"

namespace config {
    struct EnvKeys {
        static constexpr const char* CHAIN_ID = "SAFE_RELAY_CHAIN_ID";
        static constexpr const char* SERVICE_URL = "SAFE_RELAY_SERVICE_URL";
        static constexpr const char* SAFE_ADDRESS = "SAFE_RELAY_SAFE_ADDRESS";
        static constexpr const char* PRIVATE_KEY = "SAFE_RELAY_PRIVATE_KEY";
        static constexpr const char* LOG_LEVEL = "SAFE_RELAY_LOG_LEVEL";
        static constexpr const char* TIMEOUT_MS = "SAFE_RELAY_TIMEOUT_MS";
    };

    struct ClientConfig {
        std::uint64_t chain_id_ = constants::DEFAULT_CHAIN_ID;
        std::optional<std::string> service_url_;
        std::optional<safe::types::Address> safe_address_;
        std::optional<std::string> private_key_;
        std::string log_level_ = "info";
        long timeout_ms_ = constants::DEFAULT_TIMEOUT_MS;

        // The explicit service URL if set, otherwise the registry entry for chain_id_.
        [[nodiscard]] http::provider::TxService service() const;

        // Throws std::runtime_error when no safe address is configured.
        [[nodiscard]] const safe::types::Address& require_safe_address() const;
    };

    // Returns nullptr for unset variables, like std::getenv.
    using EnvLookup = std::function<const char*(const char*)>;

    // Throws std::runtime_error naming the offending variable.
    ClientConfig load(const EnvLookup& lookup);

    ClientConfig load_from_env();
}  // namespace config

#endif
