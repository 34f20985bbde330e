#include "env_config.hpp"

#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "../utils/logging.hpp"
#include "../utils/string_utils.hpp"

namespace config {
    namespace {
        std::optional<std::string> read(const EnvLookup& lookup, const char* key) {
            const char* raw = lookup(key);
            if (raw == nullptr) {
                return std::nullopt;
            }
            std::string value = string_utils::trim(raw);
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }

        template <typename Int>
        Int parse_positive(const std::string& raw, const char* key) {
            Int out{};
            const char* end = raw.data() + raw.size();
            const auto [ptr, ec] = std::from_chars(raw.data(), end, out, constants::BASE_10);
            if (ec != std::errc{} || ptr != end || out <= 0) {
                throw std::runtime_error(std::string(key) + " must be a positive decimal integer, got \"" + raw + "\"");
            }
            return out;
        }
    }  // namespace

    http::provider::TxService ClientConfig::service() const {
        if (service_url_) {
            return http::provider::TxService{.url_ = *service_url_, .chain_id_ = chain_id_};
        }
        return http::provider::require_chain_id(chain_id_);
    }

    const safe::types::Address& ClientConfig::require_safe_address() const {
        if (!safe_address_) {
            throw std::runtime_error(std::string(EnvKeys::SAFE_ADDRESS) + " is not set");
        }
        return *safe_address_;
    }

    ClientConfig load(const EnvLookup& lookup) {
        ClientConfig cfg;

        if (auto raw = read(lookup, EnvKeys::CHAIN_ID)) {
            cfg.chain_id_ = parse_positive<std::uint64_t>(*raw, EnvKeys::CHAIN_ID);
        }

        cfg.service_url_ = read(lookup, EnvKeys::SERVICE_URL);

        if (auto raw = read(lookup, EnvKeys::SAFE_ADDRESS)) {
            try {
                cfg.safe_address_ = safe::types::Address::from_hex(*raw);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error(std::string(EnvKeys::SAFE_ADDRESS) + ": " + e.what());
            }
        }

        cfg.private_key_ = read(lookup, EnvKeys::PRIVATE_KEY);

        if (auto raw = read(lookup, EnvKeys::LOG_LEVEL)) {
            try {
                logging::parse_level(*raw);
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(std::string(EnvKeys::LOG_LEVEL) + ": " + e.what());
            }
            cfg.log_level_ = *raw;
        }

        if (auto raw = read(lookup, EnvKeys::TIMEOUT_MS)) {
            cfg.timeout_ms_ = parse_positive<long>(*raw, EnvKeys::TIMEOUT_MS);
        }

        return cfg;
    }

    ClientConfig load_from_env() {
        return load([](const char* key) { return std::getenv(key); });
    }
}  // namespace config
