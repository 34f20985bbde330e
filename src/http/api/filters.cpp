#include "filters.hpp"

#include <limits>
#include <type_traits>

namespace http::safe_api {
    namespace {
        safe::types::uint256 saturating_decrement(const safe::types::uint256& v) { return v == 0 ? v : v - 1; }

        safe::types::uint256 saturating_increment(const safe::types::uint256& v) {
            return v == std::numeric_limits<safe::types::uint256>::max() ? v : v + 1;
        }

        std::uint64_t saturating_decrement(std::uint64_t v) { return v == 0 ? v : v - 1; }

        std::uint64_t saturating_increment(std::uint64_t v) { return v == std::numeric_limits<std::uint64_t>::max() ? v : v + 1; }
    }  // namespace

    std::string render_filter_value(const FilterValue& value) {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::uint64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, safe::types::uint256>) {
                    return safe::types::to_decimal(v);
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, safe::types::Address>) {
                    return v.to_checksum();
                } else if constexpr (std::is_same_v<T, safe::types::Hash32>) {
                    return v.to_hex();
                } else {
                    return v;
                }
            },
            value);
    }

    const char* wire_key(MsigFilter key) {
        switch (key) {
            case MsigFilter::MIN_NONCE:
                return "nonce__gte";
            case MsigFilter::MAX_NONCE:
                return "nonce__lte";
            case MsigFilter::NONCE:
                return "nonce";
            case MsigFilter::MIN_VALUE:
                return "value__gt";
            case MsigFilter::MAX_VALUE:
                return "value__lt";
            case MsigFilter::VALUE:
                return "value";
            case MsigFilter::SAFE_TX_HASH:
                return "safe_tx_hash";
            case MsigFilter::TO:
                return "to";
            case MsigFilter::EXECUTED:
                return "executed";
            case MsigFilter::TRUSTED:
                return "trusted";
            case MsigFilter::TRANSACTION_HASH:
                return "transaction_hash";
            case MsigFilter::ORDERING:
                return "ordering";
            case MsigFilter::LIMIT:
                return "limit";
            case MsigFilter::OFFSET:
                return "offset";
        }
        return "";
    }

    MsigHistoryFilters& MsigHistoryFilters::with_min_nonce(std::uint64_t nonce) {
        filters_.erase({MsigFilter::NONCE});
        filters_.set(MsigFilter::MIN_NONCE, nonce);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_max_nonce(std::uint64_t nonce) {
        filters_.erase({MsigFilter::NONCE});
        filters_.set(MsigFilter::MAX_NONCE, nonce);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_nonce(std::uint64_t nonce) {
        filters_.erase({MsigFilter::MIN_NONCE, MsigFilter::MAX_NONCE});
        filters_.set(MsigFilter::NONCE, nonce);
        return *this;
    }

    // The service only offers strict bounds on value.
    MsigHistoryFilters& MsigHistoryFilters::with_min_value(const safe::types::uint256& value) {
        filters_.erase({MsigFilter::VALUE});
        filters_.set(MsigFilter::MIN_VALUE, saturating_decrement(value));
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_max_value(const safe::types::uint256& value) {
        filters_.erase({MsigFilter::VALUE});
        filters_.set(MsigFilter::MAX_VALUE, saturating_increment(value));
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_value(const safe::types::uint256& value) {
        filters_.erase({MsigFilter::MIN_VALUE, MsigFilter::MAX_VALUE});
        filters_.set(MsigFilter::VALUE, value);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_safe_tx_hash(const safe::types::Hash32& hash) {
        filters_.set(MsigFilter::SAFE_TX_HASH, hash);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_to(const safe::types::Address& to) {
        filters_.set(MsigFilter::TO, to);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_executed(bool executed) {
        filters_.set(MsigFilter::EXECUTED, executed);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_trusted(bool trusted) {
        filters_.set(MsigFilter::TRUSTED, trusted);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_transaction_hash(const safe::types::Hash32& hash) {
        filters_.set(MsigFilter::TRANSACTION_HASH, hash);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_ordering(std::string ordering) {
        filters_.set(MsigFilter::ORDERING, std::move(ordering));
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_limit(std::uint64_t limit) {
        filters_.set(MsigFilter::LIMIT, limit);
        return *this;
    }

    MsigHistoryFilters& MsigHistoryFilters::with_offset(std::uint64_t offset) {
        filters_.set(MsigFilter::OFFSET, offset);
        return *this;
    }

    string_utils::QueryPairs MsigHistoryFilters::to_query() const {
        return filters_.to_query([](MsigFilter k) { return std::string(wire_key(k)); });
    }

    const char* wire_key(TokenFilter key) {
        switch (key) {
            case TokenFilter::NAME:
                return "name";
            case TokenFilter::ADDRESS:
                return "address";
            case TokenFilter::SYMBOL:
                return "symbol";
            case TokenFilter::MIN_DECIMALS:
                return "decimals__gt";
            case TokenFilter::MAX_DECIMALS:
                return "decimals__lt";
            case TokenFilter::DECIMALS:
                return "decimals";
            case TokenFilter::LIMIT:
                return "limit";
            case TokenFilter::OFFSET:
                return "offset";
        }
        return "";
    }

    TokenInfoFilters& TokenInfoFilters::with_name(std::string name) {
        filters_.set(TokenFilter::NAME, std::move(name));
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_address(const safe::types::Address& address) {
        filters_.set(TokenFilter::ADDRESS, address);
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_symbol(std::string symbol) {
        filters_.set(TokenFilter::SYMBOL, std::move(symbol));
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_min_decimals(std::uint64_t decimals) {
        filters_.erase({TokenFilter::DECIMALS});
        filters_.set(TokenFilter::MIN_DECIMALS, saturating_decrement(decimals));
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_max_decimals(std::uint64_t decimals) {
        filters_.erase({TokenFilter::DECIMALS});
        filters_.set(TokenFilter::MAX_DECIMALS, saturating_increment(decimals));
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_decimals(std::uint64_t decimals) {
        filters_.erase({TokenFilter::MIN_DECIMALS, TokenFilter::MAX_DECIMALS});
        filters_.set(TokenFilter::DECIMALS, decimals);
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_limit(std::uint64_t limit) {
        filters_.set(TokenFilter::LIMIT, limit);
        return *this;
    }

    TokenInfoFilters& TokenInfoFilters::with_offset(std::uint64_t offset) {
        filters_.set(TokenFilter::OFFSET, offset);
        return *this;
    }

    string_utils::QueryPairs TokenInfoFilters::to_query() const {
        return filters_.to_query([](TokenFilter k) { return std::string(wire_key(k)); });
    }
}  // namespace http::safe_api
