#ifndef SAFE_RELAY_FILTERS_HPP
#define SAFE_RELAY_FILTERS_HPP

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <variant>

#include "../../safe/types/primitives.hpp"
#include "../../utils/string_utils.hpp"

namespace http::safe_api {
    using FilterValue = std::variant<std::uint64_t, safe::types::uint256, bool, safe::types::Address, safe::types::Hash32, std::string>;

    // Wire form of a filter value: decimal numbers, true/false, checksummed
    // addresses, lowercase hex hashes, strings verbatim.
    std::string render_filter_value(const FilterValue& value);

    // Closed set of typed filters, rendered to query pairs only at request build time.
    template <typename Key>
    class FilterSet {
       public:
        void set(Key key, FilterValue value) { entries_.insert_or_assign(key, std::move(value)); }

        void erase(std::initializer_list<Key> keys) {
            for (const Key k : keys) {
                entries_.erase(k);
            }
        }

        [[nodiscard]] bool contains(Key key) const { return entries_.find(key) != entries_.end(); }

        [[nodiscard]] std::size_t size() const { return entries_.size(); }

        template <typename NameFn>
        [[nodiscard]] string_utils::QueryPairs to_query(NameFn wire_key) const {
            string_utils::QueryPairs out;
            out.reserve(entries_.size());
            for (const auto& [key, value] : entries_) {
                out.emplace_back(wire_key(key), render_filter_value(value));
            }
            return out;
        }

       private:
        std::map<Key, FilterValue> entries_;
    };

    enum class MsigFilter : std::uint8_t {
        MIN_NONCE,
        MAX_NONCE,
        NONCE,
        MIN_VALUE,
        MAX_VALUE,
        VALUE,
        SAFE_TX_HASH,
        TO,
        EXECUTED,
        TRUSTED,
        TRANSACTION_HASH,
        ORDERING,
        LIMIT,
        OFFSET,
    };

    const char* wire_key(MsigFilter key);

    // Exact nonce/value filters clear the matching bounds and vice versa.
    class MsigHistoryFilters {
       public:
        MsigHistoryFilters& with_min_nonce(std::uint64_t nonce);
        MsigHistoryFilters& with_max_nonce(std::uint64_t nonce);
        MsigHistoryFilters& with_nonce(std::uint64_t nonce);
        // Inclusive bounds are sent as value__gt=v-1 and value__lt=v+1, clamped to
        // the uint256 range. with_min_value(0) therefore sends value__gt=0 and
        // excludes zero-value transactions.
        MsigHistoryFilters& with_min_value(const safe::types::uint256& value);
        MsigHistoryFilters& with_max_value(const safe::types::uint256& value);
        MsigHistoryFilters& with_value(const safe::types::uint256& value);
        MsigHistoryFilters& with_safe_tx_hash(const safe::types::Hash32& hash);
        MsigHistoryFilters& with_to(const safe::types::Address& to);
        MsigHistoryFilters& with_executed(bool executed);
        MsigHistoryFilters& with_trusted(bool trusted);
        MsigHistoryFilters& with_transaction_hash(const safe::types::Hash32& hash);
        MsigHistoryFilters& with_ordering(std::string ordering);
        MsigHistoryFilters& with_limit(std::uint64_t limit);
        MsigHistoryFilters& with_offset(std::uint64_t offset);

        [[nodiscard]] const FilterSet<MsigFilter>& entries() const { return filters_; }
        [[nodiscard]] string_utils::QueryPairs to_query() const;

       private:
        FilterSet<MsigFilter> filters_;
    };

    enum class TokenFilter : std::uint8_t {
        NAME,
        ADDRESS,
        SYMBOL,
        MIN_DECIMALS,
        MAX_DECIMALS,
        DECIMALS,
        LIMIT,
        OFFSET,
    };

    const char* wire_key(TokenFilter key);

    class TokenInfoFilters {
       public:
        TokenInfoFilters& with_name(std::string name);
        TokenInfoFilters& with_address(const safe::types::Address& address);
        TokenInfoFilters& with_symbol(std::string symbol);
        TokenInfoFilters& with_min_decimals(std::uint64_t decimals);
        TokenInfoFilters& with_max_decimals(std::uint64_t decimals);
        TokenInfoFilters& with_decimals(std::uint64_t decimals);
        TokenInfoFilters& with_limit(std::uint64_t limit);
        TokenInfoFilters& with_offset(std::uint64_t offset);

        [[nodiscard]] const FilterSet<TokenFilter>& entries() const { return filters_; }
        [[nodiscard]] string_utils::QueryPairs to_query() const;

       private:
        FilterSet<TokenFilter> filters_;
    };
}  // namespace http::safe_api

#endif
