#ifndef SAFE_RELAY_SAFE_TX_SERVICE_HPP
#define SAFE_RELAY_SAFE_TX_SERVICE_HPP

#include <optional>
#include <string>

#include "../../safe/types/primitives.hpp"
#include "../../safe/types/responses.hpp"
#include "../../safe/types/transaction.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::provider {
    // Request construction and response decoding for the Safe transaction
    // service REST API. Holds no connection state.
    class SafeTxServiceProvider {
       public:
        explicit SafeTxServiceProvider(std::string base_url);

        [[nodiscard]] http::model::Request build_safe_info(const safe::types::Address& safe) const;
        [[nodiscard]] http::model::Request build_msig_history(const safe::types::Address& safe, const string_utils::QueryPairs& query) const;
        [[nodiscard]] http::model::Request build_transaction_info(const safe::types::Hash32& safe_tx_hash) const;
        [[nodiscard]] http::model::Request build_estimate(const safe::types::Address& safe, const safe::types::MetaTransactionData& tx) const;
        [[nodiscard]] http::model::Request build_propose(const safe::types::Address& safe, const safe::types::ProposeRequest& proposal) const;
        [[nodiscard]] http::model::Request build_tokens(const string_utils::QueryPairs& query) const;

        // Request for a continuation link exactly as the service returned it.
        [[nodiscard]] static http::model::Request build_page(const std::string& next_url);

        static safe::types::SafeInfoResponse parse_safe_info(const http::model::Response& resp);
        static safe::types::MsigHistoryResponse parse_msig_history(const http::model::Response& resp);
        static safe::types::MsigTxResponse parse_msig_tx(const http::model::Response& resp);
        static safe::types::uint256 parse_estimate(const http::model::Response& resp);
        static safe::types::TokenInfoResponse parse_tokens(const http::model::Response& resp);

        // The service's {code, message, arguments} envelope, if the body is one.
        static std::optional<http::http_error::ApiError> parse_error_envelope(const http::model::Response& resp);

        static std::string write_propose_body(const safe::types::ProposeRequest& proposal);
        static std::string write_estimate_body(const safe::types::MetaTransactionData& tx);

       private:
        std::string base_url_;
    };
}  // namespace http::provider

#endif
