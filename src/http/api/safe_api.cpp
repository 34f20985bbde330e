#include "safe_api.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace http::safe_api {
    namespace {
        void warn_unexpected(const http::model::Request& req, const http::model::Response& resp) {
            if (req.method_ == http::model::METHOD_POST) {
                logging::get()->warn("Unexpected response from server: method={} url={} params={} status={} response={}", req.method_, req.url_,
                                     req.body_, resp.status_, resp.body_);
            } else {
                logging::get()->warn("Unexpected response from server: method={} url={} status={} response={}", req.method_, req.url_, resp.status_,
                                     resp.body_);
            }
        }

        http::model::Response dispatch(http::client::IHttpClient& client, const http::model::Request& req) {
            logging::get()->debug("Dispatching api request {} {}", req.method_, req.url_);

            http::model::Response resp = req.method_ == http::model::METHOD_POST ? client.post(req) : client.get(req);
            if (resp.effective_url_.empty()) {
                resp.effective_url_ = req.url_;
            }

            if (resp.status_ >= constants::HTTP_CLIENT_ERROR && resp.status_ != constants::HTTP_UNPROCESSABLE_ENTITY) {
                throw http::http_error::HttpError(resp.status_, resp.effective_url_, string_utils::preview(resp.body_, http::http_error::ERROR_MESSAGE_LENGTH),
                                                  "Server error status " + std::to_string(resp.status_) + " for " + req.method_ + " " + req.url_);
            }

            if (auto api_error = http::provider::SafeTxServiceProvider::parse_error_envelope(resp)) {
                warn_unexpected(req, resp);
                throw std::move(*api_error);
            }

            if (resp.status_ == constants::HTTP_UNPROCESSABLE_ENTITY) {
                warn_unexpected(req, resp);
                throw http::http_error::DecodeError(resp.effective_url_, resp.body_, "Status 422 without an error envelope");
            }

            return resp;
        }

        template <typename Parse>
        auto fetch(http::client::IHttpClient& client, const http::model::Request& req, Parse parse) {
            const http::model::Response resp = dispatch(client, req);
            try {
                return parse(resp);
            } catch (const http::http_error::DecodeError&) {
                warn_unexpected(req, resp);
                throw;
            }
        }
    }  // namespace

    SafeAPI::SafeAPI(http::provider::TxService service, std::shared_ptr<http::client::IHttpClient> http)
        : service_(std::move(service)), provider_(service_.url_), http_(std::move(http)) {}

    safe::types::SafeInfoResponse SafeAPI::safe_info(const safe::types::Address& safe) {
        return fetch(*http_, provider_.build_safe_info(safe), &http::provider::SafeTxServiceProvider::parse_safe_info);
    }

    safe::types::MsigHistoryResponse SafeAPI::msig_history(const safe::types::Address& safe) { return filtered_msig_history(safe, MsigHistoryFilters{}); }

    safe::types::MsigHistoryResponse SafeAPI::filtered_msig_history(const safe::types::Address& safe, const MsigHistoryFilters& filters) {
        return fetch(*http_, provider_.build_msig_history(safe, filters.to_query()), &http::provider::SafeTxServiceProvider::parse_msig_history);
    }

    PagedStream<safe::types::MsigTxResponse> SafeAPI::msig_history_stream(const safe::types::Address& safe, const MsigHistoryFilters& filters) {
        logging::get()->debug("Streaming msig history for {}", safe.to_checksum());
        return PagedStream<safe::types::MsigTxResponse>(
            provider_.build_msig_history(safe, filters.to_query()),
            [client = http_](const http::model::Request& req) { return fetch(*client, req, &http::provider::SafeTxServiceProvider::parse_msig_history); },
            &http::provider::SafeTxServiceProvider::build_page);
    }

    std::uint64_t SafeAPI::next_nonce(const safe::types::Address& safe) {
        auto stream = msig_history_stream(safe);

        bool any = false;
        std::uint64_t highest = 0;
        while (auto tx = stream.next()) {
            highest = any ? std::max(highest, tx->nonce_) : tx->nonce_;
            any = true;
        }

        return any ? highest + 1 : 0;
    }

    safe::types::MsigTxResponse SafeAPI::transaction_info(const safe::types::Hash32& safe_tx_hash) {
        return fetch(*http_, provider_.build_transaction_info(safe_tx_hash), &http::provider::SafeTxServiceProvider::parse_msig_tx);
    }

    safe::types::uint256 SafeAPI::estimate_gas(const safe::types::Address& safe, const safe::types::MetaTransactionData& tx) {
        return fetch(*http_, provider_.build_estimate(safe, tx), &http::provider::SafeTxServiceProvider::parse_estimate);
    }

    safe::types::TokenInfoResponse SafeAPI::tokens(const TokenInfoFilters& filters) {
        return fetch(*http_, provider_.build_tokens(filters.to_query()), &http::provider::SafeTxServiceProvider::parse_tokens);
    }

    PagedStream<safe::types::TokenInfo> SafeAPI::tokens_stream(const TokenInfoFilters& filters) {
        return PagedStream<safe::types::TokenInfo>(
            provider_.build_tokens(filters.to_query()),
            [client = http_](const http::model::Request& req) { return fetch(*client, req, &http::provider::SafeTxServiceProvider::parse_tokens); },
            &http::provider::SafeTxServiceProvider::build_page);
    }

    void SafeAPI::post_proposal(const safe::types::Address& safe, const safe::types::ProposeRequest& proposal) {
        dispatch(*http_, provider_.build_propose(safe, proposal));
    }
}  // namespace http::safe_api
