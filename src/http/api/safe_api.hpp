#ifndef SAFE_RELAY_SAFE_API_HPP
#define SAFE_RELAY_SAFE_API_HPP

#include <cstdint>
#include <memory>

#include "../../safe/types/primitives.hpp"
#include "../../safe/types/responses.hpp"
#include "../../safe/types/transaction.hpp"
#include "../client/interface.hpp"
#include "../model/model.hpp"
#include "../provider/networks.hpp"
#include "../provider/safe_tx_service.hpp"
#include "filters.hpp"
#include "paged_stream.hpp"

namespace http::safe_api {
    // Read and write endpoints of one transaction service deployment. Every
    // call fails fast with an http_error::ClientError and nothing is retried.
    // Streams share the transport, not the SafeAPI, and stay usable after it is gone.
    class SafeAPI {
       public:
        explicit SafeAPI(http::provider::TxService service, std::shared_ptr<http::client::IHttpClient> http);

        [[nodiscard]] const http::provider::TxService& service() const { return service_; }

        safe::types::SafeInfoResponse safe_info(const safe::types::Address& safe);

        safe::types::MsigHistoryResponse msig_history(const safe::types::Address& safe);
        safe::types::MsigHistoryResponse filtered_msig_history(const safe::types::Address& safe, const MsigHistoryFilters& filters);
        PagedStream<safe::types::MsigTxResponse> msig_history_stream(const safe::types::Address& safe, const MsigHistoryFilters& filters = {});

        // Highest nonce across the full history plus one, or zero for an empty history.
        std::uint64_t next_nonce(const safe::types::Address& safe);

        safe::types::MsigTxResponse transaction_info(const safe::types::Hash32& safe_tx_hash);

        safe::types::uint256 estimate_gas(const safe::types::Address& safe, const safe::types::MetaTransactionData& tx);

        safe::types::TokenInfoResponse tokens(const TokenInfoFilters& filters = {});
        PagedStream<safe::types::TokenInfo> tokens_stream(const TokenInfoFilters& filters = {});

        // Success carries no body.
        void post_proposal(const safe::types::Address& safe, const safe::types::ProposeRequest& proposal);

       private:
        http::provider::TxService service_;
        http::provider::SafeTxServiceProvider provider_;
        std::shared_ptr<http::client::IHttpClient> http_;
    };
}  // namespace http::safe_api

#endif
