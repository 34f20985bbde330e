#ifndef SAFE_RELAY_NETWORKS_HPP
#define SAFE_RELAY_NETWORKS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace http::provider {
    // A transaction service deployment. `url_` ends in /api, resource paths start at /v1.
    struct TxService {
        std::string url_;
        std::uint64_t chain_id_ = 0;

        bool operator==(const TxService&) const = default;
    };

    const std::vector<TxService>& known_services();

    std::optional<TxService> by_chain_id(std::uint64_t chain_id);

    // Throws safe::proposer::PreconditionError (UNKNOWN_SERVICE).
    TxService require_chain_id(std::uint64_t chain_id);
}  // namespace http::provider

#endif
