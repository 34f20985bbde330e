#include "networks.hpp"

#include <algorithm>

#include "../../safe/proposer/precondition_error.hpp"

namespace http::provider {
    struct ChainIds {
        static constexpr std::uint64_t ETHEREUM = 1;
        static constexpr std::uint64_t OPTIMISM = 10;
        static constexpr std::uint64_t GOERLI = 5;
        static constexpr std::uint64_t BSC = 56;
        static constexpr std::uint64_t GNOSIS_CHAIN = 100;
        static constexpr std::uint64_t POLYGON = 137;
        static constexpr std::uint64_t EWC = 246;
        static constexpr std::uint64_t ARBITRUM = 42161;
        static constexpr std::uint64_t AVALANCHE = 43114;
        static constexpr std::uint64_t VOLTA = 73799;
        static constexpr std::uint64_t AURORA = 1313161554;
    };

    const std::vector<TxService>& known_services() {
        static const std::vector<TxService> services = {
            {"https://safe-transaction-mainnet.safe.global/api", ChainIds::ETHEREUM},
            {"https://safe-transaction.xdai.gnosis.io/api", ChainIds::GNOSIS_CHAIN},
            {"https://safe-transaction.arbitrum.gnosis.io/api", ChainIds::ARBITRUM},
            {"https://safe-transaction.avalanche.gnosis.io/api", ChainIds::AVALANCHE},
            {"https://safe-transaction-aurora.safe.global/api", ChainIds::AURORA},
            {"https://safe-transaction-bsc.safe.global/api", ChainIds::BSC},
            {"https://safe-transaction-optimism.safe.global/api", ChainIds::OPTIMISM},
            {"https://safe-transaction-polygon.safe.global/api", ChainIds::POLYGON},
            {"https://safe-transaction-goerli.safe.global/api", ChainIds::GOERLI},
            {"https://safe-transaction-ewc.safe.global/api", ChainIds::EWC},
            {"https://safe-transaction-volta.safe.global/api", ChainIds::VOLTA},
        };
        return services;
    }

    std::optional<TxService> by_chain_id(std::uint64_t chain_id) {
        const auto& services = known_services();
        const auto it = std::find_if(services.begin(), services.end(), [chain_id](const TxService& s) { return s.chain_id_ == chain_id; });
        if (it == services.end()) {
            return std::nullopt;
        }
        return *it;
    }

    TxService require_chain_id(std::uint64_t chain_id) {
        auto service = by_chain_id(chain_id);
        if (!service) {
            throw safe::proposer::PreconditionError(safe::proposer::PreconditionError::Reason::UNKNOWN_SERVICE,
                                                    "No known service URL for chain id " + std::to_string(chain_id));
        }
        return *service;
    }
}  // namespace http::provider
