#include <gtest/gtest.h>

#include <set>

#include "src/http/provider/networks.hpp"
#include "src/safe/proposer/precondition_error.hpp"

using namespace http::provider;

TEST(NetworksTest, KnownChains) {
    const auto mainnet = by_chain_id(1);
    ASSERT_TRUE(mainnet.has_value());
    EXPECT_EQ(mainnet->url_, "https://safe-transaction-mainnet.safe.global/api");

    const auto arbitrum = by_chain_id(42161);
    ASSERT_TRUE(arbitrum.has_value());
    EXPECT_EQ(arbitrum->chain_id_, 42161U);

    EXPECT_TRUE(by_chain_id(5).has_value());
    EXPECT_TRUE(by_chain_id(137).has_value());
}

TEST(NetworksTest, UnknownChain) {
    EXPECT_FALSE(by_chain_id(424242).has_value());
    try {
        (void)require_chain_id(424242);
        FAIL() << "expected PreconditionError";
    } catch (const safe::proposer::PreconditionError& e) {
        EXPECT_EQ(e.reason_, safe::proposer::PreconditionError::Reason::UNKNOWN_SERVICE);
    }
}

TEST(NetworksTest, ChainIdsAreUnique) {
    std::set<std::uint64_t> seen;
    for (const TxService& s : known_services()) {
        EXPECT_TRUE(seen.insert(s.chain_id_).second) << s.chain_id_;
        EXPECT_EQ(s.url_.substr(s.url_.size() - 4), "/api") << s.url_;
    }
    EXPECT_EQ(seen.size(), 11U);
}
