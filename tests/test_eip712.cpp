#include <gtest/gtest.h>

#include <algorithm>
#include <span>

#include "fixtures.hpp"
#include "src/safe/crypto/keccak.hpp"
#include "src/safe/eip712/encoder.hpp"
#include "src/safe/eip712/hasher.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/hex_utils.hpp"

using namespace safe;

namespace {
    types::SafeTransactionData simple_tx() {
        types::SafeTransactionData tx;
        tx.core_.to_ = test_support::owner();
        return tx;
    }
}  // namespace

TEST(Eip712Test, TypeHashes) {
    EXPECT_EQ(eip712::safe_tx_typehash().to_hex(), "0xbb8310d486368db6bd6f849402fdd73ad53d316b5a4b2644ad6efe0f941286d8");
    EXPECT_EQ(eip712::domain_typehash().to_hex(), "0x47e79534a245952e8b16893a336b85a3d9ea9fa8c573f3d803afb92a79469218");
}

TEST(Eip712Test, WordEncoding) {
    const eip712::Word value = eip712::encode_word(types::uint256{0x1234});
    EXPECT_EQ(hex_utils::to_hex(value), "0x0000000000000000000000000000000000000000000000000000000000001234");

    const eip712::Word address = eip712::encode_word(test_support::owner());
    EXPECT_EQ(hex_utils::to_hex(address), "0x000000000000000000000000d5f586b9b2abbbb9a9fff936690a54f9849dbc97");
}

TEST(Eip712Test, StructLayout) {
    const types::Bytes encoded = eip712::encode_struct(test_support::golden_tx());
    ASSERT_EQ(encoded.size(), 11 * constants::ABI_WORD_SIZE);

    // data is committed to by its hash, operation sits in the fifth word.
    const auto data_hash = crypto::keccak256(std::span<const std::uint8_t>(*test_support::golden_tx().core_.data_));
    EXPECT_TRUE(std::equal(data_hash.begin(), data_hash.end(), encoded.begin() + 3 * constants::ABI_WORD_SIZE));
    EXPECT_EQ(encoded[5 * constants::ABI_WORD_SIZE - 1], 1);
    EXPECT_EQ(encoded[11 * constants::ABI_WORD_SIZE - 1], 7);
}

TEST(Eip712Test, DomainSeparator) {
    EXPECT_EQ(eip712::domain_separator(test_support::GOERLI, test_support::safe_address()).to_hex(),
              "0x647732b0b00d304899db2afe3fb46661547fd844fe5a32e337b32ebf4d141839");
    EXPECT_EQ(eip712::encode_domain(test_support::GOERLI, test_support::safe_address()).size(), 3 * constants::ABI_WORD_SIZE);
}

TEST(Eip712Test, GoldenDigest) {
    const types::SafeTransactionData tx = test_support::golden_tx();
    EXPECT_EQ(eip712::struct_hash(tx).to_hex(), "0xc70a679e5a44f66058c1d72b054081f4ab90e63fed6ab3396367761bf7efb61d");
    EXPECT_EQ(eip712::safe_tx_hash(tx, test_support::safe_address(), test_support::GOERLI).to_hex(), test_support::GOLDEN_DIGEST);
}

TEST(Eip712Test, Deterministic) {
    const types::SafeTransactionData tx = test_support::golden_tx();
    EXPECT_EQ(eip712::safe_tx_hash(tx, test_support::safe_address(), test_support::GOERLI),
              eip712::safe_tx_hash(tx, test_support::safe_address(), test_support::GOERLI));
}

TEST(Eip712Test, ChainIdChangesDigest) {
    const types::SafeTransactionData tx = test_support::golden_tx();
    const types::Hash32 mainnet = eip712::safe_tx_hash(tx, test_support::safe_address(), 1);
    EXPECT_EQ(mainnet.to_hex(), "0xebf4f44b92cb2851c34cdcaccf0db414f787c82bbf03b8e6f2b5747e4eda7e10");
    EXPECT_NE(mainnet, eip712::safe_tx_hash(tx, test_support::safe_address(), test_support::GOERLI));
}

TEST(Eip712Test, SafeAddressChangesDigest) {
    const types::SafeTransactionData tx = test_support::golden_tx();
    EXPECT_NE(eip712::safe_tx_hash(tx, test_support::safe_address(), test_support::GOERLI),
              eip712::safe_tx_hash(tx, test_support::owner(), test_support::GOERLI));
}

TEST(Eip712Test, EveryFieldIsCommitted) {
    const types::Hash32 base = eip712::safe_tx_hash(test_support::golden_tx(), test_support::safe_address(), test_support::GOERLI);

    auto nonce = test_support::golden_tx();
    nonce.nonce_ = 8;
    EXPECT_NE(eip712::safe_tx_hash(nonce, test_support::safe_address(), test_support::GOERLI), base);

    auto gas = test_support::golden_tx();
    gas.gas_.base_gas_ = types::uint256{1};
    EXPECT_NE(eip712::safe_tx_hash(gas, test_support::safe_address(), test_support::GOERLI), base);

    auto refund = test_support::golden_tx();
    refund.gas_.refund_receiver_ = test_support::owner();
    EXPECT_NE(eip712::safe_tx_hash(refund, test_support::safe_address(), test_support::GOERLI), base);
}

TEST(Eip712Test, SimpleCallDigest) {
    EXPECT_EQ(eip712::safe_tx_hash(simple_tx(), test_support::safe_address(), test_support::GOERLI).to_hex(),
              "0xe97a091494857c4ca3b38c50fdd72c758ae190f4678be4ddb9495b37d46566bd");
}

TEST(Eip712Test, UnsetOperationHashesAsCall) {
    types::SafeTransactionData explicit_call = simple_tx();
    explicit_call.core_.operation_ = types::Operation::CALL;
    EXPECT_EQ(eip712::safe_tx_hash(simple_tx(), test_support::safe_address(), test_support::GOERLI),
              eip712::safe_tx_hash(explicit_call, test_support::safe_address(), test_support::GOERLI));
}

TEST(Eip712Test, AbsentDataHashesAsEmpty) {
    types::SafeTransactionData empty_data = simple_tx();
    empty_data.core_.data_ = types::Bytes{};
    EXPECT_EQ(eip712::safe_tx_hash(simple_tx(), test_support::safe_address(), test_support::GOERLI),
              eip712::safe_tx_hash(empty_data, test_support::safe_address(), test_support::GOERLI));
}
