#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "fixtures.hpp"
#include "src/safe/eip712/hasher.hpp"
#include "src/safe/signer/local_signer.hpp"
#include "src/safe/signer/sign.hpp"
#include "src/safe/signer/signer_error.hpp"

using namespace safe;

namespace {
    // Refuses to sign, the way a locked hardware wallet would.
    class DecliningSigner : public signer::ISigner {
       public:
        [[nodiscard]] types::Address address() const override { return test_support::owner(); }
        types::Signature sign_digest(const types::Hash32&) override { throw std::runtime_error("user rejected the request"); }
    };
}  // namespace

TEST(LocalSignerTest, DerivesAddress) {
    const signer::LocalSigner s(test_support::OWNER_KEY);
    EXPECT_EQ(s.address().to_checksum(), test_support::OWNER_ADDRESS);

    const signer::LocalSigner prefixed(std::string("0x") + test_support::OWNER_KEY);
    EXPECT_EQ(prefixed.address(), s.address());
}

TEST(LocalSignerTest, RejectsBadKeys) {
    EXPECT_THROW(signer::LocalSigner("0x1234"), signer::SignerError);
    EXPECT_THROW(signer::LocalSigner("zz3a7cdd2270579847aaec11680312cbf4d3c36886232b413ab6529593228ec2"), signer::SignerError);
    EXPECT_THROW(signer::LocalSigner("0000000000000000000000000000000000000000000000000000000000000000"), signer::SignerError);
}

TEST(LocalSignerTest, GoldenSignature) {
    signer::LocalSigner s(test_support::OWNER_KEY);
    const types::Hash32 digest = types::Hash32::from_hex(test_support::GOLDEN_DIGEST);

    const types::Signature sig = s.sign_digest(digest);
    EXPECT_EQ(sig.to_hex(), test_support::GOLDEN_SIGNATURE);
    EXPECT_TRUE(sig.v_ == 27 || sig.v_ == 28);
}

TEST(LocalSignerTest, RecoverReturnsSigner) {
    signer::LocalSigner s(test_support::OWNER_KEY);
    const types::Hash32 digest = types::Hash32::from_hex(test_support::GOLDEN_DIGEST);

    EXPECT_EQ(signer::LocalSigner::recover(digest, s.sign_digest(digest)), s.address());

    types::Hash32 other = digest;
    other.bytes_[0] ^= 0x01;
    EXPECT_NE(signer::LocalSigner::recover(other, s.sign_digest(digest)), s.address());
}

TEST(SignTest, SignTransactionMatchesDigest) {
    signer::LocalSigner s(test_support::OWNER_KEY);
    const types::ProposeSignature ps =
        signer::sign_transaction(s, test_support::golden_tx(), test_support::safe_address(), test_support::GOERLI, std::string("cli"));

    EXPECT_EQ(ps.sender_, s.address());
    EXPECT_EQ(ps.signature_.to_hex(), test_support::GOLDEN_SIGNATURE);
    ASSERT_TRUE(ps.origin_.has_value());
    EXPECT_EQ(*ps.origin_, "cli");
}

TEST(SignTest, FailureSurfacesAsSignerError) {
    DecliningSigner s;
    try {
        (void)signer::sign_digest(s, types::Hash32::from_hex(test_support::GOLDEN_DIGEST));
        FAIL() << "expected SignerError";
    } catch (const signer::SignerError& e) {
        EXPECT_NE(std::string(e.what()).find("user rejected the request"), std::string::npos);
    }
}
