#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

#include "fake_http_client.hpp"
#include "fixtures.hpp"
#include "src/http/api/safe_api.hpp"
#include "src/http/error/http_error.hpp"
#include "src/safe/eip712/hasher.hpp"
#include "src/safe/signer/local_signer.hpp"
#include "src/safe/signer/sign.hpp"

using namespace http::safe_api;

namespace {
    const std::string BASE = "https://tx.example/api";

    std::string safe_url(const std::string& suffix) { return BASE + "/v1/safes/" + test_support::SAFE_ADDRESS + suffix; }

    class SafeApiTest : public ::testing::Test {
       protected:
        void SetUp() override {
            http_ = std::make_shared<test_support::FakeHttpClient>();
            api_ = std::make_unique<SafeAPI>(http::provider::TxService{.url_ = BASE + "/", .chain_id_ = test_support::GOERLI}, http_);
        }

        std::shared_ptr<test_support::FakeHttpClient> http_;
        std::unique_ptr<SafeAPI> api_;
    };
}  // namespace

TEST_F(SafeApiTest, SafeInfo) {
    http_->on_get(safe_url("/"), 200,
                  std::string(R"({"address":")") + test_support::SAFE_ADDRESS + R"(","nonce":"12","threshold":2,"owners":[")" +
                      test_support::OWNER_ADDRESS +
                      R"(","0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"],"masterCopy":"0x3E5c63644E683549055b9Be8653de26E0B4CD36E",)"
                      R"("modules":[],"fallbackHandler":"0xf48f2B2d2a534e402487b3ee7C18c33Aec0Fe5e4","guard":null,"version":"1.3.0"})");

    const auto info = api_->safe_info(test_support::safe_address());
    EXPECT_EQ(info.address_, test_support::safe_address());
    EXPECT_EQ(info.nonce_, 12U);
    EXPECT_EQ(info.threshold_, 2U);
    ASSERT_EQ(info.owners_.size(), 2U);
    EXPECT_EQ(info.owners_[0], test_support::owner());
    EXPECT_TRUE(info.guard_.is_zero());
    EXPECT_EQ(info.version_, "1.3.0");

    ASSERT_EQ(http_->requests().size(), 1U);
    EXPECT_EQ(http_->requests()[0].method_, http::model::METHOD_GET);
}

TEST_F(SafeApiTest, ThresholdOutOfRange) {
    http_->on_get(safe_url("/"), 200,
                  std::string(R"({"address":")") + test_support::SAFE_ADDRESS + R"(","nonce":1,"threshold":4294967296,"owners":[")" +
                      test_support::OWNER_ADDRESS + R"("],"masterCopy":null,"modules":[],"fallbackHandler":null,"guard":null,"version":"1.3.0"})");
    EXPECT_THROW((void)api_->safe_info(test_support::safe_address()), http::http_error::DecodeError);
}

TEST_F(SafeApiTest, TransactionInfo) {
    const std::string hash = test_support::hash_for(3);
    http_->on_get(BASE + "/v1/multisig-transactions/" + hash + "/", 200,
                  test_support::msig_tx_json(3, hash, test_support::OWNER_ADDRESS, "381832418", 1, R"("0xdeadbeef")"));

    const auto tx = api_->transaction_info(safe::types::Hash32::from_hex(hash));
    EXPECT_EQ(tx.nonce_, 3U);
    EXPECT_EQ(tx.safe_tx_hash_.to_hex(), hash);
    EXPECT_EQ(tx.value_, safe::types::uint256{381832418});
    EXPECT_EQ(tx.operation_, safe::types::Operation::DELEGATE_CALL);
    ASSERT_TRUE(tx.data_.has_value());
    EXPECT_EQ(tx.data_->size(), 4U);
    EXPECT_EQ(tx.confirmations_required_, 2U);
    ASSERT_EQ(tx.confirmations_.size(), 1U);
    EXPECT_EQ(tx.confirmations_[0].owner_, test_support::owner());
    EXPECT_TRUE(tx.trusted_);
    EXPECT_FALSE(tx.is_executed_);
    EXPECT_FALSE(tx.block_number_.has_value());
}

TEST_F(SafeApiTest, ApiErrorEnvelope) {
    http_->on_get(safe_url("/"), 422, R"({"code":1,"message":"bad nonce","arguments":[]})");

    try {
        (void)api_->safe_info(test_support::safe_address());
        FAIL() << "expected ApiError";
    } catch (const http::http_error::ApiError& e) {
        EXPECT_EQ(e.code_, 1);
        EXPECT_EQ(e.message_, "bad nonce");
        EXPECT_TRUE(e.arguments_.empty());
    }
}

TEST_F(SafeApiTest, ApiErrorEnvelopeOnSuccessStatus) {
    http_->on_get(safe_url("/"), 200, R"({"code":50,"message":"Unknown","arguments":["0x1",2]})");

    try {
        (void)api_->safe_info(test_support::safe_address());
        FAIL() << "expected ApiError";
    } catch (const http::http_error::ApiError& e) {
        EXPECT_EQ(e.code_, 50);
        ASSERT_EQ(e.arguments_.size(), 2U);
        EXPECT_EQ(e.arguments_[0], "\"0x1\"");
        EXPECT_EQ(e.arguments_[1], "2");
    }
}

TEST_F(SafeApiTest, UnprocessableWithoutEnvelope) {
    http_->on_get(safe_url("/"), 422, R"({"nonce":["too low"]})");
    EXPECT_THROW((void)api_->safe_info(test_support::safe_address()), http::http_error::DecodeError);
}

TEST_F(SafeApiTest, HttpErrorStatus) {
    http_->on_get(safe_url("/"), 404, R"({"detail":"Not found."})");

    try {
        (void)api_->safe_info(test_support::safe_address());
        FAIL() << "expected HttpError";
    } catch (const http::http_error::HttpError& e) {
        EXPECT_EQ(e.status_, 404);
        EXPECT_EQ(e.url_, safe_url("/"));
        EXPECT_NE(e.body_preview_.find("Not found."), std::string::npos);
    }
}

TEST_F(SafeApiTest, GarbageBody) {
    http_->on_get(safe_url("/"), 200, "<html>gateway</html>");
    EXPECT_THROW((void)api_->safe_info(test_support::safe_address()), http::http_error::DecodeError);
}

TEST_F(SafeApiTest, RecordWithoutSafeTxHash) {
    const std::string hash = test_support::hash_for(1);
    http_->on_get(BASE + "/v1/multisig-transactions/" + hash + "/", 200, R"({"nonce":1,"to":"0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"})");
    EXPECT_THROW((void)api_->transaction_info(safe::types::Hash32::from_hex(hash)), http::http_error::DecodeError);
}

TEST_F(SafeApiTest, TransportFailure) {
    EXPECT_THROW((void)api_->safe_info(test_support::safe_address()), http::http_error::TransportError);
}

TEST_F(SafeApiTest, AllErrorsAreClientErrors) {
    http_->on_get(safe_url("/"), 500, "oops");
    EXPECT_THROW((void)api_->safe_info(test_support::safe_address()), http::http_error::ClientError);
}

TEST_F(SafeApiTest, FilteredHistoryQuery) {
    MsigHistoryFilters filters;
    filters.with_min_nonce(4).with_executed(true);

    http_->on_get(safe_url("/multisig-transactions/?nonce__gte=4&executed=true"), 200, R"({"count":0,"next":null,"previous":null,"results":[]})");

    const auto page = api_->filtered_msig_history(test_support::safe_address(), filters);
    EXPECT_EQ(page.count_, 0U);
    EXPECT_TRUE(page.results_.empty());
    EXPECT_FALSE(page.next_.has_value());
}

TEST_F(SafeApiTest, EstimateGas) {
    http_->on_post(safe_url("/multisig-transactions/estimations/"), 200, R"({"safeTxGas":"43000"})");

    safe::types::MetaTransactionData meta;
    meta.to_ = test_support::owner();
    meta.value_ = safe::types::uint256{1};

    EXPECT_EQ(api_->estimate_gas(test_support::safe_address(), meta), safe::types::uint256{43000});

    const auto body = nlohmann::json::parse(http_->requests().back().body_);
    EXPECT_EQ(body["to"], test_support::OWNER_ADDRESS);
    EXPECT_EQ(body["value"], "1");
    EXPECT_TRUE(body["data"].is_null());
    EXPECT_EQ(body["operation"], 0);
}

TEST_F(SafeApiTest, Tokens) {
    http_->on_get(BASE + "/v1/tokens/?symbol=WETH", 200,
                  R"({"count":1,"next":null,"previous":null,"results":[{"type":"ERC20","address":"0xB4FBF271143F4FBf7B91A5ded31805e42b2208d6",)"
                  R"("name":"Wrapped Ether","symbol":"WETH","decimals":18,"logoUri":"https://example/weth.png"}]})");

    TokenInfoFilters filters;
    filters.with_symbol("WETH");

    const auto page = api_->tokens(filters);
    ASSERT_EQ(page.results_.size(), 1U);
    EXPECT_EQ(page.results_[0].type_, safe::types::TokenType::ERC20);
    EXPECT_EQ(page.results_[0].decimals_, 18U);
    EXPECT_EQ(page.results_[0].name_, "Wrapped Ether");
}

TEST_F(SafeApiTest, TokenDecimalsOutOfRange) {
    http_->on_get(BASE + "/v1/tokens/", 200,
                  R"({"count":1,"next":null,"previous":null,"results":[{"type":"ERC20","address":"0xB4FBF271143F4FBf7B91A5ded31805e42b2208d6",)"
                  R"("name":"x","symbol":"x","decimals":"18446744073709551615","logoUri":null}]})");
    EXPECT_THROW((void)api_->tokens(), http::http_error::DecodeError);
}

TEST_F(SafeApiTest, UnknownTokenType) {
    http_->on_get(BASE + "/v1/tokens/", 200,
                  R"({"count":1,"next":null,"previous":null,"results":[{"type":"ERC4626","address":"0x0","name":"x","symbol":"x","decimals":null,"logoUri":null}]})");
    EXPECT_THROW((void)api_->tokens(), http::http_error::DecodeError);
}

TEST_F(SafeApiTest, ProposalRoundTrip) {
    safe::signer::LocalSigner owner(test_support::OWNER_KEY);
    const safe::types::SafeTransactionData tx = test_support::golden_tx();

    safe::types::ProposeRequest request;
    request.tx_ = tx;
    request.contract_transaction_hash_ = safe::eip712::safe_tx_hash(tx, test_support::safe_address(), test_support::GOERLI);
    request.signature_ = safe::signer::sign_digest(owner, request.contract_transaction_hash_);

    http_->on_post(safe_url("/multisig-transactions/"), 201, "");
    api_->post_proposal(test_support::safe_address(), request);

    ASSERT_EQ(http_->count(http::model::METHOD_POST), 1U);
    const auto body = nlohmann::json::parse(http_->requests().back().body_);
    EXPECT_EQ(body["to"], test_support::OWNER_ADDRESS);
    EXPECT_EQ(body["value"], "381832418");
    EXPECT_EQ(body["data"], "0xdeadbeefdeadbeef");
    EXPECT_EQ(body["operation"], 1);
    EXPECT_EQ(body["safeTxGas"], "0");
    EXPECT_EQ(body["gasToken"], "0x0000000000000000000000000000000000000000");
    EXPECT_EQ(body["nonce"], 7);
    EXPECT_EQ(body["contractTransactionHash"], test_support::GOLDEN_DIGEST);
    EXPECT_EQ(body["sender"], test_support::OWNER_ADDRESS);
    EXPECT_EQ(body["signature"], test_support::GOLDEN_SIGNATURE);
    EXPECT_FALSE(body.contains("origin"));

    // The service echoes the proposal back under its safeTxHash.
    const std::string hash = test_support::GOLDEN_DIGEST;
    http_->on_get(BASE + "/v1/multisig-transactions/" + hash + "/", 200,
                  test_support::msig_tx_json(body["nonce"].get<std::uint64_t>(), hash, body["to"].get<std::string>(), body["value"].get<std::string>(),
                                             body["operation"].get<int>(), "\"" + body["data"].get<std::string>() + "\""));

    const auto record = api_->transaction_info(request.contract_transaction_hash_);
    EXPECT_EQ(record.to_, tx.core_.to_);
    EXPECT_EQ(record.value_, tx.core_.value_);
    EXPECT_EQ(record.data_, tx.core_.data_);
    EXPECT_EQ(record.operation_, tx.core_.effective_operation());
    EXPECT_EQ(record.nonce_, tx.nonce_);
    EXPECT_EQ(record.safe_tx_hash_, request.contract_transaction_hash_);
}

TEST_F(SafeApiTest, FirstHistoryPageOnly) {
    const std::string next = safe_url("/multisig-transactions/?limit=1&offset=1");
    http_->on_get(safe_url("/multisig-transactions/"), 200,
                  R"({"count":2,"next":")" + next + R"(","previous":null,"results":[)" + test_support::msig_tx_json(1, test_support::hash_for(1)) + "]}");

    const auto page = api_->msig_history(test_support::safe_address());
    EXPECT_EQ(page.count_, 2U);
    EXPECT_EQ(page.next_, next);
    ASSERT_EQ(page.results_.size(), 1U);
    EXPECT_EQ(http_->requests().size(), 1U);
}

TEST_F(SafeApiTest, TokenStream) {
    const std::string next = BASE + "/v1/tokens/?limit=1&offset=1";
    http_->on_get(BASE + "/v1/tokens/?limit=1", 200,
                  R"({"count":2,"next":")" + next +
                      R"(","previous":null,"results":[{"type":"ERC721","address":"0x1","name":"A","symbol":"A","decimals":null,"logoUri":null}]})");
    http_->on_get(next, 200,
                  R"({"count":2,"next":null,"previous":null,"results":[{"type":"ERC1155","address":"0x2","name":"B","symbol":"B","decimals":0,"logoUri":""}]})");

    TokenInfoFilters filters;
    filters.with_limit(1);

    const auto all = api_->tokens_stream(filters).collect();
    ASSERT_EQ(all.size(), 2U);
    EXPECT_EQ(all[0].type_, safe::types::TokenType::ERC721);
    EXPECT_FALSE(all[0].decimals_.has_value());
    EXPECT_EQ(all[1].type_, safe::types::TokenType::ERC1155);
    EXPECT_EQ(all[1].decimals_, 0U);
}
