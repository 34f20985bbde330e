#ifndef SAFE_RELAY_TESTS_FIXTURES_HPP
#define SAFE_RELAY_TESTS_FIXTURES_HPP

#include <cstdint>
#include <string>

#include "src/safe/types/primitives.hpp"
#include "src/safe/types/transaction.hpp"
#include "src/utils/hex_utils.hpp"

namespace test_support {
    inline constexpr const char* OWNER_KEY = "1c3a7cdd2270579847aaec11680312cbf4d3c36886232b413ab6529593228ec2";
    inline constexpr const char* OWNER_ADDRESS = "0xD5F586B9b2abbbb9a9ffF936690A54F9849dbC97";
    inline constexpr const char* SAFE_ADDRESS = "0x38CD8Fa77ECEB4b1edB856Ed27aac6A6c6Dc88ca";
    inline constexpr std::uint64_t GOERLI = 5;

    inline constexpr const char* GOLDEN_DIGEST = "0xebf004c2142fb30f9b1b909d66f4432eaa1ccf52138599b15d990087aef0eb78";
    inline constexpr const char* GOLDEN_SIGNATURE =
        "0x788e8aadd1cdab5b2f616a293292f6b5cc9685dc47c06fead3c34df93e0233cb593bb3d1921699a2f70c2abbf2f5c42c85e1346a545de87f347af8e36ed0aab41c";

    inline safe::types::Address owner() { return safe::types::Address::from_hex(OWNER_ADDRESS); }
    inline safe::types::Address safe_address() { return safe::types::Address::from_hex(SAFE_ADDRESS); }

    // DelegateCall of 0xdeadbeefdeadbeef with value 381832418 at nonce 7, zero gas fields.
    inline safe::types::SafeTransactionData golden_tx() {
        safe::types::SafeTransactionData tx;
        tx.core_.to_ = owner();
        tx.core_.value_ = safe::types::uint256{381832418};
        tx.core_.data_ = hex_utils::from_hex("0xdeadbeefdeadbeef");
        tx.core_.operation_ = safe::types::Operation::DELEGATE_CALL;
        tx.nonce_ = 7;
        return tx;
    }

    // Record shaped like the service's multisig transaction payload.
    inline std::string msig_tx_json(std::uint64_t nonce, const std::string& safe_tx_hash, const std::string& to = OWNER_ADDRESS,
                                    const std::string& value = "0", int operation = 0, const std::string& data = "null") {
        return std::string(R"({"safe":")") + SAFE_ADDRESS + R"(","to":")" + to + R"(","value":")" + value + R"(","data":)" + data +
               R"(,"operation":)" + std::to_string(operation) +
               R"(,"gasToken":"0x0000000000000000000000000000000000000000","safeTxGas":"0","baseGas":"0","gasPrice":"0",)"
               R"("refundReceiver":"0x0000000000000000000000000000000000000000","nonce":)" +
               std::to_string(nonce) +
               R"(,"executionDate":null,"submissionDate":"2023-01-10T12:00:00Z","modified":"2023-01-10T12:00:00Z",)"
               R"("blockNumber":null,"transactionHash":null,"safeTxHash":")" +
               safe_tx_hash +
               R"(","executor":null,"isExecuted":false,"isSuccessful":null,"ethGasPrice":null,"maxFeePerGas":null,)"
               R"("maxPriorityFeePerGas":null,"gasUsed":null,"fee":null,"origin":null,"dataDecoded":null,"confirmationsRequired":2,)"
               R"("confirmations":[{"owner":")" +
               OWNER_ADDRESS +
               R"(","submissionDate":"2023-01-10T12:00:00Z","transactionHash":null,"signature":"0x00","signatureType":"EOA"}],)"
               R"("trusted":true,"signatures":null})";
    }

    // A distinct well-formed safeTxHash per index.
    inline std::string hash_for(std::uint64_t i) {
        std::string out = "0x";
        const std::string digits = std::to_string(i);
        out += std::string(64 - digits.size(), '0');
        out += digits;
        return out;
    }
}  // namespace test_support

#endif
