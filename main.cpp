#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "src/config/env_config.hpp"
#include "src/http/api/safe_api.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/safe/proposer/precondition_error.hpp"
#include "src/safe/proposer/safe_proposer.hpp"
#include "src/safe/signer/local_signer.hpp"
#include "src/safe/signer/signer_error.hpp"
#include "src/safe/types/primitives.hpp"
#include "src/safe/types/transaction.hpp"
#include "src/utils/hex_utils.hpp"
#include "src/utils/logging.hpp"

namespace {
    void print_usage() {
        std::cerr << "usage: safe_relay_cli <command> [args]\n"
                  << "  info                                  safe state snapshot\n"
                  << "  history                               full multisig history\n"
                  << "  next-nonce                            next free nonce\n"
                  << "  tx <safeTxHash>                       one transaction record\n"
                  << "  propose <to> <value> [data] [call|delegatecall]\n";
    }

    void print_tx(const safe::types::MsigTxResponse& tx) {
        std::cout << tx.safe_tx_hash_.to_hex() << " nonce=" << tx.nonce_ << " to=" << tx.to_.to_checksum()
                  << " value=" << safe::types::to_decimal(tx.value_) << " executed=" << (tx.is_executed_ ? "true" : "false")
                  << " confirmations=" << tx.confirmations_.size();
        if (tx.confirmations_required_) {
            std::cout << "/" << *tx.confirmations_required_;
        }
        std::cout << "\n";
    }
}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    try {
        const config::ClientConfig cfg = config::load_from_env();
        logging::set_level(cfg.log_level_);

        http::client::CurlGlobal curl_global;

        auto curl = std::make_shared<http::client::CurlEasy>(cfg.timeout_ms_);
        curl->enable_keepalive();
        curl->enable_compression();

        auto api = std::make_shared<http::safe_api::SafeAPI>(cfg.service(), curl);
        const std::string& command = args[0];

        if (command == "info") {
            const auto info = api->safe_info(cfg.require_safe_address());
            std::cout << "address:   " << info.address_.to_checksum() << "\n"
                      << "nonce:     " << info.nonce_ << "\n"
                      << "threshold: " << info.threshold_ << "/" << info.owners_.size() << "\n"
                      << "version:   " << info.version_.value_or("unknown") << "\n";
            for (const auto& owner : info.owners_) {
                std::cout << "owner:     " << owner.to_checksum() << "\n";
            }
        } else if (command == "history") {
            auto stream = api->msig_history_stream(cfg.require_safe_address());
            while (auto tx = stream.next()) {
                print_tx(*tx);
            }
        } else if (command == "next-nonce") {
            std::cout << api->next_nonce(cfg.require_safe_address()) << "\n";
        } else if (command == "tx" && args.size() == 2) {
            print_tx(api->transaction_info(safe::types::Hash32::from_hex(args[1])));
        } else if (command == "propose" && args.size() >= 3 && args.size() <= 5) {
            if (!cfg.private_key_) {
                throw safe::proposer::PreconditionError(safe::proposer::PreconditionError::Reason::NO_SIGNER,
                                                        std::string(config::EnvKeys::PRIVATE_KEY) + " is required to propose");
            }

            safe::types::MetaTransactionData meta;
            meta.to_ = safe::types::Address::from_hex(args[1]);
            meta.value_ = safe::types::parse_u256(args[2]);
            if (args.size() >= 4) {
                meta.data_ = hex_utils::from_hex(args[3]);
            }
            if (args.size() == 5) {
                meta.operation_ = safe::types::parse_operation(args[4]);
            }

            auto signer = std::make_shared<safe::signer::LocalSigner>(*cfg.private_key_);
            safe::proposer::SafeProposer proposer(api, signer, api->service().chain_id_);
            print_tx(proposer.propose(meta, cfg.require_safe_address()));
        } else {
            print_usage();
            return 1;
        }
    } catch (const http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const http::http_error::ClientError& e) {
        std::cerr << "Client Error: " << e.what() << "\n";
        return 2;
    } catch (const safe::signer::SignerError& e) {
        std::cerr << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
