#include "safe_tx_service.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../utils/hex_utils.hpp"

using namespace simdjson;

namespace http::provider {
    struct ServicePaths {
        static constexpr const char* SAFES = "/v1/safes/";
        static constexpr const char* MULTISIG_TRANSACTIONS = "/multisig-transactions/";
        static constexpr const char* ESTIMATIONS = "/multisig-transactions/estimations/";
        static constexpr const char* TRANSACTION = "/v1/multisig-transactions/";
        static constexpr const char* TOKENS = "/v1/tokens/";
    };

    struct ServiceHeaders {
        static constexpr const char* ACCEPT_JSON = "Accept: application/json";
        static constexpr const char* CONTENT_TYPE_JSON = "Content-Type: application/json";
    };

    namespace {
        using safe::types::Address;
        using safe::types::Hash32;
        using safe::types::uint256;

        ondemand::json_type type_of(ondemand::value& v) { return ondemand::json_type(v.type()); }

        bool is_null(ondemand::value& v) { return type_of(v) == ondemand::json_type::null; }

        std::string as_string(ondemand::value& v) { return std::string(std::string_view(v.get_string())); }

        std::optional<std::string> as_optional_string(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return as_string(v);
        }

        // Large integers arrive either as decimal strings or as plain numbers.
        uint256 as_u256(ondemand::value& v) {
            if (type_of(v) == ondemand::json_type::string) {
                return safe::types::parse_u256(std::string_view(v.get_string()));
            }
            return uint256{std::uint64_t(v.get_uint64())};
        }

        std::optional<uint256> as_optional_u256(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return as_u256(v);
        }

        std::uint64_t as_u64(ondemand::value& v) {
            if (type_of(v) == ondemand::json_type::string) {
                const uint256 wide = safe::types::parse_u256(std::string_view(v.get_string()));
                if (wide > std::numeric_limits<std::uint64_t>::max()) {
                    throw std::out_of_range("Integer does not fit in 64 bits");
                }
                return static_cast<std::uint64_t>(wide);
            }
            return std::uint64_t(v.get_uint64());
        }

        std::optional<std::uint64_t> as_optional_u64(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return as_u64(v);
        }

        std::uint32_t as_u32(ondemand::value& v) {
            const std::uint64_t wide = as_u64(v);
            if (wide > std::numeric_limits<std::uint32_t>::max()) {
                throw std::out_of_range("Integer does not fit in 32 bits");
            }
            return static_cast<std::uint32_t>(wide);
        }

        std::optional<std::uint32_t> as_optional_u32(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return as_u32(v);
        }

        std::optional<bool> as_optional_bool(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return bool(v.get_bool());
        }

        Address as_address(ondemand::value& v) { return Address::from_hex(std::string_view(v.get_string())); }

        // refundReceiver and friends: null means the zero address.
        Address as_address_permit_null(ondemand::value& v) {
            if (is_null(v)) {
                return Address{};
            }
            return as_address(v);
        }

        std::optional<Address> as_optional_address(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return as_address(v);
        }

        std::optional<Hash32> as_optional_hash(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return Hash32::from_hex(std::string_view(v.get_string()));
        }

        std::optional<safe::types::Bytes> as_optional_bytes(ondemand::value& v) {
            if (is_null(v)) {
                return std::nullopt;
            }
            return hex_utils::from_hex(std::string_view(v.get_string()));
        }

        safe::types::DecodedData parse_decoded_data(ondemand::object obj) {
            safe::types::DecodedData out;
            for (auto field : obj) {
                const std::string_view key = field.unescaped_key();
                ondemand::value v = field.value();

                if (key == "method") {
                    out.method_ = as_string(v);
                } else if (key == "parameters") {
                    for (auto raw_param : v.get_array()) {
                        ondemand::object param = raw_param.get_object();
                        safe::types::DecodedParameter p;
                        for (auto param_field : param) {
                            const std::string_view param_key = param_field.unescaped_key();
                            ondemand::value pv = param_field.value();
                            if (param_key == "name") {
                                p.name_ = as_string(pv);
                            } else if (param_key == "type") {
                                p.type_ = as_string(pv);
                            }
                        }
                        out.parameters_.push_back(std::move(p));
                    }
                }
            }
            return out;
        }

        safe::types::MsigConfirmation parse_confirmation(ondemand::object obj) {
            safe::types::MsigConfirmation out;
            for (auto field : obj) {
                const std::string_view key = field.unescaped_key();
                ondemand::value v = field.value();

                if (key == "owner") {
                    out.owner_ = as_address(v);
                } else if (key == "submissionDate") {
                    out.submission_date_ = as_string(v);
                } else if (key == "transactionHash") {
                    out.transaction_hash_ = as_optional_hash(v);
                } else if (key == "signature") {
                    out.signature_ = as_optional_string(v).value_or("");
                } else if (key == "signatureType") {
                    out.signature_type_ = as_string(v);
                }
            }
            return out;
        }

        safe::types::MsigTxResponse parse_msig_tx_object(ondemand::object obj) {
            safe::types::MsigTxResponse out;
            bool has_safe_tx_hash = false;

            for (auto field : obj) {
                const std::string_view key = field.unescaped_key();
                ondemand::value v = field.value();

                if (key == "safe") {
                    out.safe_ = as_address(v);
                } else if (key == "to") {
                    out.to_ = as_address(v);
                } else if (key == "value") {
                    out.value_ = as_u256(v);
                } else if (key == "data") {
                    out.data_ = as_optional_bytes(v);
                } else if (key == "operation") {
                    out.operation_ = safe::types::operation_from_wire(as_u64(v));
                } else if (key == "gasToken") {
                    out.gas_token_ = as_address_permit_null(v);
                } else if (key == "safeTxGas") {
                    out.safe_tx_gas_ = as_u256(v);
                } else if (key == "baseGas") {
                    out.base_gas_ = as_u256(v);
                } else if (key == "gasPrice") {
                    out.gas_price_ = as_u256(v);
                } else if (key == "refundReceiver") {
                    out.refund_receiver_ = as_address_permit_null(v);
                } else if (key == "nonce") {
                    out.nonce_ = as_u64(v);
                } else if (key == "executionDate") {
                    out.execution_date_ = as_optional_string(v);
                } else if (key == "submissionDate") {
                    out.submission_date_ = as_string(v);
                } else if (key == "modified") {
                    out.modified_ = as_string(v);
                } else if (key == "blockNumber") {
                    out.block_number_ = as_optional_u64(v);
                } else if (key == "transactionHash") {
                    out.transaction_hash_ = as_optional_hash(v);
                } else if (key == "safeTxHash") {
                    out.safe_tx_hash_ = Hash32::from_hex(std::string_view(v.get_string()));
                    has_safe_tx_hash = true;
                } else if (key == "executor") {
                    out.executor_ = as_optional_address(v);
                } else if (key == "isExecuted") {
                    out.is_executed_ = bool(v.get_bool());
                } else if (key == "isSuccessful") {
                    out.is_successful_ = as_optional_bool(v);
                } else if (key == "ethGasPrice") {
                    out.eth_gas_price_ = as_optional_u256(v);
                } else if (key == "maxFeePerGas") {
                    out.max_fee_per_gas_ = as_optional_u256(v);
                } else if (key == "maxPriorityFeePerGas") {
                    out.max_priority_fee_per_gas_ = as_optional_u256(v);
                } else if (key == "gasUsed") {
                    out.gas_used_ = as_optional_u64(v);
                } else if (key == "fee") {
                    out.fee_ = as_optional_u256(v);
                } else if (key == "origin") {
                    out.origin_ = as_optional_string(v);
                } else if (key == "dataDecoded") {
                    if (!is_null(v)) {
                        out.data_decoded_ = parse_decoded_data(v.get_object());
                    }
                } else if (key == "confirmationsRequired") {
                    const auto required = as_optional_u32(v);
                    if (required) {
                        out.confirmations_required_ = *required;
                    }
                } else if (key == "confirmations") {
                    if (!is_null(v)) {
                        for (auto confirmation : v.get_array()) {
                            out.confirmations_.push_back(parse_confirmation(confirmation.get_object()));
                        }
                    }
                } else if (key == "trusted") {
                    out.trusted_ = bool(v.get_bool());
                } else if (key == "signatures") {
                    out.signatures_ = as_optional_string(v);
                }
            }

            if (!has_safe_tx_hash) {
                throw std::invalid_argument("Transaction record has no safeTxHash");
            }
            return out;
        }

        safe::types::TokenType parse_token_type(std::string_view raw) {
            if (raw == "ERC20") {
                return safe::types::TokenType::ERC20;
            }
            if (raw == "ERC721") {
                return safe::types::TokenType::ERC721;
            }
            if (raw == "ERC1155") {
                return safe::types::TokenType::ERC1155;
            }
            throw std::invalid_argument("Unknown token type: " + std::string(raw));
        }

        safe::types::TokenInfo parse_token_object(ondemand::object obj) {
            safe::types::TokenInfo out;
            for (auto field : obj) {
                const std::string_view key = field.unescaped_key();
                ondemand::value v = field.value();

                if (key == "type") {
                    out.type_ = parse_token_type(std::string_view(v.get_string()));
                } else if (key == "address") {
                    out.address_ = as_string(v);
                } else if (key == "name") {
                    out.name_ = as_string(v);
                } else if (key == "symbol") {
                    out.symbol_ = as_string(v);
                } else if (key == "decimals") {
                    const auto decimals = as_optional_u32(v);
                    if (decimals) {
                        out.decimals_ = *decimals;
                    }
                } else if (key == "logoUri") {
                    out.logo_uri_ = as_optional_string(v).value_or("");
                }
            }
            return out;
        }

        template <typename T, typename ItemFn>
        safe::types::Paginated<T> parse_paginated(ondemand::document& doc, ItemFn parse_item) {
            safe::types::Paginated<T> out;
            ondemand::object root = doc.get_object();

            for (auto field : root) {
                const std::string_view key = field.unescaped_key();
                ondemand::value v = field.value();

                if (key == "count") {
                    out.count_ = as_u64(v);
                } else if (key == "next") {
                    out.next_ = as_optional_string(v);
                } else if (key == "previous") {
                    out.previous_ = as_optional_string(v);
                } else if (key == "results") {
                    for (auto item : v.get_array()) {
                        out.results_.push_back(parse_item(item.get_object()));
                    }
                }
            }
            return out;
        }

        template <typename Fn>
        auto decode(const http::model::Response& resp, Fn fn) {
            try {
                ondemand::parser parser;
                padded_string json(resp.body_);
                ondemand::document doc = parser.iterate(json);
                return fn(doc);
            } catch (const simdjson::simdjson_error& e) {
                throw http::http_error::DecodeError(resp.effective_url_, resp.body_, "Failed to parse JSON response: " + std::string(e.what()));
            } catch (const std::logic_error& e) {
                throw http::http_error::DecodeError(resp.effective_url_, resp.body_, "Invalid value in JSON response: " + std::string(e.what()));
            }
        }

        http::model::Request json_get(std::string url) {
            http::model::Request r;
            r.url_ = std::move(url);
            r.method_ = http::model::METHOD_GET;
            r.headers_ = {ServiceHeaders::ACCEPT_JSON};
            return r;
        }

        http::model::Request json_post(std::string url, std::string body) {
            http::model::Request r;
            r.url_ = std::move(url);
            r.method_ = http::model::METHOD_POST;
            r.body_ = std::move(body);
            r.headers_ = {ServiceHeaders::ACCEPT_JSON, ServiceHeaders::CONTENT_TYPE_JSON};
            return r;
        }

        nlohmann::json bytes_or_null(const std::optional<safe::types::Bytes>& data) {
            if (!data) {
                return nullptr;
            }
            return hex_utils::to_hex(*data);
        }
    }  // namespace

    SafeTxServiceProvider::SafeTxServiceProvider(std::string base_url) : base_url_(std::move(base_url)) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    http::model::Request SafeTxServiceProvider::build_safe_info(const safe::types::Address& safe) const {
        return json_get(base_url_ + ServicePaths::SAFES + safe.to_checksum() + "/");
    }

    http::model::Request SafeTxServiceProvider::build_msig_history(const safe::types::Address& safe, const string_utils::QueryPairs& query) const {
        return json_get(string_utils::append_query(base_url_ + ServicePaths::SAFES + safe.to_checksum() + ServicePaths::MULTISIG_TRANSACTIONS, query));
    }

    http::model::Request SafeTxServiceProvider::build_transaction_info(const safe::types::Hash32& safe_tx_hash) const {
        return json_get(base_url_ + ServicePaths::TRANSACTION + safe_tx_hash.to_hex() + "/");
    }

    http::model::Request SafeTxServiceProvider::build_estimate(const safe::types::Address& safe, const safe::types::MetaTransactionData& tx) const {
        return json_post(base_url_ + ServicePaths::SAFES + safe.to_checksum() + ServicePaths::ESTIMATIONS, write_estimate_body(tx));
    }

    http::model::Request SafeTxServiceProvider::build_propose(const safe::types::Address& safe, const safe::types::ProposeRequest& proposal) const {
        return json_post(base_url_ + ServicePaths::SAFES + safe.to_checksum() + ServicePaths::MULTISIG_TRANSACTIONS, write_propose_body(proposal));
    }

    http::model::Request SafeTxServiceProvider::build_tokens(const string_utils::QueryPairs& query) const {
        return json_get(string_utils::append_query(base_url_ + ServicePaths::TOKENS, query));
    }

    http::model::Request SafeTxServiceProvider::build_page(const std::string& next_url) {
        if (next_url.rfind("http://", 0) != 0 && next_url.rfind("https://", 0) != 0) {
            throw http::http_error::DecodeError(next_url, "", "Invalid continuation URL");
        }
        return json_get(next_url);
    }

    safe::types::SafeInfoResponse SafeTxServiceProvider::parse_safe_info(const http::model::Response& resp) {
        return decode(resp, [](ondemand::document& doc) {
            safe::types::SafeInfoResponse out;
            ondemand::object root = doc.get_object();

            for (auto field : root) {
                const std::string_view key = field.unescaped_key();
                ondemand::value v = field.value();

                if (key == "address") {
                    out.address_ = as_address(v);
                } else if (key == "nonce") {
                    out.nonce_ = as_u64(v);
                } else if (key == "threshold") {
                    out.threshold_ = as_u32(v);
                } else if (key == "owners") {
                    for (auto owner : v.get_array()) {
                        out.owners_.push_back(Address::from_hex(std::string_view(owner.get_string())));
                    }
                } else if (key == "masterCopy") {
                    out.master_copy_ = as_address_permit_null(v);
                } else if (key == "modules") {
                    for (auto mod : v.get_array()) {
                        out.modules_.emplace_back(std::string_view(mod.get_string()));
                    }
                } else if (key == "fallbackHandler") {
                    out.fallback_handler_ = as_address_permit_null(v);
                } else if (key == "guard") {
                    out.guard_ = as_address_permit_null(v);
                } else if (key == "version") {
                    out.version_ = as_optional_string(v);
                }
            }
            return out;
        });
    }

    safe::types::MsigHistoryResponse SafeTxServiceProvider::parse_msig_history(const http::model::Response& resp) {
        return decode(resp, [](ondemand::document& doc) { return parse_paginated<safe::types::MsigTxResponse>(doc, parse_msig_tx_object); });
    }

    safe::types::MsigTxResponse SafeTxServiceProvider::parse_msig_tx(const http::model::Response& resp) {
        return decode(resp, [](ondemand::document& doc) { return parse_msig_tx_object(doc.get_object()); });
    }

    safe::types::uint256 SafeTxServiceProvider::parse_estimate(const http::model::Response& resp) {
        return decode(resp, [](ondemand::document& doc) {
            ondemand::object root = doc.get_object();
            ondemand::value gas = root["safeTxGas"];
            return as_u256(gas);
        });
    }

    safe::types::TokenInfoResponse SafeTxServiceProvider::parse_tokens(const http::model::Response& resp) {
        return decode(resp, [](ondemand::document& doc) { return parse_paginated<safe::types::TokenInfo>(doc, parse_token_object); });
    }

    std::optional<http::http_error::ApiError> SafeTxServiceProvider::parse_error_envelope(const http::model::Response& resp) {
        const std::string body = string_utils::trim(resp.body_);
        if (body.empty() || body.front() != '{') {
            return std::nullopt;
        }

        ondemand::parser parser;
        padded_string json(body);
        ondemand::document doc;
        if (parser.iterate(json).get(doc) != SUCCESS) {
            return std::nullopt;
        }

        ondemand::object root;
        if (doc.get_object().get(root) != SUCCESS) {
            return std::nullopt;
        }

        std::optional<long> code;
        std::optional<std::string> message;
        std::vector<std::string> arguments;

        for (auto field : root) {
            std::string_view key;
            ondemand::value v;
            if (field.unescaped_key().get(key) != SUCCESS || field.value().get(v) != SUCCESS) {
                return std::nullopt;
            }

            ondemand::json_type type;
            if (v.type().get(type) != SUCCESS) {
                return std::nullopt;
            }

            if (key == "code") {
                std::int64_t raw_code = 0;
                if (type != ondemand::json_type::number || v.get_int64().get(raw_code) != SUCCESS) {
                    return std::nullopt;
                }
                code = static_cast<long>(raw_code);
            } else if (key == "message" && type == ondemand::json_type::string) {
                std::string_view raw_message;
                if (v.get_string().get(raw_message) != SUCCESS) {
                    return std::nullopt;
                }
                message = std::string(raw_message);
            } else if (key == "arguments" && type == ondemand::json_type::array) {
                for (auto argument : v.get_array()) {
                    std::string_view raw_argument;
                    if (simdjson::to_json_string(argument).get(raw_argument) != SUCCESS) {
                        return std::nullopt;
                    }
                    arguments.emplace_back(raw_argument);
                }
            }
        }

        if (!code) {
            return std::nullopt;
        }
        return http::http_error::ApiError(*code, std::move(message), std::move(arguments));
    }

    std::string SafeTxServiceProvider::write_propose_body(const safe::types::ProposeRequest& proposal) {
        const safe::types::SafeTransactionData& tx = proposal.tx_;

        nlohmann::json j;
        j["to"] = tx.core_.to_.to_checksum();
        j["value"] = safe::types::to_decimal(tx.core_.value_);
        j["data"] = bytes_or_null(tx.core_.data_);
        j["operation"] = static_cast<int>(tx.core_.effective_operation());
        j["safeTxGas"] = safe::types::to_decimal(tx.gas_.safe_tx_gas_);
        j["baseGas"] = safe::types::to_decimal(tx.gas_.base_gas_);
        j["gasPrice"] = safe::types::to_decimal(tx.gas_.gas_price_);
        j["gasToken"] = tx.gas_.gas_token_.to_checksum();
        j["refundReceiver"] = tx.gas_.refund_receiver_.to_checksum();
        j["nonce"] = tx.nonce_;
        j["contractTransactionHash"] = proposal.contract_transaction_hash_.to_hex();
        j["sender"] = proposal.signature_.sender_.to_checksum();
        j["signature"] = proposal.signature_.signature_.to_hex();
        if (proposal.signature_.origin_) {
            j["origin"] = *proposal.signature_.origin_;
        }
        return j.dump();
    }

    std::string SafeTxServiceProvider::write_estimate_body(const safe::types::MetaTransactionData& tx) {
        nlohmann::json j;
        j["to"] = tx.to_.to_checksum();
        j["value"] = safe::types::to_decimal(tx.value_);
        j["data"] = bytes_or_null(tx.data_);
        j["operation"] = static_cast<int>(tx.effective_operation());
        return j.dump();
    }
}  // namespace http::provider
