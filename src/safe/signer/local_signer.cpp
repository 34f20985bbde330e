#include "local_signer.hpp"

#include <secp256k1_recovery.h>

#include <algorithm>
#include <stdexcept>

#include "../../utils/hex_utils.hpp"
#include "../crypto/keccak.hpp"
#include "signer_error.hpp"

namespace safe::signer {
    namespace {
        constexpr std::size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
        constexpr std::size_t COMPACT_SIGNATURE_SIZE = 64;
    }  // namespace

    LocalSigner::LocalSigner(std::string_view private_key_hex)
        : ctx_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY), secp256k1_context_destroy) {
        if (ctx_ == nullptr) {
            throw SignerError("failed to create secp256k1 context");
        }

        try {
            secret_ = hex_utils::from_hex_fixed<constants::HASH_SIZE>(private_key_hex);
        } catch (const std::invalid_argument&) {
            throw SignerError("private key must be 32 bytes of hex");
        }

        if (secp256k1_ec_seckey_verify(ctx_.get(), secret_.data()) != 1) {
            throw SignerError("private key is out of range");
        }

        secp256k1_pubkey pubkey;
        if (secp256k1_ec_pubkey_create(ctx_.get(), &pubkey, secret_.data()) != 1) {
            throw SignerError("failed to derive public key");
        }
        address_ = address_of(ctx_.get(), pubkey);
    }

    LocalSigner::~LocalSigner() { std::fill(secret_.begin(), secret_.end(), 0); }

    types::Signature LocalSigner::sign_digest(const types::Hash32& digest) {
        secp256k1_ecdsa_recoverable_signature sig;
        if (secp256k1_ecdsa_sign_recoverable(ctx_.get(), &sig, digest.bytes_.data(), secret_.data(), nullptr, nullptr) != 1) {
            throw SignerError("failed to sign digest " + digest.to_hex());
        }

        std::array<std::uint8_t, COMPACT_SIGNATURE_SIZE> r_and_s{};
        int recovery_id = 0;
        secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx_.get(), r_and_s.data(), &recovery_id, &sig);

        types::Signature out;
        std::copy_n(r_and_s.begin(), constants::HASH_SIZE, out.r_.bytes_.begin());
        std::copy_n(r_and_s.begin() + constants::HASH_SIZE, constants::HASH_SIZE, out.s_.bytes_.begin());
        out.v_ = static_cast<std::uint8_t>(constants::ECDSA_V_OFFSET + recovery_id);
        return out;
    }

    types::Address LocalSigner::recover(const types::Hash32& digest, const types::Signature& signature) {
        const ContextPtr ctx(secp256k1_context_create(SECP256K1_CONTEXT_VERIFY), secp256k1_context_destroy);
        if (ctx == nullptr) {
            throw SignerError("failed to create secp256k1 context");
        }

        const int recovery_id = signature.v_ >= constants::ECDSA_V_OFFSET ? signature.v_ - constants::ECDSA_V_OFFSET : signature.v_;
        std::array<std::uint8_t, COMPACT_SIGNATURE_SIZE> r_and_s{};
        std::copy(signature.r_.bytes_.begin(), signature.r_.bytes_.end(), r_and_s.begin());
        std::copy(signature.s_.bytes_.begin(), signature.s_.bytes_.end(), r_and_s.begin() + constants::HASH_SIZE);

        secp256k1_ecdsa_recoverable_signature sig;
        if (secp256k1_ecdsa_recoverable_signature_parse_compact(ctx.get(), &sig, r_and_s.data(), recovery_id) != 1) {
            throw SignerError("malformed signature " + signature.to_hex());
        }

        secp256k1_pubkey pubkey;
        if (secp256k1_ecdsa_recover(ctx.get(), &pubkey, &sig, digest.bytes_.data()) != 1) {
            throw SignerError("failed to recover signer of " + digest.to_hex());
        }
        return address_of(ctx.get(), pubkey);
    }

    types::Address LocalSigner::address_of(const secp256k1_context* ctx, const secp256k1_pubkey& pubkey) {
        std::array<std::uint8_t, UNCOMPRESSED_PUBKEY_SIZE> serialized{};
        size_t length = serialized.size();
        secp256k1_ec_pubkey_serialize(ctx, serialized.data(), &length, &pubkey, SECP256K1_EC_UNCOMPRESSED);

        // Skip the 0x04 tag, the address is the low 20 bytes of the hash.
        const crypto::Digest hash = crypto::keccak256(std::span<const std::uint8_t>(serialized.data() + 1, length - 1));

        types::Address a;
        std::copy(hash.end() - constants::ADDRESS_SIZE, hash.end(), a.bytes_.begin());
        return a;
    }
}  // namespace safe::signer
