#ifndef SAFE_RELAY_SAFE_SIGNER_LOCAL_SIGNER_HPP
#define SAFE_RELAY_SAFE_SIGNER_LOCAL_SIGNER_HPP

#include <secp256k1.h>

#include <array>
#include <memory>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../types/primitives.hpp"
#include "interface.hpp"

namespace safe::signer {
    // In-process secp256k1 key. Signatures use RFC 6979 nonces, low-s, v = 27 + recid.
    class LocalSigner : public ISigner {
       public:
        explicit LocalSigner(std::string_view private_key_hex);

        ~LocalSigner() override;
        LocalSigner(const LocalSigner&) = delete;
        LocalSigner& operator=(const LocalSigner&) = delete;
        LocalSigner(LocalSigner&&) = delete;
        LocalSigner& operator=(LocalSigner&&) = delete;

        [[nodiscard]] types::Address address() const override { return address_; }

        types::Signature sign_digest(const types::Hash32& digest) override;

        // Address of the key that produced `signature` over `digest`.
        static types::Address recover(const types::Hash32& digest, const types::Signature& signature);

       private:
        using ContextPtr = std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

        static types::Address address_of(const secp256k1_context* ctx, const secp256k1_pubkey& pubkey);

        ContextPtr ctx_;
        std::array<std::uint8_t, constants::HASH_SIZE> secret_{};
        types::Address address_;
    };
}  // namespace safe::signer

#endif
