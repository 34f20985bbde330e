#ifndef SAFE_RELAY_SAFE_SIGNER_INTERFACE_HPP
#define SAFE_RELAY_SAFE_SIGNER_INTERFACE_HPP

#include "../types/primitives.hpp"

namespace safe::signer {
    class ISigner {
       public:
        ISigner() = default;
        virtual ~ISigner() = default;
        ISigner(const ISigner&) = delete;
        ISigner& operator=(const ISigner&) = delete;
        ISigner(ISigner&&) = delete;
        ISigner& operator=(ISigner&&) = delete;

        [[nodiscard]] virtual types::Address address() const = 0;

        // Signs a raw 32-byte digest with no further prefixing. Throws SignerError.
        virtual types::Signature sign_digest(const types::Hash32& digest) = 0;
    };
}  // namespace safe::signer

#endif
