#ifndef SAFE_RELAY_SAFE_SIGNER_ERROR_HPP
#define SAFE_RELAY_SAFE_SIGNER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace safe::signer {
    // Signing capability failed or declined. Deliberately outside the
    // http::http_error::ClientError hierarchy.
    struct SignerError : public std::runtime_error {
        explicit SignerError(const std::string& msg) : std::runtime_error("Signer error: " + msg) {}
    };
}  // namespace safe::signer

#endif
