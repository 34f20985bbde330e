#ifndef SAFE_RELAY_SAFE_PROPOSER_PRECONDITION_ERROR_HPP
#define SAFE_RELAY_SAFE_PROPOSER_PRECONDITION_ERROR_HPP

#include <cstdint>
#include <string>

#include "../../http/error/http_error.hpp"

namespace safe::proposer {
    // Raised before any I/O when a request cannot be served as asked.
    struct PreconditionError : public http::http_error::ClientError {
        enum class Reason : std::uint8_t {
            MISSING_TO,
            NO_SIGNER,
            WRONG_SIGNER,
            WRONG_CHAIN,
            HASH_MISMATCH,
            UNKNOWN_SERVICE,
        };

        Reason reason_;

        explicit PreconditionError(Reason reason, const std::string& msg) : http::http_error::ClientError(msg), reason_(reason) {}
    };
}  // namespace safe::proposer

#endif
