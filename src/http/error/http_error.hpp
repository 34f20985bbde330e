//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef SAFE_RELAY_HTTP_ERROR_HPP
#define SAFE_RELAY_HTTP_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace http::http_error {
    const size_t ERROR_MESSAGE_LENGTH = 512;

    // Base of every failure that is not the signer's.
    struct ClientError : public std::runtime_error {
        explicit ClientError(const std::string &msg);
    };

    struct TransportError : public ClientError {
        std::string url_;
        explicit TransportError(std::string u, const std::string &msg);
    };

    struct HttpError : public ClientError {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };

    // Body or URL that could not be decoded; the message carries a preview of the body.
    struct DecodeError : public ClientError {
        std::string url_;
        explicit DecodeError(std::string u, std::string_view body, const std::string &msg);
    };

    // Structured {code, message, arguments} envelope reported by the service.
    struct ApiError : public ClientError {
        long code_;
        std::optional<std::string> message_;
        std::vector<std::string> arguments_;
        explicit ApiError(long code, std::optional<std::string> message, std::vector<std::string> arguments);
    };
}  // namespace http::http_error

#endif
