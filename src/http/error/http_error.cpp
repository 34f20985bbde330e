//
// Created by Daniel Griffiths on 11/1/25.
//

#include "http_error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"

namespace http::http_error {
    namespace {
        std::string describe_api_error(long code, const std::optional<std::string> &message) {
            return "API error code " + std::to_string(code) + ": \"" + message.value_or("") + "\"";
        }
    }  // namespace

    ClientError::ClientError(const std::string &msg) : std::runtime_error(msg) {}

    TransportError::TransportError(std::string u, const std::string &msg) : ClientError(msg + " (" + u + ")"), url_(std::move(u)) {}

    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : ClientError(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    DecodeError::DecodeError(std::string u, std::string_view body, const std::string &msg)
        : ClientError(msg + " from " + u + ", body: " + string_utils::preview(body, ERROR_MESSAGE_LENGTH)), url_(std::move(u)) {}

    ApiError::ApiError(long code, std::optional<std::string> message, std::vector<std::string> arguments)
        : ClientError(describe_api_error(code, message)), code_(code), message_(std::move(message)), arguments_(std::move(arguments)) {}
};  // namespace http::http_error
