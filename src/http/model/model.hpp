//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef SAFE_RELAY_MODEL_HPP
#define SAFE_RELAY_MODEL_HPP

#include <string>
#include <vector>

namespace http::model {
    inline constexpr const char* METHOD_GET = "GET";
    inline constexpr const char* METHOD_POST = "POST";

    struct Request {
        std::string url_;
        std::string method_ = METHOD_GET;
        std::string body_;

        std::vector<std::string> headers_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;
        std::string content_type_;
    };
}  // namespace http::model

#endif
