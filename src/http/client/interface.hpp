#ifndef SAFE_RELAY_CLIENT_INTERFACE_HPP
#define SAFE_RELAY_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    // Transport seam. Implementations return whatever status the server sent
    // and throw http_error::TransportError only when no response was received.
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response get(const http::model::Request& req) = 0;
        virtual http::model::Response post(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif
