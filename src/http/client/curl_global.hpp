//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef SAFE_RELAY_CURL_GLOBAL_HPP
#define SAFE_RELAY_CURL_GLOBAL_HPP

namespace http::client {

    // Process-wide libcurl init/cleanup. Construct once in main before any CurlEasy.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace http::client

#endif
