//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef SAFE_RELAY_CURL_EASY_HPP
#define SAFE_RELAY_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    // One reusable easy handle; requests on it are serialized.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(long timeout_ms = constants::DEFAULT_TIMEOUT_MS);

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response get(const http::model::Request& req) override;
        http::model::Response post(const http::model::Request& req) override;
        void enable_keepalive();
        void enable_compression();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void perform_throw(const std::string& url);
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once(long timeout_ms);
        void prepare_for_new_request(std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string last_content_type_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
        std::mutex mutex_;
    };
}  // namespace http::client

#endif
