//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr const char* USER_AGENT = "safe-relay/1.0";
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type:";
    };

    CurlEasy::CurlEasy(long timeout_ms) : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once(timeout_ms);
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once(long timeout_ms) {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_TIMEOUT_MS, timeout_ms);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
    }

    void CurlEasy::enable_keepalive() {
        std::lock_guard<std::mutex> lock(mutex_);
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() {
        std::lock_guard<std::mutex> lock(mutex_);
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        last_content_type_.clear();
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;
        const size_t key_length = std::char_traits<char>::length(HeaderKeys::CONTENT_TYPE);

        if (string_utils::ieq_prefix(buffer, bytes, HeaderKeys::CONTENT_TYPE)) {
            self->last_content_type_ = string_utils::trim(std::string(buffer + key_length, bytes - key_length));
        }

        return bytes;
    }

    http::model::Response CurlEasy::get(const http::model::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string body;
        prepare_for_new_request(body);
        set_url(req.url_);
        set_headers(req.headers_);

        perform_throw(req.url_);
        return make_response(body);
    }

    http::model::Response CurlEasy::post(const http::model::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string body;
        prepare_for_new_request(body);
        set_url(req.url_);
        set_headers(req.headers_);

        // POSTFIELDS is not copied by libcurl; req outlives perform.
        setopt(CURLOPT_POST, 1L);
        setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body_.size()));
        setopt(CURLOPT_POSTFIELDS, req.body_.c_str());

        perform_throw(req.url_);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw http::http_error::TransportError(url, err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_type_ = std::move(last_content_type_);
        return r;
    }

}  // namespace http::client
