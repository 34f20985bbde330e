//
// Created by Daniel Griffiths on 11/1/25.
//

#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // RFC 3986 unreserved characters pass through, everything else is %XX
    std::string percent_encode(std::string_view sv) {
        static constexpr std::array<char, 16> HEX = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

        std::string out;
        out.reserve(sv.size());
        for (const unsigned char c : sv) {
            if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('%');
                out.push_back(HEX[c >> 4]);
                out.push_back(HEX[c & 0x0F]);
            }
        }
        return out;
    }

    std::string append_query(const std::string &url, const QueryPairs &pairs) {
        if (pairs.empty()) {
            return url;
        }

        std::string out = url;
        char separator = url.find('?') == std::string::npos ? '?' : '&';
        for (const auto &[key, value] : pairs) {
            out.push_back(separator);
            out += percent_encode(key);
            out.push_back('=');
            out += percent_encode(value);
            separator = '&';
        }
        return out;
    }

    std::string preview(std::string_view body, size_t max_length) {
        if (body.size() <= max_length) {
            return std::string(body);
        }
        return std::string(body.substr(0, max_length)) + "...";
    }
}  // namespace string_utils
