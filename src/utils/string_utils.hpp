//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef SAFE_RELAY_STRING_UTILS_HPP
#define SAFE_RELAY_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace string_utils {
    using QueryPairs = std::vector<std::pair<std::string, std::string>>;

    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    std::string percent_encode(std::string_view sv);

    std::string append_query(const std::string& url, const QueryPairs& pairs);

    std::string preview(std::string_view body, size_t max_length);
}  // namespace string_utils

#endif
