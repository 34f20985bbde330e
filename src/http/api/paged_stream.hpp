#ifndef SAFE_RELAY_PAGED_STREAM_HPP
#define SAFE_RELAY_PAGED_STREAM_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../../safe/types/responses.hpp"
#include "../../utils/logging.hpp"
#include "../model/model.hpp"

namespace http::safe_api {
    // Lazy, forward-only sequence over a paginated list endpoint. The first
    // request goes out on the first next(); afterwards each `next` link is
    // requested verbatim until the service stops returning one. A failed page
    // ends the stream, records already handed out stay valid. Not restartable.
    // The fetcher keeps its own handle on the transport, so a stream may
    // outlive the SafeAPI that created it.
    template <typename T>
    class PagedStream {
       public:
        using Page = safe::types::Paginated<T>;
        using Fetcher = std::function<Page(const http::model::Request&)>;
        using Follower = std::function<http::model::Request(const std::string&)>;

        PagedStream(http::model::Request first, Fetcher fetch, Follower follow)
            : pending_(std::move(first)), fetch_(std::move(fetch)), follow_(std::move(follow)) {}

        std::optional<T> next() {
            while (buffer_.empty() && pending_) {
                const http::model::Request req = std::move(*pending_);
                pending_.reset();

                if (pages_fetched_ > 0) {
                    logging::get()->debug("Successive page {} from {}", pages_fetched_ + 1, req.url_);
                }

                Page page = fetch_(req);
                ++pages_fetched_;

                // Resolve the continuation first so a bad link drops the whole page.
                std::optional<http::model::Request> follow_up;
                if (page.next_) {
                    follow_up = follow_(*page.next_);
                }

                for (auto& item : page.results_) {
                    buffer_.push_back(std::move(item));
                }
                pending_ = std::move(follow_up);
            }

            if (buffer_.empty()) {
                return std::nullopt;
            }

            T out = std::move(buffer_.front());
            buffer_.pop_front();
            return out;
        }

        std::vector<T> collect() {
            std::vector<T> out;
            while (auto item = next()) {
                out.push_back(std::move(*item));
            }
            return out;
        }

        [[nodiscard]] bool exhausted() const { return buffer_.empty() && !pending_; }

        [[nodiscard]] std::size_t pages_fetched() const { return pages_fetched_; }

       private:
        std::optional<http::model::Request> pending_;
        std::deque<T> buffer_;
        Fetcher fetch_;
        Follower follow_;
        std::size_t pages_fetched_ = 0;
    };
}  // namespace http::safe_api

#endif
