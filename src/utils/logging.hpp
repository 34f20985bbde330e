#ifndef SAFE_RELAY_LOGGING_HPP
#define SAFE_RELAY_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace logging {
    // Process-wide "safe_relay" logger on a colored stderr sink.
    std::shared_ptr<spdlog::logger> get();

    spdlog::level::level_enum parse_level(std::string_view level);

    void set_level(std::string_view level);
}  // namespace logging

#endif
