#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "constants.hpp"
#include "string_utils.hpp"

namespace logging {
    std::shared_ptr<spdlog::logger> get() {
        static const std::shared_ptr<spdlog::logger> logger = [] {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_color(spdlog::level::debug, sink->green);
            sink->set_color(spdlog::level::warn, sink->yellow);
            sink->set_color(spdlog::level::err, sink->red);

            auto l = std::make_shared<spdlog::logger>(constants::LOGGER_NAME, std::move(sink));
            l->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ %^%-5l%$ [%n] %v", spdlog::pattern_time_type::utc);
            l->set_level(spdlog::level::info);
            return l;
        }();
        return logger;
    }

    spdlog::level::level_enum parse_level(std::string_view level) {
        const std::string normalized = string_utils::to_lower(string_utils::trim(std::string(level)));

        if (normalized == "trace") {
            return spdlog::level::trace;
        }
        if (normalized == "debug") {
            return spdlog::level::debug;
        }
        if (normalized == "info") {
            return spdlog::level::info;
        }
        if (normalized == "warn" || normalized == "warning") {
            return spdlog::level::warn;
        }
        if (normalized == "error") {
            return spdlog::level::err;
        }
        if (normalized == "off") {
            return spdlog::level::off;
        }

        throw std::runtime_error("Unknown log level: " + std::string(level));
    }

    void set_level(std::string_view level) { get()->set_level(parse_level(level)); }
}  // namespace logging
