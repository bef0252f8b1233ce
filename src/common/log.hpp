#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tunebox {

// Points spdlog's default logger at stderr so diagnostics never interleave
// with the interactive screen on stdout.
inline void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("tunebox");
    if (!logger) {
        logger = spdlog::stderr_color_st("tunebox");
        logger->set_pattern("[%n] %l: %v");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

} // namespace tunebox
