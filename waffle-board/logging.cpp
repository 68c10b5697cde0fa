#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "logging.hpp"

std::shared_ptr<spdlog::logger> waffle_logger() {
    auto logger = spdlog::get("waffle");
    if (!logger) {
        logger = spdlog::stderr_color_mt("waffle");
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    return logger;
}

void set_log_level(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    waffle_logger()->set_level(parsed);
}
