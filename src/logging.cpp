#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void init_logging(bool verbose) {
    auto logger = spdlog::get("autocommit");
    if (!logger) {
        logger = spdlog::stderr_color_mt("autocommit");
    }
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
