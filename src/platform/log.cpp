#include "fplaunch/log.hpp"

#include <spdlog/sinks/stdout_sinks.h>

namespace fplaunch {

spdlog::level::level_enum log_level_from(int verbosity, bool quiet,
                                         const std::optional<std::string>& debug_env) {
    if (debug_env && !debug_env->empty() && *debug_env != "0") {
        return spdlog::level::debug;
    }
    if (quiet) return spdlog::level::err;
    if (verbosity >= 2) return spdlog::level::debug;
    if (verbosity == 1) return spdlog::level::info;
    return spdlog::level::warn;
}

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("fplaunch");
    if (!logger) {
        logger = spdlog::stderr_logger_mt("fplaunch");
        logger->set_pattern("[fplaunch] %l: %v");
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);

    hook_logger()->set_level(level < spdlog::level::warn ? level : spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> hook_logger() {
    auto logger = spdlog::get("hook");
    if (!logger) {
        logger = spdlog::stderr_logger_mt("hook");
        logger->set_pattern("[fplaunch] hook %l: %v");
    }
    return logger;
}

} // namespace fplaunch
