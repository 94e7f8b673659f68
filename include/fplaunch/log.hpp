#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace fplaunch {

// ============================================================================
// Logging
// ============================================================================

// Level from -v/-q counts, raised to debug when FPWRAPPER_DEBUG is set to a
// non-empty value other than "0"
spdlog::level::level_enum log_level_from(int verbosity, bool quiet,
                                         const std::optional<std::string>& debug_env);

// Make a stderr logger printing "[fplaunch] <level>: <message>" the default
void init_logging(spdlog::level::level_enum level);

// Logger for hook diagnostics: "[fplaunch] hook <level>: <message>" on stderr
std::shared_ptr<spdlog::logger> hook_logger();

} // namespace fplaunch
