#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace kvcache {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (for components that are not handed a
// logger of their own: tools, early startup messages, tests).
// Safe to call again: later calls only change the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named cache logger.
//   name   – embedded in every log line as [<name>]
//   level  – initial log level
// This is the sink a host hands to a cache backend.
std::shared_ptr<spdlog::logger> make_cache_logger(
    const std::string& name = "cache",
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// "warning" and "err" are accepted as aliases.
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace kvcache
