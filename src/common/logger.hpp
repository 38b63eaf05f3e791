#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace sluice {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (CLI, early startup messages, tests).
// Call once at program start before any logging.  Safe to call again: an
// existing "sluice" logger is reused and only its level is updated.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named component logger, e.g.
// "pool" or "engine".  Every line carries the name as [<name>].
std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace sluice
