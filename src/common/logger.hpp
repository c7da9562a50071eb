#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace recdb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (CLI, tools, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a logger for one store file.
//   name   – embedded in every log line as [<name>], usually the file stem
//   level  – initial log level
std::shared_ptr<spdlog::logger> make_store_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace recdb
