#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace kvtable {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (shell, catalog, early startup
// messages, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a per-table logger.
//   ns, table – embedded in every log line as [<ns>/<table>]
// The level follows the default logger's level.
std::shared_ptr<spdlog::logger> make_table_logger(const std::string& ns,
                                                  const std::string& table);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace kvtable
