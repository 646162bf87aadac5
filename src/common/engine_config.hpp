#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace kvtable {

// ── EngineConfig ──────────────────────────────────────────────────────────────
// Runtime configuration for one storage root.
// Populated by parse_config() from CLI arguments; tests build it directly.

struct EngineConfig {
    std::string root = "./kvstore";           // Storage root (namespaces live here)
    std::string log_level = "warn";           // spdlog level string
    uint64_t    memstore_flush_bytes = 1024 * 1024;  // Auto-flush threshold, 0 = off
    uint32_t    compaction_trigger = 0;       // Auto-compact at N segments, 0 = off
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into an EngineConfig.
//
// On success: returns a fully validated EngineConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, carrying the option summary as message.
//
// Validates:
//   - root is non-empty
//   - log level is one of trace|debug|info|warn|error|critical|off
//   - compaction_trigger is 0 or >= 2 (compacting a single segment is
//     only useful on demand)

[[nodiscard]] EngineConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with engine options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace kvtable
