#include "common/engine_config.hpp"

#include <array>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace kvtable {

namespace {

constexpr std::array<const char*, 7> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// Validate the fully populated EngineConfig.
void validate(const EngineConfig& cfg) {
    if (cfg.root.empty()) {
        throw std::runtime_error("--root must not be empty");
    }

    const bool known_level = std::any_of(
        kLogLevels.begin(), kLogLevels.end(),
        [&](const char* l) { return cfg.log_level == l; });
    if (!known_level) {
        throw std::runtime_error(
            fmt::format("--log-level must be one of trace|debug|info|warn|error|critical|off, got '{}'",
                        cfg.log_level));
    }

    if (cfg.compaction_trigger == 1) {
        throw std::runtime_error("--compaction-trigger must be 0 (off) or >= 2");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("root,r",
            po::value<std::string>()->default_value("./kvstore"),
            "Storage root directory; one subdirectory per namespace")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("memstore-flush-bytes",
            po::value<uint64_t>()->default_value(1024 * 1024),
            "Flush a table automatically once its memstore exceeds this size (0 = never)")
        ("compaction-trigger",
            po::value<uint32_t>()->default_value(0),
            "Compact a table automatically once it has this many segments (0 = never)");
}

// ── parse_config ──────────────────────────────────────────────────────────────

EngineConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("kvtable-shell options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    EngineConfig cfg;
    cfg.root                 = vm["root"].as<std::string>();
    cfg.log_level            = vm["log-level"].as<std::string>();
    cfg.memstore_flush_bytes = vm["memstore-flush-bytes"].as<uint64_t>();
    cfg.compaction_trigger   = vm["compaction-trigger"].as<uint32_t>();

    validate(cfg);
    return cfg;
}

} // namespace kvtable
