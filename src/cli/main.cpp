#include "catalog/catalog.hpp"
#include "common/engine_config.hpp"
#include "common/logger.hpp"
#include "shell/executor.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    kvtable::EngineConfig cfg;
    try {
        cfg = kvtable::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    kvtable::init_default_logger(kvtable::parse_log_level(cfg.log_level));

    // ── Storage root ─────────────────────────────────────────────────────────
    kvtable::Catalog catalog(cfg);
    if (auto ec = catalog.init()) {
        spdlog::error("kvtable-shell: cannot use storage root {}: {}", cfg.root, ec.message());
        return 1;
    }

    spdlog::info("kvtable-shell started (root={}, memstore-flush-bytes={}, compaction-trigger={})",
                 cfg.root, cfg.memstore_flush_bytes, cfg.compaction_trigger);

    // ── REPL ─────────────────────────────────────────────────────────────────
    const bool interactive = isatty(STDIN_FILENO) != 0;
    if (interactive) {
        fprintf(stdout, "kvtable shell on %s. Type 'help' for commands, Ctrl+D to quit.\n",
                cfg.root.c_str());
    }

    kvtable::shell::Executor executor(catalog);
    std::string line;
    while (!executor.exit_requested()) {
        if (interactive) {
            const auto& ns = executor.session().current_namespace;
            fprintf(stdout, "%s> ", ns ? ns->c_str() : "kvtable");
            fflush(stdout);
        }

        if (!std::getline(std::cin, line)) {
            if (interactive) fprintf(stdout, "\n");
            break;
        }

        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        const std::string output = executor.run_line(line);
        fprintf(stdout, "%s\n", output.c_str());
        fflush(stdout);
    }

    spdlog::info("kvtable-shell exiting");
    return 0;
}
