#pragma once

#include "common/clock.hpp"
#include "common/engine_config.hpp"
#include "storage/table.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace kvtable {

// ── Session ───────────────────────────────────────────────────────────────────
//
// Per-caller selection state.  The catalog itself holds no current
// namespace; every key operation is resolved against the session passed in.

struct Session {
    std::optional<std::string> current_namespace;
};

// Outcome of an open-or-create call.
enum class OpenOutcome : uint8_t {
    Created,
    OpenedExisting,
};

// ── Qualified keys ───────────────────────────────────────────────────────────
//
//   "table:key"         → {table, key}
//   "table:key:value"   → {table, key} + value (value may contain ':')

struct QualifiedKey {
    std::string table;
    std::string key;
};

[[nodiscard]] std::error_code parse_qualified_key(std::string_view text, QualifiedKey& out);

[[nodiscard]] std::error_code parse_qualified_set(std::string_view text,
                                                  QualifiedKey& out,
                                                  std::string& value);

// Namespace and table names: 1..255 bytes of [A-Za-z0-9_.-], not "." / "..".
[[nodiscard]] bool is_valid_name(std::string_view name);

// ── Catalog ──────────────────────────────────────────────────────────────────
//
// Maps <root>/<namespace>/<table> directories to live Table instances.
// Tables are opened (and their WAL replayed) lazily on first access and stay
// open for the catalog's lifetime.
//
// Thread-safe.  The catalog mutex only guards the open-table map; operations
// on different tables never wait on each other.

class Catalog {
public:
    explicit Catalog(std::filesystem::path root,
                     const Clock& clock = SystemClock::instance(),
                     TableOptions table_options = {});

    explicit Catalog(const EngineConfig& cfg,
                     const Clock& clock = SystemClock::instance());

    Catalog(const Catalog&)            = delete;
    Catalog& operator=(const Catalog&) = delete;

    // Create the storage root if needed.
    [[nodiscard]] std::error_code init();

    // ── Namespaces ───────────────────────────────────────────────────────────

    [[nodiscard]] std::error_code create_namespace(const std::string& name);
    [[nodiscard]] std::error_code open_or_create_namespace(const std::string& name,
                                                           OpenOutcome& outcome);
    [[nodiscard]] std::error_code use_namespace(Session& session, const std::string& name) const;
    [[nodiscard]] std::error_code list_namespaces(std::vector<std::string>& names) const;
    [[nodiscard]] bool namespace_exists(const std::string& name) const;

    // ── Tables ───────────────────────────────────────────────────────────────

    [[nodiscard]] std::error_code create_table(const std::string& ns, const std::string& name);
    [[nodiscard]] std::error_code open_or_create_table(const std::string& ns,
                                                       const std::string& name,
                                                       OpenOutcome& outcome);
    [[nodiscard]] std::error_code list_tables(const std::string& ns,
                                              std::vector<std::string>& names) const;

    // Resolve and (lazily) open a table.
    [[nodiscard]] std::error_code table(const std::string& ns,
                                        const std::string& name,
                                        std::shared_ptr<Table>& out);

    // ── Key operations (against the session's namespace) ─────────────────────

    [[nodiscard]] std::error_code set(const Session& session,
                                      std::string_view qualified_key,
                                      std::string value,
                                      std::optional<std::chrono::milliseconds> ttl,
                                      uint64_t& version);

    // errc::key_not_found when absent, deleted or expired.
    [[nodiscard]] std::error_code get(const Session& session,
                                      std::string_view qualified_key,
                                      std::string& value);

    [[nodiscard]] std::error_code del(const Session& session,
                                      std::string_view qualified_key,
                                      uint64_t& version);

    [[nodiscard]] std::error_code flush(const Session& session,
                                        const std::string& table,
                                        std::optional<uint64_t>& segment_id);

    [[nodiscard]] std::error_code compact(const Session& session,
                                          const std::string& table,
                                          std::optional<uint64_t>& segment_id);

    [[nodiscard]] std::error_code table_stats(const Session& session,
                                              const std::string& table,
                                              TableStats& stats);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    [[nodiscard]] std::error_code resolve(const Session& session,
                                          const std::string& table,
                                          std::shared_ptr<Table>& out);

    [[nodiscard]] std::filesystem::path namespace_dir(const std::string& ns) const {
        return root_ / ns;
    }

    std::filesystem::path root_;
    const Clock& clock_;
    TableOptions table_options_;

    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<Table>> open_tables_;
};

} // namespace kvtable
