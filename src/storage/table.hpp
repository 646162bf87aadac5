#pragma once

#include "common/clock.hpp"
#include "persistence/wal.hpp"
#include "storage/compactor.hpp"
#include "storage/flush_manager.hpp"
#include "storage/memstore.hpp"
#include "storage/record.hpp"
#include "storage/segment_view.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kvtable {

// ── TableOptions ─────────────────────────────────────────────────────────────

struct TableOptions {
    uint64_t memstore_flush_bytes = 0;  // auto-flush threshold, 0 = off
    uint32_t compaction_trigger = 0;    // auto-compact at N segments, 0 = off
};

// ── TableStats ───────────────────────────────────────────────────────────────

struct TableStats {
    std::size_t memstore_records = 0;
    uint64_t memstore_bytes = 0;
    std::vector<uint64_t> segment_ids;  // oldest first
    uint64_t next_sequence = 0;
    bool recovered_from_corrupt_wal = false;
};

// ── Table ────────────────────────────────────────────────────────────────────
//
// Live engine state of one table directory:
//
//   <dir>/wal.log              write-ahead log
//   <dir>/segment-<id>.json    immutable segments, oldest to newest by id
//
// Concurrency model:
//   - set() / del() / flush() / compact() serialise on one exclusive mutex.
//   - get() takes no table lock.  It reads the memstore under its shared
//     lock, then the current SegmentView (an immutable snapshot swapped in
//     after each flush or compaction).

class Table {
public:
    Table(std::string ns, std::string name, std::filesystem::path dir,
          const Clock& clock, TableOptions options = {});
    ~Table();

    Table(const Table&)            = delete;
    Table& operator=(const Table&) = delete;

    // Load segments and replay the WAL into a fresh memstore.  A damaged WAL
    // tail is dropped with a warning; unreadable segments fail the open.
    [[nodiscard]] std::error_code open();

    [[nodiscard]] std::error_code set(std::string key, std::string value,
                                      std::optional<std::chrono::milliseconds> ttl,
                                      uint64_t& version);

    [[nodiscard]] std::error_code del(std::string key, uint64_t& version);

    // Authoritative live record for `key`, or nullopt if absent, deleted or
    // expired.
    [[nodiscard]] std::optional<Record> get(std::string_view key) const;

    // `segment_id` is nullopt when there was nothing to write.
    [[nodiscard]] std::error_code flush(std::optional<uint64_t>& segment_id);
    [[nodiscard]] std::error_code compact(std::optional<uint64_t>& segment_id);

    [[nodiscard]] TableStats stats() const;

    [[nodiscard]] const std::string& ns() const noexcept { return ns_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

    static constexpr const char* kWalFilename = "wal.log";

private:
    [[nodiscard]] std::error_code load_segments(SegmentList& segments);
    [[nodiscard]] std::error_code recover_wal(uint64_t covered_sequence, uint64_t& last_sequence);

    // Caller holds mutex_.
    [[nodiscard]] std::error_code flush_locked(std::optional<uint64_t>& segment_id);
    [[nodiscard]] std::error_code compact_locked(std::optional<uint64_t>& segment_id);
    void maybe_flush_locked();

    [[nodiscard]] std::shared_ptr<const SegmentView> view() const;
    void publish(std::shared_ptr<const SegmentView> next);

    std::string ns_;
    std::string name_;
    std::filesystem::path dir_;
    const Clock& clock_;
    TableOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    persistence::WAL wal_;
    Memstore memstore_;
    FlushManager flusher_;
    Compactor compactor_;

    mutable std::mutex mutex_;       // mutation domain
    mutable std::mutex view_mutex_;  // guards view_ pointer only
    std::shared_ptr<const SegmentView> view_;

    uint64_t next_segment_id_ = 1;
    bool recovered_from_corrupt_wal_ = false;
};

} // namespace kvtable
