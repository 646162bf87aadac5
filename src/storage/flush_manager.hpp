#pragma once

#include "persistence/wal.hpp"
#include "storage/memstore.hpp"
#include "storage/segment_view.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

namespace kvtable {

// ── FlushManager ─────────────────────────────────────────────────────────────
//
// Drains a table's memstore into one new segment file and rotates its WAL.
//
//   1. Snapshot the memstore (tombstones and expired records included).
//   2. Write segment-<id>.json via tmp + fsync + rename.
//   3. Rotate the WAL.  If this fails the new segment is deleted again.
//   4. Publish the segment to readers, then clear the memstore.
//
// On failure before step 4 the memstore and WAL are untouched and the error
// is errc::segment_write_failure.
//
// NOT thread-safe: the caller holds the table's exclusive mutex.

class FlushManager {
public:
    using Publish = std::function<void(std::shared_ptr<const LoadedSegment>)>;

    FlushManager(std::filesystem::path table_dir,
                 std::shared_ptr<spdlog::logger> logger);

    // `segment_id` receives the new segment's id, or nullopt when the
    // memstore was empty (nothing is written in that case).
    [[nodiscard]] std::error_code flush(Memstore& memstore,
                                        persistence::WAL& wal,
                                        uint64_t new_segment_id,
                                        const Publish& publish,
                                        std::optional<uint64_t>& segment_id);

private:
    std::filesystem::path table_dir_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace kvtable
