#pragma once

#include "common/clock.hpp"
#include "storage/record.hpp"
#include "storage/segment_view.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace kvtable {

// ── CompactionResult ─────────────────────────────────────────────────────────

struct CompactionResult {
    // Id of the merged segment; nullopt when nothing survived the merge.
    std::optional<uint64_t> segment_id;
    std::shared_ptr<const LoadedSegment> output;

    // Inputs whose file could not be deleted.  They stay visible so reads
    // remain correct; the next compaction picks them up again.
    SegmentList retained;

    std::size_t records_in = 0;
    std::size_t records_out = 0;
};

// ── Compactor ────────────────────────────────────────────────────────────────
//
// Merges a table's segments into one.
//
//   1. Take the inputs oldest to newest.
//   2. Keep the highest-version record per key.
//   3. Drop tombstones and records expired at compaction time.
//   4. Write survivors to segment-<id>.json (tmp + fsync + rename).
//   5. Only then delete the inputs, oldest first.
//
// Deleting oldest first means that whatever subset survives a crash in step
// 5 is a recency suffix of the inputs, which never resurrects a value the
// merge shadowed.  With zero survivors no segment is written and the inputs
// are still retired.
//
// Never touches the memstore.  NOT thread-safe: the caller holds the
// table's exclusive mutex.

class Compactor {
public:
    Compactor(std::filesystem::path table_dir,
              const Clock& clock,
              std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::error_code compact(const SegmentList& inputs,
                                          uint64_t new_segment_id,
                                          CompactionResult& result);

    // Steps 2 and 3 as a pure function; output sorted by key.
    [[nodiscard]] static std::vector<Record> merge(const SegmentList& inputs, int64_t now_ms);

private:
    // Step 5.  Returns the inputs that could not be deleted.
    SegmentList retire(const SegmentList& inputs);

    std::filesystem::path table_dir_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace kvtable
