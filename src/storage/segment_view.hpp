#pragma once

#include "persistence/segment.hpp"
#include "storage/record.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace kvtable {

// ── LoadedSegment ────────────────────────────────────────────────────────────
//
// A segment file held in memory.  Immutable once built; shared between the
// current SegmentView and any reader still holding an older view.

struct LoadedSegment {
    persistence::SegmentMetadata metadata;
    std::filesystem::path path;
    std::vector<Record> records;  // sorted by key

    [[nodiscard]] uint64_t id() const noexcept { return metadata.segment_id; }

    // Binary search by key; nullptr if the segment has no record for it.
    [[nodiscard]] const Record* find(std::string_view key) const;

    // Read and decode `path`.
    [[nodiscard]] static std::error_code load(const std::filesystem::path& path,
                                              std::shared_ptr<const LoadedSegment>& out);
};

using SegmentList = std::vector<std::shared_ptr<const LoadedSegment>>;

// ── SegmentView ──────────────────────────────────────────────────────────────
//
// The set of segments visible to readers at one instant, oldest first.
// Flush and compaction never modify a view; they build a new one and swap
// it in, so a reader that grabbed a view keeps a consistent picture.

class SegmentView {
public:
    SegmentView() = default;
    explicit SegmentView(SegmentList segments);

    // Highest-version record for `key` across all segments (tombstones and
    // expired records included), or nullopt.
    [[nodiscard]] std::optional<Record> newest(std::string_view key) const;

    // Version of newest(key), 0 if none.
    [[nodiscard]] uint64_t max_version(std::string_view key) const;

    // Highest WAL sequence covered by any segment.
    [[nodiscard]] uint64_t last_sequence() const noexcept;

    [[nodiscard]] uint64_t max_id() const noexcept;

    [[nodiscard]] std::vector<uint64_t> ids() const;

    [[nodiscard]] const SegmentList& segments() const noexcept { return segments_; }
    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }

    // New view with `seg` appended (it must be the newest).
    [[nodiscard]] std::shared_ptr<const SegmentView> with(std::shared_ptr<const LoadedSegment> seg) const;

private:
    const Record* find_newest(std::string_view key) const;

    SegmentList segments_;
};

} // namespace kvtable
