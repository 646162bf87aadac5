#pragma once

#include "storage/record.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace kvtable::persistence {

// ── Segment metadata ─────────────────────────────────────────────────────────

struct SegmentMetadata {
    uint64_t segment_id    = 0;
    uint64_t last_sequence = 0;   // highest WAL sequence reflected in the segment
};

// ── Segment load result ──────────────────────────────────────────────────────

struct SegmentLoadResult {
    SegmentMetadata metadata;
    std::vector<Record> records;  // sorted by key
};

// ── Segment ──────────────────────────────────────────────────────────────────
//
// Immutable on-disk snapshot of a set of records.  JSON format:
//
//   {
//     "format": "kvtable-segment",
//     "format_version": 1,
//     "segment_id": <u64>,
//     "last_sequence": <u64>,
//     "records": [
//       {"key": "...", "value": "...", "version": <u64>,
//        "expires_at": <i64 ms since epoch> | null, "tombstone": <bool>},
//       ...
//     ]
//   }
//
// Keys and values that are not valid UTF-8 are written as "key_hex" /
// "value_hex" instead.  Records are written sorted by key.
//
// File path: <table_dir>/segment-<segment_id>.json
// Atomic write: write to .tmp, fsync, rename, fsync the directory.
//
// Thread-safety: static methods, no mutable state.

class Segment {
public:
    static constexpr const char* kFormat = "kvtable-segment";
    static constexpr int kFormatVersion = 1;
    static constexpr const char* kPrefix = "segment-";
    static constexpr const char* kSuffix = ".json";
    static constexpr const char* kTmpSuffix = ".tmp";

    // "segment-<id>.json"
    [[nodiscard]] static std::string filename(uint64_t segment_id);

    // Inverse of filename(); nullopt for anything else (including .tmp files).
    [[nodiscard]] static std::optional<uint64_t> parse_id(const std::string& filename);

    // Save a segment atomically to `path`.
    // Writes to `<path>.tmp` first, then renames.  On failure no file named
    // `path` appears and the temporary file is removed.
    [[nodiscard]] static std::error_code save(
        const std::filesystem::path& path,
        const std::vector<Record>& records,
        const SegmentMetadata& metadata);

    // Load a segment from `path`.
    // Validates the format tag and version; unreadable content yields
    // errc::segment_corruption.
    [[nodiscard]] static std::error_code load(
        const std::filesystem::path& path,
        SegmentLoadResult& result);

    // Ids of all segment files in `dir`, ascending (oldest first).
    [[nodiscard]] static std::error_code list(
        const std::filesystem::path& dir,
        std::vector<uint64_t>& ids);

    // Remove leftover `*.json.tmp` files from an interrupted write.
    static void remove_stale_temporaries(const std::filesystem::path& dir);

    // fsync a directory so a rename or unlink inside it is durable.
    [[nodiscard]] static std::error_code sync_directory(const std::filesystem::path& dir);
};

} // namespace kvtable::persistence
