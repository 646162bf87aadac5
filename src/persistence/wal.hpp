#pragma once

#include "storage/record.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace kvtable::persistence {

// ── WAL record types ─────────────────────────────────────────────────────────

static constexpr uint8_t kRecordTypeEntry = 0x02;

// Entry flag bits.
static constexpr uint8_t kFlagTombstone = 0x01;
static constexpr uint8_t kFlagHasExpiry = 0x02;

// ── WAL header constants ─────────────────────────────────────────────────────

static constexpr char kWalMagic[] = "KVTWAL";         // 6 bytes (no NUL)
static constexpr std::size_t kWalMagicSize = 6;
static constexpr uint16_t kWalVersion = 1;
static constexpr std::size_t kWalHeaderSize = kWalMagicSize + sizeof(uint16_t);

// ── Log entry ────────────────────────────────────────────────────────────────
//
// [type: u8 = 0x02][total_length: u32 LE][seq: u64 LE][version: u64 LE]
// [flags: u8][expires_at: i64 LE][key_len: u16 LE][key]
// [value_len: u32 LE][value][crc32: u32 LE]
//
// total_length covers seq through value.  CRC covers type through value.

struct WalEntry {
    uint64_t sequence = 0;
    Record record;
};

// ── Replay result ────────────────────────────────────────────────────────────
//
// `anomaly` is set to errc::wal_corruption when the file ends in a truncated
// or damaged entry.  `entries` then holds the well-formed prefix and
// `valid_bytes` is the file offset just past its last entry.

struct WalReplayResult {
    std::vector<WalEntry> entries;
    std::error_code anomaly;
    uint64_t valid_bytes = 0;
};

// ── Write-Ahead Log ──────────────────────────────────────────────────────────
//
// Append-only binary file, one per table. Every append is fdatasync'ed
// before it returns.
// Thread-safety: NOT thread-safe. Caller must serialise access (table mutex).

class WAL {
public:
    explicit WAL(const std::filesystem::path& path);
    ~WAL();

    // Non-copyable, non-movable.
    WAL(const WAL&) = delete;
    WAL& operator=(const WAL&) = delete;
    WAL(WAL&&) = delete;
    WAL& operator=(WAL&&) = delete;

    // Opens the WAL file. Creates it with a fresh header if it doesn't exist.
    [[nodiscard]] std::error_code open();

    void close();

    // Append a record under the next sequence number and fdatasync.
    // `sequence` receives the number assigned to the entry.  On failure the
    // file is left exactly as it was before the call.
    [[nodiscard]] std::error_code append(const Record& rec, uint64_t& sequence);

    // Read every entry from the WAL file at `path`.
    // Returns an error only when the file cannot be read or its header names
    // a different format; a damaged tail is reported via result.anomaly.
    [[nodiscard]] static std::error_code replay(
        const std::filesystem::path& path,
        WalReplayResult& result);

    // Cut the file at `path` down to `size` bytes (used to drop a corrupt
    // tail found by replay).  The WAL must not be open.
    [[nodiscard]] static std::error_code truncate_file(
        const std::filesystem::path& path,
        uint64_t size);

    // Replace the log with an empty one (header only).  Used once the
    // entries are durably reflected in a segment.  Sequence numbering
    // continues where it was.
    //
    // The replacement is opened before it is renamed over the log, so the
    // rename is the last step that can fail: on error the current log is
    // untouched and still open; on success the WAL appends to the new file.
    [[nodiscard]] std::error_code rotate();

    // Sequence number the next append will receive.
    void set_next_sequence(uint64_t seq) noexcept { next_sequence_ = seq; }
    [[nodiscard]] uint64_t next_sequence() const noexcept { return next_sequence_; }

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    // Write raw bytes to the file and fdatasync.
    [[nodiscard]] std::error_code write_bytes(const std::vector<uint8_t>& data);

    [[nodiscard]] std::error_code write_header();

    [[nodiscard]] static std::error_code validate_header(int fd);

    // Cut the file back to `size` after a failed append.  If that fails too
    // the WAL is poisoned: appends are refused until the next rotate().
    void discard_tail(int64_t size);

    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t next_sequence_ = 1;
    bool poisoned_ = false;
};

// ── CRC32 utility ────────────────────────────────────────────────────────────

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── Serialisation helpers ────────────────────────────────────────────────────

// Serialise one entry to bytes (including type byte and CRC).
[[nodiscard]] std::vector<uint8_t> serialise_entry(const WalEntry& entry);

} // namespace kvtable::persistence
