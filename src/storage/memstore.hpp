#pragma once

#include "common/clock.hpp"
#include "persistence/wal.hpp"
#include "storage/record.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kvtable {

// ── Memstore ─────────────────────────────────────────────────────────────────
//
// Per-table in-memory map from key to its most recent Record.
//
// Write path (set / del): compute the next version, append to the WAL, then
// apply to the map.  An entry becomes visible only after its WAL append has
// returned successfully.
//
// Concurrency model:
//   - get() / lookup() / snapshot() / size() acquire a shared (read) lock.
//   - the map update of set() / del() / apply() / clear() takes an exclusive
//     lock.
//   - set() / del() themselves must be serialised by the caller (the owning
//     table's mutex), as they share the WAL.
class Memstore {
public:
    // Version of the newest on-disk record for `key`, 0 if none.  Consulted
    // when the memstore holds no entry for the key.
    using VersionSource = std::function<uint64_t(const std::string& key)>;

    Memstore(persistence::WAL& wal, const Clock& clock, VersionSource version_source = {});

    Memstore(const Memstore&)            = delete;
    Memstore& operator=(const Memstore&) = delete;

    // Write `value` under `key`.  `ttl`, when given, must be positive and is
    // turned into an absolute expiry instant now.  `version` receives the
    // version assigned to the write.
    [[nodiscard]] std::error_code set(std::string key, std::string value,
                                      std::optional<std::chrono::milliseconds> ttl,
                                      uint64_t& version);

    // Write a tombstone for `key`.
    [[nodiscard]] std::error_code del(std::string key, uint64_t& version);

    // Live record for `key`: nullopt if absent, tombstoned or expired.
    [[nodiscard]] std::optional<Record> get(std::string_view key) const;

    // Raw record for `key`, tombstones and expired entries included.
    [[nodiscard]] std::optional<Record> lookup(std::string_view key) const;

    // Install a record recovered from the WAL without logging it again.
    // Ignored if the memstore already holds a newer version of the key.
    void apply(Record rec, uint64_t sequence);

    // Point-in-time copy of every record, ordered by key.
    [[nodiscard]] std::vector<Record> snapshot() const;

    // Removes all entries.  The sequence watermark is kept.
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    // Rough heap footprint of the stored records, for the auto-flush policy.
    [[nodiscard]] uint64_t approximate_bytes() const;

    // Highest WAL sequence whose record has been applied.
    [[nodiscard]] uint64_t last_sequence() const;

private:
    [[nodiscard]] std::error_code write(Record rec, uint64_t& version);

    // Caller holds mutex_ (exclusively).
    void install_locked(Record rec);

    [[nodiscard]] static uint64_t footprint(const Record& rec) noexcept;

    persistence::WAL& wal_;
    const Clock& clock_;
    VersionSource version_source_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Record, std::less<>> map_;
    uint64_t bytes_ = 0;
    uint64_t last_sequence_ = 0;
};

} // namespace kvtable
