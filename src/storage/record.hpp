#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace kvtable {

// ── Record ────────────────────────────────────────────────────────────────────
//
// The unit of data for one key.  The same struct travels through the WAL,
// the memstore and segment files.  A tombstone carries an empty value.

struct Record {
    std::string key;
    std::string value;
    uint64_t version = 0;
    std::optional<int64_t> expires_at;  // ms since Unix epoch; nullopt = never
    bool tombstone = false;

    // True once `now_ms` has reached the expiry instant.
    [[nodiscard]] bool expired(int64_t now_ms) const noexcept {
        return expires_at.has_value() && now_ms >= *expires_at;
    }

    // Visible to readers: neither deleted nor expired.
    [[nodiscard]] bool live(int64_t now_ms) const noexcept {
        return !tombstone && !expired(now_ms);
    }

    bool operator==(const Record&) const = default;
};

} // namespace kvtable
