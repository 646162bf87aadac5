#include "storage/memstore.hpp"
#include "common/error.hpp"

#include <limits>
#include <mutex>
#include <shared_mutex>

namespace kvtable {

namespace {
// Per-entry bookkeeping estimate (map node + Record fields).
constexpr uint64_t kEntryOverhead = 64;
} // namespace

Memstore::Memstore(persistence::WAL& wal, const Clock& clock, VersionSource version_source)
    : wal_(wal), clock_(clock), version_source_(std::move(version_source)) {}

std::error_code Memstore::set(std::string key, std::string value,
                              std::optional<std::chrono::milliseconds> ttl,
                              uint64_t& version) {
    if (ttl && ttl->count() <= 0) {
        return make_error_code(errc::invalid_ttl);
    }

    Record rec;
    rec.key = std::move(key);
    rec.value = std::move(value);
    if (ttl) {
        const int64_t now = clock_.now_ms();
        // The expiry instant must be representable.
        if (now > 0 && ttl->count() > std::numeric_limits<int64_t>::max() - now) {
            return make_error_code(errc::invalid_ttl);
        }
        rec.expires_at = now + ttl->count();
    }
    return write(std::move(rec), version);
}

std::error_code Memstore::del(std::string key, uint64_t& version) {
    Record rec;
    rec.key = std::move(key);
    rec.tombstone = true;
    return write(std::move(rec), version);
}

std::error_code Memstore::write(Record rec, uint64_t& version) {
    // (a) next version: previous + 1, or 1 if the key was never seen.
    uint64_t previous = 0;
    if (auto existing = lookup(rec.key)) {
        previous = existing->version;
    } else if (version_source_) {
        previous = version_source_(rec.key);
    }
    rec.version = previous + 1;

    // (b) durability point.
    uint64_t sequence = 0;
    if (auto ec = wal_.append(rec, sequence)) {
        return ec;
    }

    // (c) visibility.
    version = rec.version;
    std::unique_lock lock(mutex_);
    last_sequence_ = sequence;
    install_locked(std::move(rec));
    return {};
}

std::optional<Record> Memstore::get(std::string_view key) const {
    auto rec = lookup(key);
    if (!rec || !rec->live(clock_.now_ms())) {
        return std::nullopt;
    }
    return rec;
}

std::optional<Record> Memstore::lookup(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Memstore::apply(Record rec, uint64_t sequence) {
    std::unique_lock lock(mutex_);
    if (sequence > last_sequence_) {
        last_sequence_ = sequence;
    }
    auto it = map_.find(rec.key);
    if (it != map_.end() && it->second.version >= rec.version) {
        return;
    }
    install_locked(std::move(rec));
}

void Memstore::install_locked(Record rec) {
    auto it = map_.find(rec.key);
    if (it != map_.end()) {
        bytes_ -= footprint(it->second);
        bytes_ += footprint(rec);
        it->second = std::move(rec);
        return;
    }
    bytes_ += footprint(rec);
    std::string key = rec.key;
    map_.emplace(std::move(key), std::move(rec));
}

std::vector<Record> Memstore::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<Record> result;
    result.reserve(map_.size());
    for (const auto& [_, rec] : map_) {
        result.push_back(rec);
    }
    return result;
}

void Memstore::clear() {
    std::unique_lock lock(mutex_);
    map_.clear();
    bytes_ = 0;
}

std::size_t Memstore::size() const {
    std::shared_lock lock(mutex_);
    return map_.size();
}

uint64_t Memstore::approximate_bytes() const {
    std::shared_lock lock(mutex_);
    return bytes_;
}

uint64_t Memstore::last_sequence() const {
    std::shared_lock lock(mutex_);
    return last_sequence_;
}

uint64_t Memstore::footprint(const Record& rec) noexcept {
    return kEntryOverhead + rec.key.size() + rec.value.size();
}

} // namespace kvtable
