#include "storage/table.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "persistence/segment.hpp"

#include <algorithm>

namespace kvtable {

Table::Table(std::string ns, std::string name, std::filesystem::path dir,
             const Clock& clock, TableOptions options)
    : ns_(std::move(ns)),
      name_(std::move(name)),
      dir_(std::move(dir)),
      clock_(clock),
      options_(options),
      logger_(make_table_logger(ns_, name_)),
      wal_(dir_ / kWalFilename),
      memstore_(wal_, clock_,
                [this](const std::string& key) { return view()->max_version(key); }),
      flusher_(dir_, logger_),
      compactor_(dir_, clock_, logger_),
      view_(std::make_shared<SegmentView>()) {}

Table::~Table() {
    wal_.close();
}

// ── open ─────────────────────────────────────────────────────────────────────

std::error_code Table::open() {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
        return make_error_code(errc::table_not_found);
    }

    // Leftovers from a flush / compaction / rotation that never renamed.
    persistence::Segment::remove_stale_temporaries(dir_);
    auto wal_tmp = dir_ / kWalFilename;
    wal_tmp += ".tmp";
    std::filesystem::remove(wal_tmp, ec);

    SegmentList segments;
    if (auto load_ec = load_segments(segments)) {
        return load_ec;
    }
    publish(std::make_shared<SegmentView>(std::move(segments)));
    auto current = view();
    next_segment_id_ = current->max_id() + 1;

    uint64_t last_sequence = 0;
    if (auto wal_ec = recover_wal(current->last_sequence(), last_sequence)) {
        return wal_ec;
    }

    if (auto open_ec = wal_.open()) {
        logger_->error("open: cannot open {}: {}", wal_.path().string(), open_ec.message());
        return open_ec;
    }
    wal_.set_next_sequence(last_sequence + 1);

    logger_->info("open: {} segments, {} memstore records, next sequence {}",
                  current->size(), memstore_.size(), last_sequence + 1);
    return {};
}

std::error_code Table::load_segments(SegmentList& segments) {
    std::vector<uint64_t> ids;
    if (auto ec = persistence::Segment::list(dir_, ids)) {
        logger_->error("open: cannot list {}: {}", dir_.string(), ec.message());
        return ec;
    }

    for (uint64_t id : ids) {
        std::shared_ptr<const LoadedSegment> seg;
        const auto path = dir_ / persistence::Segment::filename(id);
        if (auto ec = LoadedSegment::load(path, seg)) {
            logger_->error("open: segment {} unusable: {}", path.filename().string(), ec.message());
            return make_error_code(errc::segment_corruption);
        }
        segments.push_back(std::move(seg));
    }
    return {};
}

std::error_code Table::recover_wal(uint64_t covered_sequence, uint64_t& last_sequence) {
    last_sequence = covered_sequence;

    const auto path = dir_ / kWalFilename;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {};
    }

    persistence::WalReplayResult replay;
    if (auto replay_ec = persistence::WAL::replay(path, replay)) {
        logger_->error("open: WAL replay failed: {}", replay_ec.message());
        return replay_ec;
    }

    if (replay.anomaly) {
        recovered_from_corrupt_wal_ = true;
        logger_->warn("open: {}; keeping {} well-formed entries ({} bytes)",
                      replay.anomaly.message(), replay.entries.size(), replay.valid_bytes);
        if (replay.valid_bytes < persistence::kWalHeaderSize) {
            std::filesystem::remove(path, ec);
        } else {
            ec = persistence::WAL::truncate_file(path, replay.valid_bytes);
        }
        if (ec) {
            logger_->error("open: cannot cut corrupt WAL tail: {}", ec.message());
            return ec;
        }
    }

    std::size_t applied = 0;
    for (auto& entry : replay.entries) {
        last_sequence = std::max(last_sequence, entry.sequence);
        if (entry.sequence <= covered_sequence) {
            continue;  // already in a segment
        }
        memstore_.apply(std::move(entry.record), entry.sequence);
        ++applied;
    }

    logger_->info("open: replayed {} of {} WAL entries (covered up to sequence {})",
                  applied, replay.entries.size(), covered_sequence);

    // Everything in the log is already in a segment: start a clean one.
    if (applied == 0 && !replay.entries.empty()) {
        if (auto open_ec = wal_.open()) return open_ec;
        if (auto rot_ec = wal_.rotate()) {
            logger_->warn("open: could not rotate fully covered WAL: {}", rot_ec.message());
        }
        wal_.close();
    }
    return {};
}

// ── writes ───────────────────────────────────────────────────────────────────

std::error_code Table::set(std::string key, std::string value,
                           std::optional<std::chrono::milliseconds> ttl,
                           uint64_t& version) {
    std::lock_guard lock(mutex_);
    if (auto ec = memstore_.set(std::move(key), std::move(value), ttl, version)) {
        return ec;
    }
    logger_->debug("set v{}", version);
    maybe_flush_locked();
    return {};
}

std::error_code Table::del(std::string key, uint64_t& version) {
    std::lock_guard lock(mutex_);
    if (auto ec = memstore_.del(std::move(key), version)) {
        return ec;
    }
    logger_->debug("delete v{}", version);
    maybe_flush_locked();
    return {};
}

void Table::maybe_flush_locked() {
    if (options_.memstore_flush_bytes == 0 ||
        memstore_.approximate_bytes() < options_.memstore_flush_bytes) {
        return;
    }
    std::optional<uint64_t> segment_id;
    if (auto ec = flush_locked(segment_id)) {
        // The write itself is durable in the WAL; the next write retries.
        logger_->warn("automatic flush failed: {}", ec.message());
    }
}

// ── reads ────────────────────────────────────────────────────────────────────

std::optional<Record> Table::get(std::string_view key) const {
    const int64_t now = clock_.now_ms();

    // The memstore always holds the newest version of a key it knows.
    if (auto rec = memstore_.lookup(key)) {
        if (!rec->live(now)) return std::nullopt;
        return rec;
    }

    auto rec = view()->newest(key);
    if (!rec || !rec->live(now)) {
        return std::nullopt;
    }
    return rec;
}

// ── flush / compact ──────────────────────────────────────────────────────────

std::error_code Table::flush(std::optional<uint64_t>& segment_id) {
    std::lock_guard lock(mutex_);
    return flush_locked(segment_id);
}

std::error_code Table::compact(std::optional<uint64_t>& segment_id) {
    std::lock_guard lock(mutex_);
    return compact_locked(segment_id);
}

std::error_code Table::flush_locked(std::optional<uint64_t>& segment_id) {
    auto ec = flusher_.flush(
        memstore_, wal_, next_segment_id_,
        [this](std::shared_ptr<const LoadedSegment> seg) { publish(view()->with(std::move(seg))); },
        segment_id);
    if (ec || !segment_id) {
        return ec;
    }
    next_segment_id_ = *segment_id + 1;

    if (options_.compaction_trigger > 0 && view()->size() >= options_.compaction_trigger) {
        std::optional<uint64_t> compacted;
        if (auto cec = compact_locked(compacted)) {
            logger_->warn("automatic compaction failed: {}", cec.message());
        }
    }
    return {};
}

std::error_code Table::compact_locked(std::optional<uint64_t>& segment_id) {
    segment_id.reset();

    auto current = view();
    if (current->empty()) {
        return {};
    }

    CompactionResult result;
    if (auto ec = compactor_.compact(current->segments(), next_segment_id_, result)) {
        return ec;
    }

    SegmentList next = std::move(result.retained);
    if (result.output) {
        next.push_back(result.output);
    }
    publish(std::make_shared<SegmentView>(std::move(next)));

    segment_id = result.segment_id;
    if (segment_id) {
        next_segment_id_ = *segment_id + 1;
    }
    return {};
}

// ── view ─────────────────────────────────────────────────────────────────────

std::shared_ptr<const SegmentView> Table::view() const {
    std::lock_guard lock(view_mutex_);
    return view_;
}

void Table::publish(std::shared_ptr<const SegmentView> next) {
    std::lock_guard lock(view_mutex_);
    view_ = std::move(next);
}

TableStats Table::stats() const {
    std::lock_guard lock(mutex_);
    TableStats s;
    s.memstore_records = memstore_.size();
    s.memstore_bytes = memstore_.approximate_bytes();
    s.segment_ids = view()->ids();
    s.next_sequence = wal_.next_sequence();
    s.recovered_from_corrupt_wal = recovered_from_corrupt_wal_;
    return s;
}

} // namespace kvtable
