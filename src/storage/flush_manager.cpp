#include "storage/flush_manager.hpp"
#include "common/error.hpp"
#include "persistence/segment.hpp"

namespace kvtable {

FlushManager::FlushManager(std::filesystem::path table_dir,
                           std::shared_ptr<spdlog::logger> logger)
    : table_dir_(std::move(table_dir)), logger_(std::move(logger)) {}

std::error_code FlushManager::flush(Memstore& memstore,
                                    persistence::WAL& wal,
                                    uint64_t new_segment_id,
                                    const Publish& publish,
                                    std::optional<uint64_t>& segment_id) {
    segment_id.reset();

    auto records = memstore.snapshot();
    if (records.empty()) {
        logger_->debug("flush: memstore empty, nothing to do");
        return {};
    }

    const persistence::SegmentMetadata metadata{
        .segment_id = new_segment_id,
        .last_sequence = memstore.last_sequence(),
    };
    const auto path = table_dir_ / persistence::Segment::filename(new_segment_id);

    if (auto ec = persistence::Segment::save(path, records, metadata)) {
        logger_->error("flush: writing {} failed: {}", path.filename().string(), ec.message());
        return make_error_code(errc::segment_write_failure);
    }

    if (auto ec = wal.rotate()) {
        logger_->error("flush: WAL rotation failed: {}; discarding {}",
                       ec.message(), path.filename().string());
        std::error_code rm_ec;
        std::filesystem::remove(path, rm_ec);
        if (rm_ec) {
            // Harmless on restart: replay skips entries the segment covers.
            logger_->warn("flush: could not remove {}: {}",
                          path.filename().string(), rm_ec.message());
        }
        return make_error_code(errc::segment_write_failure);
    }

    const std::size_t count = records.size();
    auto seg = std::make_shared<LoadedSegment>();
    seg->metadata = metadata;
    seg->path = path;
    seg->records = std::move(records);

    publish(std::move(seg));
    memstore.clear();

    logger_->info("flush: wrote {} records to {} (last_sequence={})",
                  count,
                  path.filename().string(), metadata.last_sequence);

    segment_id = new_segment_id;
    return {};
}

} // namespace kvtable
