#include "storage/compactor.hpp"
#include "common/error.hpp"
#include "persistence/segment.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <string_view>

namespace kvtable {

Compactor::Compactor(std::filesystem::path table_dir,
                     const Clock& clock,
                     std::shared_ptr<spdlog::logger> logger)
    : table_dir_(std::move(table_dir)), clock_(clock), logger_(std::move(logger)) {}

std::vector<Record> Compactor::merge(const SegmentList& inputs, int64_t now_ms) {
    std::map<std::string_view, const Record*> latest;
    for (const auto& seg : inputs) {
        for (const auto& rec : seg->records) {
            auto [it, inserted] = latest.try_emplace(rec.key, &rec);
            if (!inserted && rec.version > it->second->version) {
                it->second = &rec;
            }
        }
    }

    std::vector<Record> out;
    out.reserve(latest.size());
    for (const auto& [_, rec] : latest) {
        if (rec->live(now_ms)) {
            out.push_back(*rec);
        }
    }
    return out;
}

std::error_code Compactor::compact(const SegmentList& inputs,
                                   uint64_t new_segment_id,
                                   CompactionResult& result) {
    result = {};
    if (inputs.empty()) {
        logger_->debug("compact: no segments, nothing to do");
        return {};
    }

    for (const auto& seg : inputs) {
        result.records_in += seg->records.size();
    }

    auto survivors = merge(inputs, clock_.now_ms());
    result.records_out = survivors.size();

    if (!survivors.empty()) {
        persistence::SegmentMetadata metadata{.segment_id = new_segment_id};
        for (const auto& seg : inputs) {
            metadata.last_sequence = std::max(metadata.last_sequence,
                                               seg->metadata.last_sequence);
        }

        const auto path = table_dir_ / persistence::Segment::filename(new_segment_id);
        if (auto ec = persistence::Segment::save(path, survivors, metadata)) {
            logger_->error("compact: writing {} failed: {}",
                           path.filename().string(), ec.message());
            return make_error_code(errc::segment_write_failure);
        }

        auto seg = std::make_shared<LoadedSegment>();
        seg->metadata = metadata;
        seg->path = path;
        seg->records = std::move(survivors);
        result.output = std::move(seg);
        result.segment_id = new_segment_id;
    }

    result.retained = retire(inputs);

    logger_->info("compact: merged {} segments ({} records) into {} ({} records)",
                  inputs.size(), result.records_in,
                  result.segment_id ? persistence::Segment::filename(*result.segment_id)
                                    : std::string("nothing"),
                  result.records_out);
    return {};
}

SegmentList Compactor::retire(const SegmentList& inputs) {
    // `inputs` is oldest first.
    SegmentList retained;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        std::error_code ec;
        std::filesystem::remove(inputs[i]->path, ec);
        if (ec) {
            logger_->warn("compact: could not retire {}: {}",
                          inputs[i]->path.filename().string(), ec.message());
            // Keep the newer inputs too so what remains is a recency suffix.
            retained.assign(inputs.begin() + static_cast<std::ptrdiff_t>(i), inputs.end());
            break;
        }
    }

    if (auto ec = persistence::Segment::sync_directory(table_dir_)) {
        logger_->warn("compact: directory fsync failed: {}", ec.message());
    }
    return retained;
}

} // namespace kvtable
