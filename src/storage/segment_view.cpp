#include "storage/segment_view.hpp"

#include <algorithm>

namespace kvtable {

const Record* LoadedSegment::find(std::string_view key) const {
    auto it = std::lower_bound(records.begin(), records.end(), key,
                               [](const Record& r, std::string_view k) { return r.key < k; });
    if (it == records.end() || it->key != key) {
        return nullptr;
    }
    return &*it;
}

std::error_code LoadedSegment::load(const std::filesystem::path& path,
                                    std::shared_ptr<const LoadedSegment>& out) {
    persistence::SegmentLoadResult result;
    if (auto ec = persistence::Segment::load(path, result)) {
        return ec;
    }
    auto seg = std::make_shared<LoadedSegment>();
    seg->metadata = result.metadata;
    seg->path = path;
    seg->records = std::move(result.records);
    out = std::move(seg);
    return {};
}

SegmentView::SegmentView(SegmentList segments) : segments_(std::move(segments)) {
    std::sort(segments_.begin(), segments_.end(),
              [](const auto& a, const auto& b) { return a->id() < b->id(); });
}

const Record* SegmentView::find_newest(std::string_view key) const {
    // Newest to oldest; a later segment only loses on a strictly higher
    // version in an older one (possible after an interrupted compaction).
    const Record* best = nullptr;
    for (auto it = segments_.rbegin(); it != segments_.rend(); ++it) {
        const Record* rec = (*it)->find(key);
        if (rec && (!best || rec->version > best->version)) {
            best = rec;
        }
    }
    return best;
}

std::optional<Record> SegmentView::newest(std::string_view key) const {
    const Record* rec = find_newest(key);
    if (!rec) return std::nullopt;
    return *rec;
}

uint64_t SegmentView::max_version(std::string_view key) const {
    const Record* rec = find_newest(key);
    return rec ? rec->version : 0;
}

uint64_t SegmentView::last_sequence() const noexcept {
    uint64_t seq = 0;
    for (const auto& s : segments_) {
        seq = std::max(seq, s->metadata.last_sequence);
    }
    return seq;
}

uint64_t SegmentView::max_id() const noexcept {
    return segments_.empty() ? 0 : segments_.back()->id();
}

std::vector<uint64_t> SegmentView::ids() const {
    std::vector<uint64_t> out;
    out.reserve(segments_.size());
    for (const auto& s : segments_) out.push_back(s->id());
    return out;
}

std::shared_ptr<const SegmentView> SegmentView::with(std::shared_ptr<const LoadedSegment> seg) const {
    SegmentList next = segments_;
    next.push_back(std::move(seg));
    return std::make_shared<SegmentView>(std::move(next));
}

} // namespace kvtable
