#include "persistence/segment.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <stdexcept>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kvtable::persistence {

namespace {

using json = nlohmann::json;

// ── UTF-8 / hex helpers ──────────────────────────────────────────────────────

bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string hex_encode(std::string_view s) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() * 2);
    for (char ch : s) {
        const auto b = static_cast<unsigned char>(ch);
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool hex_decode(std::string_view s, std::string& out) {
    if (s.size() % 2 != 0) return false;
    out.clear();
    out.reserve(s.size() / 2);
    for (std::size_t i = 0; i < s.size(); i += 2) {
        int hi = hex_value(s[i]);
        int lo = hex_value(s[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return true;
}

void put_text(json& obj, const char* field, const std::string& text) {
    if (is_valid_utf8(text)) {
        obj[field] = text;
    } else {
        obj[std::string(field) + "_hex"] = hex_encode(text);
    }
}

// Throws json::exception (or std::runtime_error for bad hex) when neither
// form is present.
std::string get_text(const json& obj, const char* field) {
    auto it = obj.find(field);
    if (it != obj.end()) {
        return it->get<std::string>();
    }
    std::string decoded;
    if (!hex_decode(obj.at(std::string(field) + "_hex").get<std::string>(), decoded)) {
        throw std::runtime_error(std::string("invalid hex in ") + field + "_hex");
    }
    return decoded;
}

json record_to_json(const Record& rec) {
    json j = json::object();
    put_text(j, "key", rec.key);
    put_text(j, "value", rec.value);
    j["version"] = rec.version;
    if (rec.expires_at) {
        j["expires_at"] = *rec.expires_at;
    } else {
        j["expires_at"] = nullptr;
    }
    j["tombstone"] = rec.tombstone;
    return j;
}

Record record_from_json(const json& j) {
    Record rec;
    rec.key = get_text(j, "key");
    rec.value = get_text(j, "value");
    rec.version = j.at("version").get<uint64_t>();
    const auto& exp = j.at("expires_at");
    if (!exp.is_null()) {
        rec.expires_at = exp.get<int64_t>();
    }
    rec.tombstone = j.at("tombstone").get<bool>();
    return rec;
}

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

[[nodiscard]] std::error_code read_file(const std::filesystem::path& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return {errno, std::system_category()};
    }
    out.clear();
    char buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::error_code ec{errno, std::system_category()};
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return {};
}

}  // namespace

// ── Naming ───────────────────────────────────────────────────────────────────

std::string Segment::filename(uint64_t segment_id) {
    return std::string(kPrefix) + std::to_string(segment_id) + kSuffix;
}

std::optional<uint64_t> Segment::parse_id(const std::string& filename) {
    std::string_view name{filename};
    const std::string_view prefix{kPrefix};
    const std::string_view suffix{kSuffix};

    if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (name.substr(0, prefix.size()) != prefix) return std::nullopt;
    if (name.substr(name.size() - suffix.size()) != suffix) return std::nullopt;

    auto digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    uint64_t id = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return id;
}

// ── Segment::save ────────────────────────────────────────────────────────────

std::error_code Segment::save(
    const std::filesystem::path& path,
    const std::vector<Record>& records,
    const SegmentMetadata& metadata) {

    // Records sorted by key for deterministic output.
    std::vector<const Record*> sorted;
    sorted.reserve(records.size());
    for (const auto& r : records) sorted.push_back(&r);
    std::sort(sorted.begin(), sorted.end(),
              [](const Record* a, const Record* b) { return a->key < b->key; });

    json doc = json::object();
    doc["format"] = kFormat;
    doc["format_version"] = kFormatVersion;
    doc["segment_id"] = metadata.segment_id;
    doc["last_sequence"] = metadata.last_sequence;
    json& out = doc["records"] = json::array();
    for (const Record* r : sorted) {
        out.push_back(record_to_json(*r));
    }

    std::string text;
    try {
        text = doc.dump(2);
    } catch (const json::exception& e) {
        spdlog::error("Segment: serialisation failed: {}", e.what());
        return make_error_code(errc::segment_write_failure);
    }
    text.push_back('\n');

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += kTmpSuffix;

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("Segment: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    std::error_code rm_ec;
    auto ec = write_all(fd, text.data(), text.size());
    if (ec) {
        spdlog::error("Segment: write failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("Segment: fsync failed: {}", ec.message());
        ::close(fd);
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    ::close(fd);

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("Segment: rename failed: {}", rename_ec.message());
        std::filesystem::remove(tmp_path, rm_ec);
        return rename_ec;
    }

    if (auto dir_ec = sync_directory(path.parent_path())) {
        // The rename happened; only its durability is in doubt.
        spdlog::warn("Segment: directory fsync failed for {}: {}",
                     path.parent_path().string(), dir_ec.message());
    }

    spdlog::debug("Segment: saved {} records (id={}, last_sequence={}) to {}",
                  records.size(), metadata.segment_id, metadata.last_sequence,
                  path.string());

    return {};
}

// ── Segment::load ────────────────────────────────────────────────────────────

std::error_code Segment::load(
    const std::filesystem::path& path,
    SegmentLoadResult& result) {

    std::string text;
    if (auto ec = read_file(path, text)) {
        spdlog::error("Segment: failed to read {}: {}", path.string(), ec.message());
        return ec;
    }

    try {
        const json doc = json::parse(text);

        if (doc.at("format").get<std::string>() != kFormat) {
            spdlog::error("Segment: {} has unknown format tag", path.string());
            return make_error_code(errc::segment_corruption);
        }
        const int version = doc.at("format_version").get<int>();
        if (version != kFormatVersion) {
            spdlog::error("Segment: {} has unsupported format version {}",
                          path.string(), version);
            return make_error_code(errc::segment_corruption);
        }

        result.metadata.segment_id = doc.at("segment_id").get<uint64_t>();
        result.metadata.last_sequence = doc.at("last_sequence").get<uint64_t>();

        result.records.clear();
        const auto& records = doc.at("records");
        result.records.reserve(records.size());
        for (const auto& r : records) {
            result.records.push_back(record_from_json(r));
        }
    } catch (const std::exception& e) {
        spdlog::error("Segment: {} is unreadable: {}", path.string(), e.what());
        return make_error_code(errc::segment_corruption);
    }

    std::sort(result.records.begin(), result.records.end(),
              [](const Record& a, const Record& b) { return a.key < b.key; });

    spdlog::debug("Segment: loaded {} records (id={}) from {}",
                  result.records.size(), result.metadata.segment_id, path.string());

    return {};
}

// ── Segment::list ────────────────────────────────────────────────────────────

std::error_code Segment::list(const std::filesystem::path& dir, std::vector<uint64_t>& ids) {
    ids.clear();
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return ec;

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        if (auto id = parse_id(entry.path().filename().string())) {
            ids.push_back(*id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return {};
}

void Segment::remove_stale_temporaries(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return;

    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (name.rfind(kPrefix, 0) == 0 &&
            name.size() > std::strlen(kTmpSuffix) &&
            name.compare(name.size() - std::strlen(kTmpSuffix), std::string::npos, kTmpSuffix) == 0) {
            std::error_code rm_ec;
            if (std::filesystem::remove(entry.path(), rm_ec)) {
                spdlog::warn("Segment: removed stale temporary {}", entry.path().string());
            } else if (rm_ec) {
                spdlog::warn("Segment: cannot remove stale temporary {}: {}",
                             entry.path().string(), rm_ec.message());
            }
        }
    }
}

std::error_code Segment::sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return {errno, std::system_category()};
    }
    std::error_code ec;
    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
    }
    ::close(fd);
    return ec;
}

} // namespace kvtable::persistence
