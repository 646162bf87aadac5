#include "persistence/wal.hpp"
#include "common/error.hpp"
#include "persistence/segment.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace kvtable::persistence {

// ── CRC32 (ISO 3309 polynomial 0xEDB88320) ──────────────────────────────────

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

// seq(8) + version(8) + flags(1) + expires_at(8) + key_len(2) + value_len(4)
constexpr uint32_t kMinEntryBody = 8 + 8 + 1 + 8 + 2 + 4;

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ── Little-endian helpers ────────────────────────────────────────────────────

namespace {

void write_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

void write_u16_le(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void write_u32_le(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void write_u64_le(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void write_i64_le(std::vector<uint8_t>& buf, int64_t v) {
    write_u64_le(buf, static_cast<uint64_t>(v));
}

void append_raw(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

// Read helpers: return false if not enough data.
bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out) {
    if (ptr + 1 > end) return false;
    out = *ptr++;
    return true;
}

bool read_u16_le(const uint8_t*& ptr, const uint8_t* end, uint16_t& out) {
    if (ptr + 2 > end) return false;
    out = static_cast<uint16_t>(ptr[0]) |
          (static_cast<uint16_t>(ptr[1]) << 8);
    ptr += 2;
    return true;
}

bool read_u32_le(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (ptr + 4 > end) return false;
    out = static_cast<uint32_t>(ptr[0]) |
          (static_cast<uint32_t>(ptr[1]) << 8) |
          (static_cast<uint32_t>(ptr[2]) << 16) |
          (static_cast<uint32_t>(ptr[3]) << 24);
    ptr += 4;
    return true;
}

bool read_u64_le(const uint8_t*& ptr, const uint8_t* end, uint64_t& out) {
    if (ptr + 8 > end) return false;
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out |= static_cast<uint64_t>(ptr[i]) << (i * 8);
    }
    ptr += 8;
    return true;
}

bool read_i64_le(const uint8_t*& ptr, const uint8_t* end, int64_t& out) {
    uint64_t v = 0;
    if (!read_u64_le(ptr, end, v)) return false;
    out = static_cast<int64_t>(v);
    return true;
}

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

// Read all bytes from fd. Returns false on error.
bool read_all(int fd, std::vector<uint8_t>& data) {
    uint8_t buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) break;
        data.insert(data.end(), buf, buf + n);
    }
    return true;
}

// Write all bytes to fd.
std::error_code write_all(int fd, const std::vector<uint8_t>& data) {
    const uint8_t* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        auto n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return {};
}

std::vector<uint8_t> make_header() {
    std::vector<uint8_t> hdr;
    hdr.reserve(kWalHeaderSize);
    append_raw(hdr, kWalMagic, kWalMagicSize);
    write_u16_le(hdr, kWalVersion);
    return hdr;
}

// Parse one entry starting at `ptr` (just after the type byte).
// Returns false if the entry is truncated or structurally malformed.
bool parse_entry_body(const uint8_t*& ptr, const uint8_t* end, WalEntry& out) {
    uint32_t total_length = 0;
    if (!read_u32_le(ptr, end, total_length)) return false;
    if (total_length < kMinEntryBody) return false;
    if (static_cast<std::size_t>(end - ptr) < static_cast<std::size_t>(total_length) + 4) {
        return false;
    }

    const uint8_t* body_end = ptr + total_length;
    uint8_t flags = 0;
    int64_t expires_at = 0;

    if (!read_u64_le(ptr, body_end, out.sequence)) return false;
    if (!read_u64_le(ptr, body_end, out.record.version)) return false;
    if (!read_u8(ptr, body_end, flags)) return false;
    if (!read_i64_le(ptr, body_end, expires_at)) return false;

    uint16_t key_len = 0;
    if (!read_u16_le(ptr, body_end, key_len)) return false;
    if (ptr + key_len > body_end) return false;
    out.record.key.assign(reinterpret_cast<const char*>(ptr), key_len);
    ptr += key_len;

    uint32_t value_len = 0;
    if (!read_u32_le(ptr, body_end, value_len)) return false;
    if (ptr + value_len != body_end) return false;
    out.record.value.assign(reinterpret_cast<const char*>(ptr), value_len);
    ptr += value_len;

    out.record.tombstone = (flags & kFlagTombstone) != 0;
    if (flags & kFlagHasExpiry) {
        out.record.expires_at = expires_at;
    } else {
        out.record.expires_at.reset();
    }
    return true;
}

} // anonymous namespace

// ── Serialisation ────────────────────────────────────────────────────────────

std::vector<uint8_t> serialise_entry(const WalEntry& entry) {
    const Record& rec = entry.record;

    uint32_t total_length = kMinEntryBody +
                            static_cast<uint32_t>(rec.key.size()) +
                            static_cast<uint32_t>(rec.value.size());

    uint8_t flags = 0;
    if (rec.tombstone) flags |= kFlagTombstone;
    if (rec.expires_at) flags |= kFlagHasExpiry;

    std::vector<uint8_t> buf;
    buf.reserve(1 + 4 + total_length + 4);

    write_u8(buf, kRecordTypeEntry);
    write_u32_le(buf, total_length);
    write_u64_le(buf, entry.sequence);
    write_u64_le(buf, rec.version);
    write_u8(buf, flags);
    write_i64_le(buf, rec.expires_at.value_or(0));
    write_u16_le(buf, static_cast<uint16_t>(rec.key.size()));
    append_raw(buf, rec.key.data(), rec.key.size());
    write_u32_le(buf, static_cast<uint32_t>(rec.value.size()));
    append_raw(buf, rec.value.data(), rec.value.size());

    // CRC covers type through value.
    uint32_t c = crc32(buf.data(), buf.size());
    write_u32_le(buf, c);

    return buf;
}

// ── WAL implementation ───────────────────────────────────────────────────────

WAL::WAL(const std::filesystem::path& path) : path_(path) {}

WAL::~WAL() {
    close();
}

std::error_code WAL::open() {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    bool exists = std::filesystem::exists(path_);

    if (!exists) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) return ec;
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd_ < 0) {
        return make_errno_error();
    }

    if (!exists || std::filesystem::file_size(path_) == 0) {
        auto ec = write_header();
        if (ec) {
            close();
            return ec;
        }
    } else {
        auto ec = validate_header(fd_);
        if (ec) {
            close();
            return ec;
        }
    }

    return {};
}

void WAL::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code WAL::write_header() {
    return write_bytes(make_header());
}

std::error_code WAL::validate_header(int fd) {
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        return make_errno_error();
    }

    uint8_t hdr[kWalHeaderSize];
    auto n = ::read(fd, hdr, kWalHeaderSize);
    if (n < 0) return make_errno_error();
    if (static_cast<std::size_t>(n) < kWalHeaderSize) {
        return make_error_code(errc::wal_corruption);
    }

    if (std::memcmp(hdr, kWalMagic, kWalMagicSize) != 0) {
        return make_error_code(errc::wal_corruption);
    }

    uint16_t version = static_cast<uint16_t>(hdr[kWalMagicSize]) |
                       (static_cast<uint16_t>(hdr[kWalMagicSize + 1]) << 8);
    if (version != kWalVersion) {
        return make_error(std::errc::not_supported);
    }

    return {};
}

std::error_code WAL::write_bytes(const std::vector<uint8_t>& data) {
    auto ec = write_all(fd_, data);
    if (ec) return ec;

    // fdatasync to ensure durability.
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }

    return {};
}

std::error_code WAL::append(const Record& rec, uint64_t& sequence) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (rec.key.size() > std::numeric_limits<uint16_t>::max()) {
        return make_error_code(errc::invalid_key);
    }
    if (rec.value.size() > std::numeric_limits<uint32_t>::max() - kMinEntryBody -
                               std::numeric_limits<uint16_t>::max()) {
        return make_error(std::errc::value_too_large);
    }

    if (poisoned_) {
        return make_error(std::errc::io_error);
    }

    const off_t size_before = ::lseek(fd_, 0, SEEK_END);
    if (size_before < 0) {
        return make_errno_error();
    }

    WalEntry entry{next_sequence_, rec};
    if (auto ec = write_bytes(serialise_entry(entry))) {
        // A torn or unsynced entry must not stay in front of later appends.
        discard_tail(size_before);
        return ec;
    }

    sequence = next_sequence_++;
    return {};
}

void WAL::discard_tail(int64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == 0 && ::fdatasync(fd_) == 0) {
        return;
    }
    poisoned_ = true;
    spdlog::error("WAL {}: cannot drop failed append ({}); refusing appends until rotation",
                  path_.string(), std::strerror(errno));
}

std::error_code WAL::replay(
    const std::filesystem::path& path,
    WalReplayResult& result)
{
    result = {};

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    std::vector<uint8_t> data;
    bool ok = read_all(fd, data);
    auto read_ec = make_errno_error();
    ::close(fd);
    if (!ok) return read_ec;

    // An empty file or a header cut short by a crash holds no entries.
    if (data.size() < kWalHeaderSize) {
        if (!data.empty()) {
            spdlog::warn("WAL {}: truncated header ({} bytes)", path.string(), data.size());
            result.anomaly = make_error_code(errc::wal_corruption);
        }
        return {};
    }

    const uint8_t* ptr = data.data();
    const uint8_t* end = data.data() + data.size();

    if (std::memcmp(ptr, kWalMagic, kWalMagicSize) != 0) {
        spdlog::error("WAL {}: bad magic", path.string());
        return make_error_code(errc::wal_corruption);
    }
    ptr += kWalMagicSize;
    uint16_t version = 0;
    if (!read_u16_le(ptr, end, version)) {
        return make_error_code(errc::wal_corruption);
    }
    if (version != kWalVersion) {
        return make_error(std::errc::not_supported);
    }

    result.valid_bytes = kWalHeaderSize;

    uint64_t last_sequence = 0;
    while (ptr < end) {
        const uint8_t* record_start = ptr;

        uint8_t type = 0;
        if (!read_u8(ptr, end, type)) break;

        if (type != kRecordTypeEntry) {
            spdlog::warn("WAL {}: unknown record type 0x{:02X} at offset {}",
                         path.string(), type, record_start - data.data());
            result.anomaly = make_error_code(errc::wal_corruption);
            break;
        }

        WalEntry entry;
        if (!parse_entry_body(ptr, end, entry)) {
            spdlog::warn("WAL {}: truncated or malformed entry at offset {}",
                         path.string(), record_start - data.data());
            result.anomaly = make_error_code(errc::wal_corruption);
            break;
        }

        uint32_t stored_crc = 0;
        if (!read_u32_le(ptr, end, stored_crc)) {
            result.anomaly = make_error_code(errc::wal_corruption);
            break;
        }

        std::size_t payload_len = static_cast<std::size_t>(ptr - record_start) - 4;
        uint32_t computed_crc = crc32(record_start, payload_len);
        if (computed_crc != stored_crc) {
            spdlog::warn("WAL {}: CRC mismatch in entry at offset {}",
                         path.string(), record_start - data.data());
            result.anomaly = make_error_code(errc::wal_corruption);
            break;
        }

        if (entry.sequence <= last_sequence) {
            spdlog::warn("WAL {}: sequence {} out of order after {}",
                         path.string(), entry.sequence, last_sequence);
            result.anomaly = make_error_code(errc::wal_corruption);
            break;
        }
        last_sequence = entry.sequence;

        result.entries.push_back(std::move(entry));
        result.valid_bytes = static_cast<uint64_t>(ptr - data.data());
    }

    return {};
}

std::error_code WAL::truncate_file(const std::filesystem::path& path, uint64_t size) {
    int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    if (::ftruncate(fd, static_cast<off_t>(size)) < 0) {
        auto e = make_errno_error();
        ::close(fd);
        return e;
    }
    if (::fsync(fd) < 0) {
        auto e = make_errno_error();
        ::close(fd);
        return e;
    }
    ::close(fd);
    return {};
}

std::error_code WAL::rotate() {
    // Build the replacement beside the log and keep its descriptor.
    auto tmp_path = path_;
    tmp_path += ".tmp";

    int tmp_fd = ::open(tmp_path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_APPEND, 0644);
    if (tmp_fd < 0) {
        auto e = make_errno_error();
        spdlog::error("WAL {}: rotation failed, keeping current log: {}",
                      path_.string(), e.message());
        return e;
    }

    auto ec = write_all(tmp_fd, make_header());
    if (!ec && ::fdatasync(tmp_fd) < 0) {
        ec = make_errno_error();
    }
    if (!ec) {
        std::filesystem::rename(tmp_path, path_, ec);
    }

    if (ec) {
        ::close(tmp_fd);
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        spdlog::error("WAL {}: rotation failed, keeping current log: {}",
                      path_.string(), ec.message());
        return ec;
    }

    // Committed.  tmp_fd now refers to the new, empty log.
    close();
    fd_ = tmp_fd;
    poisoned_ = false;

    if (auto dir_ec = Segment::sync_directory(path_.parent_path())) {
        spdlog::warn("WAL {}: directory fsync after rotation failed: {}",
                     path_.string(), dir_ec.message());
    }
    return {};
}

} // namespace kvtable::persistence
