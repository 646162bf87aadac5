#include "persistence/wal.hpp"
#include "common/error.hpp"
#include "file_size_limit.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace kvtable::persistence {

namespace {

Record make_record(std::string key, std::string value, uint64_t version) {
    Record rec;
    rec.key = std::move(key);
    rec.value = std::move(value);
    rec.version = version;
    return rec;
}

} // namespace

// ── Fixture ──────────────────────────────────────────────────────────────────

class WalTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a unique temp directory for each test.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("kvtable_wal_test_" + std::string(info->name()));
        // Clean up any stale directory from a previous crashed run.
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        wal_path_ = test_dir_ / "wal.log";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    // Append `n` records "k1".."kn" and return the file size after each one.
    std::vector<uint64_t> append_n(int n) {
        std::vector<uint64_t> sizes;
        WAL wal(wal_path_);
        EXPECT_FALSE(wal.open());
        for (int i = 1; i <= n; ++i) {
            uint64_t seq = 0;
            EXPECT_FALSE(wal.append(make_record("k" + std::to_string(i), "v", 1), seq));
            sizes.push_back(std::filesystem::file_size(wal_path_));
        }
        return sizes;
    }

    void flip_byte_at(off_t pos) {
        int fd = ::open(wal_path_.c_str(), O_RDWR);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(::lseek(fd, pos, SEEK_SET), pos);
        uint8_t byte = 0;
        ASSERT_EQ(::read(fd, &byte, 1), 1);
        byte ^= 0xFF;
        ASSERT_EQ(::lseek(fd, pos, SEEK_SET), pos);
        ASSERT_EQ(::write(fd, &byte, 1), 1);
        ::close(fd);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path wal_path_;
};

// ── Open / Close ─────────────────────────────────────────────────────────────

TEST_F(WalTest, OpenCreatesFileWithHeader) {
    WAL wal(wal_path_);
    auto ec = wal.open();
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(wal.is_open());
    ASSERT_TRUE(std::filesystem::exists(wal_path_));
    EXPECT_EQ(std::filesystem::file_size(wal_path_), kWalHeaderSize);
}

TEST_F(WalTest, OpenIdempotentWhenAlreadyOpen) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());
    auto ec = wal.open();  // second call
    EXPECT_FALSE(ec) << ec.message();
    EXPECT_TRUE(wal.is_open());
}

TEST_F(WalTest, CloseMarksNotOpen) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());
    wal.close();
    EXPECT_FALSE(wal.is_open());
}

TEST_F(WalTest, OpenRejectsForeignFile) {
    {
        int fd = ::open(wal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        const char garbage[] = "NOTAWALFILE!";
        ASSERT_EQ(::write(fd, garbage, 12), 12);
        ::close(fd);
    }
    WAL wal(wal_path_);
    auto ec = wal.open();
    EXPECT_EQ(ec, errc::wal_corruption);
    EXPECT_FALSE(wal.is_open());
}

TEST_F(WalTest, AppendRequiresOpen) {
    WAL wal(wal_path_);
    uint64_t seq = 0;
    EXPECT_TRUE(wal.append(make_record("k", "v", 1), seq));
}

// ── Append / Replay ──────────────────────────────────────────────────────────

TEST_F(WalTest, ReplayEmptyWal) {
    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
    }

    WalReplayResult result;
    auto ec = WAL::replay(wal_path_, result);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(result.entries.empty());
    EXPECT_FALSE(result.anomaly);
    EXPECT_EQ(result.valid_bytes, kWalHeaderSize);
}

TEST_F(WalTest, AppendAssignsIncreasingSequences) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());

    uint64_t s1 = 0, s2 = 0, s3 = 0;
    ASSERT_FALSE(wal.append(make_record("a", "1", 1), s1));
    ASSERT_FALSE(wal.append(make_record("b", "2", 1), s2));
    ASSERT_FALSE(wal.append(make_record("a", "3", 2), s3));

    EXPECT_EQ(s1, 1u);
    EXPECT_EQ(s2, 2u);
    EXPECT_EQ(s3, 3u);
    EXPECT_EQ(wal.next_sequence(), 4u);
}

TEST_F(WalTest, ReplayReturnsEntriesInOrder) {
    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
        uint64_t seq = 0;
        ASSERT_FALSE(wal.append(make_record("a", "1", 1), seq));
        ASSERT_FALSE(wal.append(make_record("b", "2", 1), seq));
        ASSERT_FALSE(wal.append(make_record("a", "3", 2), seq));
    }

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    EXPECT_FALSE(result.anomaly);
    ASSERT_EQ(result.entries.size(), 3u);

    EXPECT_EQ(result.entries[0].sequence, 1u);
    EXPECT_EQ(result.entries[0].record.key, "a");
    EXPECT_EQ(result.entries[0].record.value, "1");
    EXPECT_EQ(result.entries[2].sequence, 3u);
    EXPECT_EQ(result.entries[2].record.value, "3");
    EXPECT_EQ(result.entries[2].record.version, 2u);
    EXPECT_EQ(result.valid_bytes, std::filesystem::file_size(wal_path_));
}

TEST_F(WalTest, TombstoneAndExpiryPreserved) {
    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
        uint64_t seq = 0;

        Record ttl = make_record("session", "token", 4);
        ttl.expires_at = 1'700'000'123'456;
        ASSERT_FALSE(wal.append(ttl, seq));

        Record dead = make_record("gone", "", 9);
        dead.tombstone = true;
        ASSERT_FALSE(wal.append(dead, seq));
    }

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    ASSERT_EQ(result.entries.size(), 2u);

    const auto& ttl = result.entries[0].record;
    ASSERT_TRUE(ttl.expires_at.has_value());
    EXPECT_EQ(*ttl.expires_at, 1'700'000'123'456);
    EXPECT_FALSE(ttl.tombstone);

    const auto& dead = result.entries[1].record;
    EXPECT_TRUE(dead.tombstone);
    EXPECT_FALSE(dead.expires_at.has_value());
    EXPECT_EQ(dead.version, 9u);
}

TEST_F(WalTest, BinaryValueRoundTrips) {
    std::string blob;
    for (int i = 0; i < 256; ++i) blob.push_back(static_cast<char>(i));
    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
        uint64_t seq = 0;
        ASSERT_FALSE(wal.append(make_record("bin", blob, 1), seq));
    }

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].record.value, blob);
}

TEST_F(WalTest, OversizedKeyRejected) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());
    uint64_t seq = 0;
    auto ec = wal.append(make_record(std::string(70000, 'k'), "v", 1), seq);
    EXPECT_EQ(ec, errc::invalid_key);
    EXPECT_EQ(wal.next_sequence(), 1u);
}

TEST_F(WalTest, ReopenAppendsAfterExistingEntries) {
    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
        uint64_t seq = 0;
        ASSERT_FALSE(wal.append(make_record("a", "1", 1), seq));
    }
    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
        wal.set_next_sequence(2);
        uint64_t seq = 0;
        ASSERT_FALSE(wal.append(make_record("b", "2", 1), seq));
        EXPECT_EQ(seq, 2u);
    }

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].record.key, "b");
}

// ── Damaged tails ────────────────────────────────────────────────────────────

TEST_F(WalTest, TruncatedTailKeepsPrefix) {
    auto sizes = append_n(3);

    // Cut the last entry in half.
    const uint64_t cut = sizes[1] + (sizes[2] - sizes[1]) / 2;
    std::filesystem::resize_file(wal_path_, cut);

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    EXPECT_EQ(result.anomaly, errc::wal_corruption);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].record.key, "k2");
    EXPECT_EQ(result.valid_bytes, sizes[1]);
}

TEST_F(WalTest, CrcMismatchKeepsPrefix) {
    auto sizes = append_n(3);

    // Flip a byte inside the second entry's value.
    flip_byte_at(static_cast<off_t>(sizes[1] - 6));

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    EXPECT_EQ(result.anomaly, errc::wal_corruption);
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].record.key, "k1");
    EXPECT_EQ(result.valid_bytes, sizes[0]);
}

TEST_F(WalTest, TruncateFileThenAppendIsReadable) {
    auto sizes = append_n(2);
    std::filesystem::resize_file(wal_path_, sizes[1] - 3);

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    ASSERT_TRUE(result.anomaly);
    ASSERT_FALSE(WAL::truncate_file(wal_path_, result.valid_bytes));

    {
        WAL wal(wal_path_);
        ASSERT_FALSE(wal.open());
        wal.set_next_sequence(2);
        uint64_t seq = 0;
        ASSERT_FALSE(wal.append(make_record("k2-again", "v", 1), seq));
    }

    WalReplayResult after;
    ASSERT_FALSE(WAL::replay(wal_path_, after));
    EXPECT_FALSE(after.anomaly);
    ASSERT_EQ(after.entries.size(), 2u);
    EXPECT_EQ(after.entries[1].record.key, "k2-again");
}

TEST_F(WalTest, TruncatedHeaderIsAnomaly) {
    {
        int fd = ::open(wal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(::write(fd, "KVT", 3), 3);
        ::close(fd);
    }

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    EXPECT_EQ(result.anomaly, errc::wal_corruption);
    EXPECT_TRUE(result.entries.empty());
    EXPECT_LT(result.valid_bytes, kWalHeaderSize);
}

TEST_F(WalTest, BadMagicFailsReplay) {
    {
        int fd = ::open(wal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        ASSERT_EQ(::write(fd, "XXXXXXXXXXXX", 12), 12);
        ::close(fd);
    }

    WalReplayResult result;
    EXPECT_EQ(WAL::replay(wal_path_, result), errc::wal_corruption);
}

// ── Rotation ─────────────────────────────────────────────────────────────────

TEST_F(WalTest, RotateEmptiesLogAndKeepsSequence) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());
    uint64_t seq = 0;
    ASSERT_FALSE(wal.append(make_record("a", "1", 1), seq));
    ASSERT_FALSE(wal.append(make_record("b", "2", 1), seq));

    ASSERT_FALSE(wal.rotate());
    EXPECT_TRUE(wal.is_open());
    EXPECT_EQ(std::filesystem::file_size(wal_path_), kWalHeaderSize);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "wal.log.tmp"));

    ASSERT_FALSE(wal.append(make_record("c", "3", 1), seq));
    EXPECT_EQ(seq, 3u);

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].sequence, 3u);
    EXPECT_EQ(result.entries[0].record.key, "c");
}

TEST_F(WalTest, RotateFailureKeepsCurrentLog) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());
    uint64_t seq = 0;
    ASSERT_FALSE(wal.append(make_record("a", "1", 1), seq));

    // A directory in the way makes the replacement file impossible to create.
    std::filesystem::create_directory(test_dir_ / "wal.log.tmp");
    EXPECT_TRUE(wal.rotate());
    EXPECT_TRUE(wal.is_open());
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "wal.log.tmp"));

    ASSERT_FALSE(wal.append(make_record("b", "2", 1), seq));
    EXPECT_EQ(seq, 2u);

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    EXPECT_FALSE(result.anomaly);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].record.key, "a");
    EXPECT_EQ(result.entries[1].record.key, "b");

    // Once the obstacle is gone rotation goes through.
    std::filesystem::remove(test_dir_ / "wal.log.tmp");
    ASSERT_FALSE(wal.rotate());
    EXPECT_EQ(std::filesystem::file_size(wal_path_), kWalHeaderSize);
}

// ── Failed appends ───────────────────────────────────────────────────────────

TEST_F(WalTest, FailedAppendLeavesNoTornEntry) {
    WAL wal(wal_path_);
    ASSERT_FALSE(wal.open());
    uint64_t seq = 0;
    ASSERT_FALSE(wal.append(make_record("a", "1", 1), seq));
    const auto size_before = std::filesystem::file_size(wal_path_);

    {
        // Room for a few bytes of the next entry, not all of it.
        test::ScopedFileSizeLimit limit(size_before + 10);
        EXPECT_TRUE(wal.append(make_record("b", std::string(100, 'x'), 1), seq));
    }
    EXPECT_EQ(std::filesystem::file_size(wal_path_), size_before);

    ASSERT_FALSE(wal.append(make_record("c", "3", 1), seq));
    EXPECT_EQ(seq, 2u);

    WalReplayResult result;
    ASSERT_FALSE(WAL::replay(wal_path_, result));
    EXPECT_FALSE(result.anomaly);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].sequence, 2u);
    EXPECT_EQ(result.entries[1].record.key, "c");
}

// ── CRC32 ────────────────────────────────────────────────────────────────────

TEST(Crc32Test, KnownVector) {
    const std::string input = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
              0xCBF43926u);
}

TEST(Crc32Test, SerialisedEntryEndsWithCrc) {
    WalEntry entry{7, make_record("k", "v", 1)};
    auto bytes = serialise_entry(entry);
    ASSERT_GT(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], kRecordTypeEntry);

    const uint32_t stored = static_cast<uint32_t>(bytes[bytes.size() - 4]) |
                            (static_cast<uint32_t>(bytes[bytes.size() - 3]) << 8) |
                            (static_cast<uint32_t>(bytes[bytes.size() - 2]) << 16) |
                            (static_cast<uint32_t>(bytes[bytes.size() - 1]) << 24);
    EXPECT_EQ(stored, crc32(bytes.data(), bytes.size() - 4));
}

} // namespace kvtable::persistence
