#include "storage/record_file.hpp"
#include "common/error.hpp"
#include "format/layout.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace recdb {

// ── Fixture ───────────────────────────────────────────────────────────────────

class RecordFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("record_file_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ / "store.db";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::unique_ptr<RecordFile> open_file(const StoreOptions& options = {}) {
        auto file = std::make_unique<RecordFile>(path_, options);
        auto ec = file->open();
        EXPECT_FALSE(ec) << ec.message();
        return file;
    }

    static std::string read_value(RecordFile& file, std::string_view key) {
        std::string out;
        auto ec = file.read(key, out);
        EXPECT_FALSE(ec) << key << ": " << ec.message();
        return out;
    }

    // Live capacities plus free blocks must cover [data_start, file_length).
    static void expect_tiled(const RecordFile& file) {
        uint64_t live = 0;
        for (const auto& k : file.keys()) {
            auto e = file.entry(k);
            ASSERT_TRUE(e.has_value());
            if (e->data_capacity > 0) {
                EXPECT_GE(e->data_pointer, file.data_start()) << k;
                EXPECT_LE(e->data_end(), file.file_length()) << k;
            }
            live += e->data_capacity;
        }
        EXPECT_EQ(live + file.free_bytes(), file.file_length() - file.data_start());
        EXPECT_GE(file.data_start(),
                  file.options().layout.index_entry_offset(file.record_count()));
    }

    void patch_file(uint64_t offset, const std::vector<uint8_t>& bytes) {
        std::fstream f(path_, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(f.is_open());
        f.seekp(static_cast<std::streamoff>(offset));
        f.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
    }

    // Swaps the store's descriptor for an in-memory copy of the file that
    // can grow but refuses to shrink, so every ftruncate() to a smaller size
    // fails with EPERM.
    void seal_against_shrink() {
        const int fd = find_descriptor(path_);
        ASSERT_GE(fd, 0);

        const int mem = ::memfd_create("recdb-sealed", MFD_ALLOW_SEALING);
        ASSERT_GE(mem, 0);
        const auto size = std::filesystem::file_size(path_);
        std::string bytes(size, '\0');
        ASSERT_EQ(::pread(fd, bytes.data(), size, 0), static_cast<ssize_t>(size));
        ASSERT_EQ(::pwrite(mem, bytes.data(), size, 0), static_cast<ssize_t>(size));
        ASSERT_EQ(::fcntl(mem, F_ADD_SEALS, F_SEAL_SHRINK), 0);
        ASSERT_EQ(::dup2(mem, fd), fd);
        ::close(mem);
    }

    // Descriptor this process holds open on `path`, or -1.
    static int find_descriptor(const std::filesystem::path& path) {
        const auto target = std::filesystem::canonical(path);
        for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
            std::error_code ec;
            auto link = std::filesystem::read_symlink(entry.path(), ec);
            if (!ec && link == target) {
                return std::stoi(entry.path().filename().string());
            }
        }
        return -1;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path path_;
};

// Default layout: 16-byte header, 80-byte index entries, 16 reserved slots.
constexpr uint32_t kDefaultDataStart = 16 + 16 * 80;

// ── open() / close() ──────────────────────────────────────────────────────────

TEST_F(RecordFileTest, OpenCreatesEmptyStore) {
    auto file = open_file();
    EXPECT_TRUE(file->is_open());
    EXPECT_EQ(file->record_count(), 0u);
    EXPECT_EQ(file->data_start(), kDefaultDataStart);
    EXPECT_EQ(file->file_length(), kDefaultDataStart);
    EXPECT_EQ(std::filesystem::file_size(path_), kDefaultDataStart);
}

TEST_F(RecordFileTest, OpenIsIdempotent) {
    auto file = open_file();
    EXPECT_FALSE(file->open());
    EXPECT_TRUE(file->is_open());
}

TEST_F(RecordFileTest, CloseTwiceIsNoOp) {
    auto file = open_file();
    EXPECT_FALSE(file->close());
    EXPECT_FALSE(file->close());
    EXPECT_FALSE(file->is_open());
}

TEST_F(RecordFileTest, OperationsOnClosedFileFail) {
    RecordFile file(path_, {});
    std::string out;
    EXPECT_EQ(file.read("k", out), Errc::closed);
    EXPECT_EQ(file.insert("k", "v"), Errc::closed);
    EXPECT_EQ(file.update("k", "v"), Errc::closed);
    EXPECT_EQ(file.remove("k"), Errc::closed);
    EXPECT_EQ(file.sync(), Errc::closed);
}

TEST_F(RecordFileTest, ZeroCacheSizeRejectedBeforeTouchingFile) {
    StoreOptions options;
    options.cache_capacity = 0;
    RecordFile file(path_, options);

    EXPECT_EQ(file.open(), Errc::cache_size);
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(RecordFileTest, InvalidLayoutRejectedBeforeTouchingFile) {
    StoreOptions options;
    options.layout.record_header_length = 8;
    RecordFile file(path_, options);

    EXPECT_EQ(file.open(), Errc::invalid_layout);
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(RecordFileTest, OpenCreatesParentDirectories) {
    path_ = test_dir_ / "nested" / "deeper" / "store.db";
    auto file = open_file();
    EXPECT_TRUE(std::filesystem::exists(path_));
}

// ── insert() / read() ─────────────────────────────────────────────────────────

TEST_F(RecordFileTest, InsertThenRead) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("alpha", "first value"));

    EXPECT_TRUE(file->exists("alpha"));
    EXPECT_EQ(read_value(*file, "alpha"), "first value");
    EXPECT_EQ(file->record_count(), 1u);

    auto e = file->entry("alpha");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->data_pointer, kDefaultDataStart);
    EXPECT_EQ(e->data_capacity, 11u);
    EXPECT_EQ(e->data_length, 11u);
}

TEST_F(RecordFileTest, ReadMissingKey) {
    auto file = open_file();
    std::string out;
    EXPECT_EQ(file->read("ghost", out), Errc::not_found);
}

TEST_F(RecordFileTest, DuplicateInsertRejected) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "one"));
    EXPECT_EQ(file->insert("k", "two"), Errc::duplicate_key);
    EXPECT_EQ(file->quick_insert("k", "two"), Errc::duplicate_key);
    EXPECT_EQ(read_value(*file, "k"), "one");
}

TEST_F(RecordFileTest, KeyTooLongRejected) {
    auto file = open_file();
    EXPECT_EQ(file->insert(std::string(63, 'k'), "v"), Errc::key_too_long);
    EXPECT_FALSE(file->insert(std::string(62, 'k'), "v"));
}

TEST_F(RecordFileTest, BinaryPayloadPreserved) {
    auto file = open_file();
    const std::string payload("a\0b\xff\x01", 5);
    ASSERT_FALSE(file->insert("bin", payload));
    file->invalidate("bin");
    EXPECT_EQ(read_value(*file, "bin"), payload);
}

TEST_F(RecordFileTest, EmptyPayloadTakesNoSpace) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("empty", ""));

    auto e = file->entry("empty");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->data_capacity, 0u);
    EXPECT_EQ(file->file_length(), kDefaultDataStart);
    EXPECT_EQ(read_value(*file, "empty"), "");

    ASSERT_FALSE(file->close());
    file = open_file();
    EXPECT_EQ(read_value(*file, "empty"), "");
}

TEST_F(RecordFileTest, QuickInsertSkipsFreeBlocks) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", "aaa"));
    ASSERT_FALSE(file->insert("b", "bbb"));
    ASSERT_FALSE(file->insert("c", "ccc"));
    ASSERT_FALSE(file->remove("a"));
    ASSERT_EQ(file->free_bytes(), 3u);

    ASSERT_FALSE(file->quick_insert("d", "ddd"));
    EXPECT_EQ(file->entry("d")->data_pointer, kDefaultDataStart + 9);
    EXPECT_EQ(file->free_bytes(), 3u);

    ASSERT_FALSE(file->insert("e", "ee"));
    EXPECT_EQ(file->entry("e")->data_pointer, kDefaultDataStart);
    EXPECT_EQ(file->entry("e")->data_capacity, 3u);
    EXPECT_EQ(file->free_bytes(), 0u);
    expect_tiled(*file);
}

// ── update() ──────────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, UpdateMissingKey) {
    auto file = open_file();
    EXPECT_EQ(file->update("ghost", "v"), Errc::not_found_on_update);
}

TEST_F(RecordFileTest, UpdateThatFitsStaysInPlace) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "abcdef"));
    const auto before = *file->entry("k");

    ASSERT_FALSE(file->update("k", "xy"));
    auto after = *file->entry("k");
    EXPECT_EQ(after.data_pointer, before.data_pointer);
    EXPECT_EQ(after.data_capacity, 6u);
    EXPECT_EQ(after.data_length, 2u);
    EXPECT_EQ(read_value(*file, "k"), "xy");

    // The reserved capacity is still there to grow back into.
    ASSERT_FALSE(file->update("k", "123456"));
    EXPECT_EQ(file->entry("k")->data_pointer, before.data_pointer);
    EXPECT_EQ(read_value(*file, "k"), "123456");
    EXPECT_EQ(file->file_length(), kDefaultDataStart + 6);
}

TEST_F(RecordFileTest, GrowingUpdateRelocatesAndFreesOldBlock) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", "abc"));
    ASSERT_FALSE(file->insert("b", "xyz"));
    const auto old_pointer = file->entry("a")->data_pointer;

    ASSERT_FALSE(file->update("a", "0123456789"));
    auto moved = *file->entry("a");
    EXPECT_NE(moved.data_pointer, old_pointer);
    EXPECT_EQ(moved.data_pointer, kDefaultDataStart + 6);
    EXPECT_EQ(moved.data_capacity, 10u);
    EXPECT_EQ(read_value(*file, "a"), "0123456789");

    auto blocks = file->free_blocks();
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0], (FreeBlock{old_pointer, 3}));

    // A small insert reuses the freed block instead of growing the file.
    const auto length_before = file->file_length();
    ASSERT_FALSE(file->insert("c", "hi"));
    EXPECT_EQ(file->entry("c")->data_pointer, old_pointer);
    EXPECT_EQ(file->file_length(), length_before);
    EXPECT_EQ(read_value(*file, "b"), "xyz");
    expect_tiled(*file);
}

TEST_F(RecordFileTest, RelocatingLastRecordStillMoves) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("only", "abc"));
    const auto old_pointer = file->entry("only")->data_pointer;

    ASSERT_FALSE(file->update("only", "abcdefgh"));
    EXPECT_NE(file->entry("only")->data_pointer, old_pointer);
    EXPECT_EQ(read_value(*file, "only"), "abcdefgh");
    expect_tiled(*file);
}

// ── remove() ──────────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, RemoveMissingKey) {
    auto file = open_file();
    EXPECT_EQ(file->remove("ghost"), Errc::not_found_on_delete);
}

TEST_F(RecordFileTest, RemoveMovesLastEntryIntoSlot) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", "1"));
    ASSERT_FALSE(file->insert("b", "2"));
    ASSERT_FALSE(file->insert("c", "3"));

    ASSERT_FALSE(file->remove("a"));
    EXPECT_EQ(file->keys(), (std::vector<std::string>{"c", "b"}));
    EXPECT_FALSE(file->exists("a"));
    EXPECT_EQ(read_value(*file, "c"), "3");

    std::string out;
    EXPECT_EQ(file->read("a", out), Errc::not_found);
}

TEST_F(RecordFileTest, DeleteThenReinsert) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "first"));
    ASSERT_FALSE(file->remove("k"));
    EXPECT_FALSE(file->exists("k"));
    std::string out;
    EXPECT_TRUE(is_logical_miss(file->read("k", out)));

    ASSERT_FALSE(file->insert("k", "second"));

    EXPECT_EQ(read_value(*file, "k"), "second");
    EXPECT_EQ(file->record_count(), 1u);
}

TEST_F(RecordFileTest, RemovingTailRecordTruncatesFile) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", "aaa"));
    ASSERT_FALSE(file->insert("b", "bbb"));

    ASSERT_FALSE(file->remove("b"));
    EXPECT_EQ(file->file_length(), kDefaultDataStart + 3);
    EXPECT_EQ(std::filesystem::file_size(path_), kDefaultDataStart + 3);
    EXPECT_TRUE(file->free_blocks().empty());
}

TEST_F(RecordFileTest, TailTruncationSwallowsAdjacentFreeBlocks) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", "aaa"));
    ASSERT_FALSE(file->insert("b", "bbb"));
    ASSERT_FALSE(file->insert("c", "ccc"));

    ASSERT_FALSE(file->remove("b"));
    EXPECT_EQ(file->free_bytes(), 3u);

    ASSERT_FALSE(file->remove("c"));
    EXPECT_EQ(file->file_length(), kDefaultDataStart + 3);
    EXPECT_EQ(file->free_bytes(), 0u);
}

// ── Read cache ────────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, CacheUnavailableBeforeOpen) {
    RecordFile file(path_, {});
    EXPECT_EQ(file.cache(), nullptr);

    ASSERT_FALSE(file.open());
    ASSERT_NE(file.cache(), nullptr);
    EXPECT_EQ(file.cache()->capacity(), 10u);
}

TEST_F(RecordFileTest, InsertPopulatesCache) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "v"));
    EXPECT_TRUE(file->cache()->contains("k"));
}

TEST_F(RecordFileTest, InvalidateDropsCachedPayload) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "v"));
    file->invalidate("k");

    EXPECT_FALSE(file->cache()->contains("k"));
    EXPECT_EQ(read_value(*file, "k"), "v");
    EXPECT_TRUE(file->cache()->contains("k"));
}

TEST_F(RecordFileTest, ReadAfterUpdateSeesNewPayload) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "abc"));
    EXPECT_EQ(read_value(*file, "k"), "abc");

    ASSERT_FALSE(file->update("k", "xyz"));
    EXPECT_EQ(read_value(*file, "k"), "xyz");
    file->invalidate("k");
    EXPECT_EQ(read_value(*file, "k"), "xyz");
}

TEST_F(RecordFileTest, RemoveDropsCachedPayload) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("k", "v"));
    ASSERT_FALSE(file->remove("k"));
    EXPECT_FALSE(file->cache()->contains("k"));
}

TEST_F(RecordFileTest, CacheKeepsMostRecentlyUsed) {
    StoreOptions options;
    options.cache_capacity = 2;
    auto file = open_file(options);

    ASSERT_FALSE(file->insert("a", "1"));
    ASSERT_FALSE(file->insert("b", "2"));
    EXPECT_EQ(read_value(*file, "a"), "1");
    ASSERT_FALSE(file->insert("c", "3"));

    EXPECT_EQ(file->cache()->keys(), (std::vector<std::string>{"c", "a"}));
    EXPECT_EQ(read_value(*file, "b"), "2");
}

// ── Persistence ───────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, ReopenRestoresRecordsAndFreeBlocks) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("a", "aaa"));
        ASSERT_FALSE(file->insert("b", "bbb"));
        ASSERT_FALSE(file->insert("c", "ccc"));
        ASSERT_FALSE(file->remove("b"));
        ASSERT_FALSE(file->close());
    }

    auto file = open_file();
    EXPECT_EQ(file->record_count(), 2u);
    EXPECT_EQ(file->keys(), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(read_value(*file, "a"), "aaa");
    EXPECT_EQ(read_value(*file, "c"), "ccc");

    auto blocks = file->free_blocks();
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0], (FreeBlock{kDefaultDataStart + 3, 3}));
    EXPECT_EQ(file->file_length(), kDefaultDataStart + 9);
    expect_tiled(*file);
}

TEST_F(RecordFileTest, ReopenWithoutExplicitClose) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("k", "persisted"));
    }  // destructor closes

    auto file = open_file();
    EXPECT_EQ(read_value(*file, "k"), "persisted");
}

TEST_F(RecordFileTest, CustomLayoutRoundTrips) {
    StoreOptions options;
    options.layout.header_length        = 32;
    options.layout.data_start_offset    = 8;
    options.layout.max_key_length       = 16;
    options.layout.record_header_length = 12;
    options.initial_index_capacity      = 4;

    {
        auto file = open_file(options);
        EXPECT_EQ(file->data_start(), 32u + 4u * 28u);
        ASSERT_FALSE(file->insert("short", "payload"));
        EXPECT_EQ(file->insert("sixteen-chars!!", "x"), Errc::key_too_long);
        ASSERT_FALSE(file->close());
    }

    auto file = open_file(options);
    EXPECT_EQ(read_value(*file, "short"), "payload");
}

// ── Index growth ──────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, IndexGrowsPastInitialCapacity) {
    StoreOptions options;
    options.initial_index_capacity = 1;
    options.cache_capacity         = 1;

    {
        auto file = open_file(options);
        for (int i = 0; i < 12; ++i) {
            const auto key = "key" + std::to_string(i);
            ASSERT_FALSE(file->insert(key, "value-" + std::to_string(i))) << key;
            expect_tiled(*file);
        }
        EXPECT_GE(file->data_start(), options.layout.index_entry_offset(12));
        for (int i = 0; i < 12; ++i) {
            EXPECT_EQ(read_value(*file, "key" + std::to_string(i)),
                      "value-" + std::to_string(i));
        }
        ASSERT_FALSE(file->close());
    }

    auto file = open_file(options);
    ASSERT_EQ(file->record_count(), 12u);
    for (int i = 0; i < 12; ++i) {
        EXPECT_EQ(read_value(*file, "key" + std::to_string(i)),
                  "value-" + std::to_string(i));
    }
    expect_tiled(*file);
}

TEST_F(RecordFileTest, IndexGrowthAbsorbsOnlyWhatTheIndexNeeds) {
    StoreOptions options;
    options.initial_index_capacity = 2;
    auto file = open_file(options);
    const uint32_t start = file->data_start();
    const auto grown = options.layout.index_entry_offset(3);

    // A large free block right at data_start: one more slot takes 80 bytes of
    // it, the rest stays free and no record moves.
    ASSERT_FALSE(file->insert("a", std::string(200, 'a')));
    ASSERT_FALSE(file->insert("b", "bbb"));
    ASSERT_FALSE(file->remove("a"));
    ASSERT_FALSE(file->quick_insert("c", "c"));
    ASSERT_EQ(file->free_bytes(), 200u);
    const auto b_pointer = file->entry("b")->data_pointer;
    const auto c_pointer = file->entry("c")->data_pointer;

    ASSERT_FALSE(file->quick_insert("d", "ddd"));
    EXPECT_EQ(file->data_start(), grown);
    EXPECT_EQ(file->free_blocks(),
              (std::vector<FreeBlock>{{static_cast<uint32_t>(grown), start + 200 - static_cast<uint32_t>(grown)}}));
    EXPECT_EQ(file->entry("b")->data_pointer, b_pointer);
    EXPECT_EQ(file->entry("c")->data_pointer, c_pointer);
    EXPECT_EQ(read_value(*file, "b"), "bbb");
    EXPECT_EQ(read_value(*file, "c"), "c");
    EXPECT_EQ(read_value(*file, "d"), "ddd");
    expect_tiled(*file);

    ASSERT_FALSE(file->close());
    file = open_file(options);
    EXPECT_EQ(file->data_start(), grown);
    EXPECT_EQ(file->free_bytes(), start + 200 - grown);
    EXPECT_EQ(read_value(*file, "d"), "ddd");
}

// ── Read-only mode ────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, ReadOnlyOpenOfMissingFileFails) {
    StoreOptions options;
    options.read_only = true;
    RecordFile file(path_, options);

    auto ec = file.open();
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
    EXPECT_TRUE(is_io_failure(ec));
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(RecordFileTest, ReadOnlyRejectsMutations) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("k", "v"));
        ASSERT_FALSE(file->close());
    }
    const auto size_before = std::filesystem::file_size(path_);

    StoreOptions options;
    options.read_only = true;
    auto file = open_file(options);

    EXPECT_EQ(read_value(*file, "k"), "v");
    EXPECT_EQ(file->insert("n", "v"), Errc::read_only);
    EXPECT_EQ(file->quick_insert("n", "v"), Errc::read_only);
    EXPECT_EQ(file->update("k", "w"), Errc::read_only);
    EXPECT_EQ(file->remove("k"), Errc::read_only);
    ASSERT_FALSE(file->close());

    EXPECT_EQ(std::filesystem::file_size(path_), size_before);
}

// ── Format errors ─────────────────────────────────────────────────────────────

TEST_F(RecordFileTest, FileShorterThanHeaderIsFormatError) {
    {
        std::ofstream out(path_, std::ios::binary);
        out << "abc";
    }
    RecordFile file(path_, {});
    EXPECT_EQ(file.open(), Errc::format_error);
    EXPECT_FALSE(file.is_open());
}

TEST_F(RecordFileTest, RecordCountOverrunningDataStartIsFormatError) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("k", "v"));
        ASSERT_FALSE(file->close());
    }
    patch_file(0, {0xE8, 0x03, 0x00, 0x00});  // 1000 records

    RecordFile file(path_, {});
    EXPECT_EQ(file.open(), Errc::format_error);
}

TEST_F(RecordFileTest, EntryPointingPastEndIsFormatError) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("k", "value"));
        ASSERT_FALSE(file->close());
    }
    // Data pointer of slot 0 sits right after its 64-byte key region.
    patch_file(16 + 64, {0x00, 0x00, 0x10, 0x00});

    RecordFile file(path_, {});
    EXPECT_EQ(file.open(), Errc::format_error);
}

TEST_F(RecordFileTest, OverlappingEntriesAreFormatError) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("a", "aaaa"));
        ASSERT_FALSE(file->insert("b", "bbbb"));
        ASSERT_FALSE(file->close());
    }
    // Point slot 1 two bytes into slot 0's data.
    const auto ptr = format::encode_u32(kDefaultDataStart + 2);
    patch_file(16 + 80 + 64, std::vector<uint8_t>(ptr.begin(), ptr.end()));

    RecordFile file(path_, {});
    EXPECT_EQ(file.open(), Errc::format_error);
}

TEST_F(RecordFileTest, DuplicateKeyInIndexIsFormatError) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("a", "1"));
        ASSERT_FALSE(file->insert("b", "2"));
        ASSERT_FALSE(file->close());
    }
    // Rename slot 1's key from "b" to "a".
    patch_file(16 + 80 + 2, {'a'});

    RecordFile file(path_, {});
    EXPECT_EQ(file.open(), Errc::format_error);
    EXPECT_FALSE(file.is_open());
}

TEST_F(RecordFileTest, DataStartPastEndIsFormatError) {
    {
        auto file = open_file();
        ASSERT_FALSE(file->insert("k", "v"));
        ASSERT_FALSE(file->close());
    }
    const auto size = static_cast<uint32_t>(std::filesystem::file_size(path_));
    const auto ptr  = format::encode_u32(size + 64);
    patch_file(4, std::vector<uint8_t>(ptr.begin(), ptr.end()));

    RecordFile file(path_, {});
    EXPECT_EQ(file.open(), Errc::format_error);
}

// ── Tail truncation failures ──────────────────────────────────────────────────

TEST_F(RecordFileTest, RemoveSucceedsWhenTailCannotBeTruncated) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", "aaa"));
    ASSERT_FALSE(file->insert("b", "bbb"));
    seal_against_shrink();

    ASSERT_FALSE(file->remove("b"));
    EXPECT_FALSE(file->exists("b"));
    EXPECT_EQ(file->record_count(), 1u);
    EXPECT_EQ(file->file_length(), kDefaultDataStart + 6);
    EXPECT_EQ(file->free_blocks(), (std::vector<FreeBlock>{{kDefaultDataStart + 3, 3}}));
    EXPECT_EQ(read_value(*file, "a"), "aaa");
    expect_tiled(*file);
}

TEST_F(RecordFileTest, RelocatingUpdateSucceedsWhenTailCannotBeTruncated) {
    auto file = open_file();
    ASSERT_FALSE(file->insert("a", std::string(10, 'a')));
    ASSERT_FALSE(file->insert("b", "bb"));
    ASSERT_FALSE(file->remove("a"));
    seal_against_shrink();

    // "b" moves into a's old block; its own block at the tail stays free.
    ASSERT_FALSE(file->update("b", "bbbbb"));
    EXPECT_EQ(file->entry("b")->data_pointer, kDefaultDataStart);
    EXPECT_EQ(file->file_length(), kDefaultDataStart + 12);
    EXPECT_EQ(file->free_blocks(), (std::vector<FreeBlock>{{kDefaultDataStart + 10, 2}}));
    file->invalidate("b");
    EXPECT_EQ(read_value(*file, "b"), "bbbbb");
    expect_tiled(*file);
}

} // namespace recdb
