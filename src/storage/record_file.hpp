#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/store_config.hpp"
#include "format/layout.hpp"
#include "storage/free_space.hpp"
#include "storage/read_cache.hpp"

namespace recdb {

// ── RecordFile ───────────────────────────────────────────────────────────────
//
// Single-file keyed record store (see format/layout.hpp for the byte layout).
//
// The whole index is mirrored in memory: entries_ in slot order, a key -> slot
// map, and a data_pointer -> slot map of every entry that owns data-region
// bytes.  Together with free_ those live entries tile the data region
// [data_start, file_length) exactly; free_ is rebuilt from the gaps on open.
//
// Disk writes inside one mutation are ordered so the record count (or the
// rewritten index slot) is written last; in-memory state only changes once
// every write has succeeded.
//
// Thread-safety: NOT thread-safe.  Database serialises access.

class RecordFile {
public:
    RecordFile(std::filesystem::path path,
               StoreOptions options,
               std::shared_ptr<spdlog::logger> logger = {});
    ~RecordFile();

    // Non-copyable, non-movable – owns a file descriptor.
    RecordFile(const RecordFile&)            = delete;
    RecordFile& operator=(const RecordFile&) = delete;
    RecordFile(RecordFile&&)                 = delete;
    RecordFile& operator=(RecordFile&&)      = delete;

    // Opens the file, creating it with an empty index unless read-only.
    // Options are validated before the file is touched (cache_size,
    // invalid_layout).  A structurally inconsistent file fails with
    // format_error.  Calling open() on an open file is a no-op.
    [[nodiscard]] std::error_code open();

    // Persists the header, syncs and releases the descriptor.
    // Closing a closed file is a no-op.
    [[nodiscard]] std::error_code close();

    [[nodiscard]] bool is_open() const noexcept { return fd_ != -1; }
    [[nodiscard]] bool read_only() const noexcept { return options_.read_only; }

    // ── Record operations ────────────────────────────────────────────────────

    [[nodiscard]] bool exists(std::string_view key) const;

    // Reads the payload of `key` into `out` (cache first). Errc::not_found.
    [[nodiscard]] std::error_code read(std::string_view key, std::string& out);

    // Adds a new record, reusing a free block when one is large enough.
    // Errc::duplicate_key if `key` exists.
    [[nodiscard]] std::error_code insert(std::string_view key, std::string_view payload);

    // Adds a new record at the end of the file without searching free space.
    [[nodiscard]] std::error_code quick_insert(std::string_view key, std::string_view payload);

    // Replaces the payload of `key`: in place if it fits the reserved
    // capacity, otherwise relocated.  Errc::not_found_on_update.
    [[nodiscard]] std::error_code update(std::string_view key, std::string_view payload);

    // Deletes `key`, moving the last index entry into its slot.
    // Errc::not_found_on_delete.
    [[nodiscard]] std::error_code remove(std::string_view key);

    // Drops the cached payload of `key`, if any.
    void invalidate(std::string_view key);

    // fdatasync the file.
    [[nodiscard]] std::error_code sync();

    // ── Introspection ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t record_count() const noexcept { return entries_.size(); }

    // Keys in index slot order.
    [[nodiscard]] std::vector<std::string> keys() const;

    // Location descriptor of `key`, or std::nullopt.
    [[nodiscard]] std::optional<format::IndexEntry> entry(std::string_view key) const;

    [[nodiscard]] uint64_t file_length() const noexcept { return file_length_; }
    [[nodiscard]] uint32_t data_start() const noexcept { return data_start_; }
    [[nodiscard]] uint64_t free_bytes() const noexcept { return free_.total_bytes(); }
    [[nodiscard]] std::vector<FreeBlock> free_blocks() const { return free_.blocks(); }

    // Read cache state (for diagnostics and tests), or nullptr before the
    // first successful open().
    [[nodiscard]] const ReadCache* cache() const noexcept {
        return cache_ ? &*cache_ : nullptr;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const StoreOptions& options() const noexcept { return options_; }

private:
    enum class Placement {
        FirstFit,  // reuse the first large-enough free block, else append
        Append,    // always grow the file
    };

    [[nodiscard]] std::error_code check_writable() const;
    [[nodiscard]] std::error_code check_payload(std::string_view payload) const;

    [[nodiscard]] std::error_code create_new();
    [[nodiscard]] std::error_code load_existing(uint64_t size);

    [[nodiscard]] std::error_code insert_record(std::string_view key,
                                                std::string_view payload,
                                                Placement placement);

    // Reserves `length` bytes of the data region.  Zero-length requests take
    // no space and get pointer = end of file, capacity 0.
    [[nodiscard]] std::error_code allocate(uint32_t length, Placement placement,
                                           uint32_t& pointer, uint32_t& capacity);

    // Returns [pointer, pointer + capacity) to the free set and gives any
    // free tail of the file back to the filesystem.
    [[nodiscard]] std::error_code release_block(uint32_t pointer, uint32_t capacity);
    [[nodiscard]] std::error_code reclaim_tail();

    // Moves the data-start watermark until `required_slots` index entries fit.
    [[nodiscard]] std::error_code ensure_index_space(uint64_t required_slots);
    [[nodiscard]] std::error_code relocate_to_end(std::size_t slot);

    // Mirror bookkeeping for slot `slot` after entries_[slot] changed.
    void track(std::size_t slot);
    void untrack(const format::IndexEntry& entry);

    [[nodiscard]] std::error_code write_index_entry(std::size_t slot,
                                                    const format::IndexEntry& entry);
    [[nodiscard]] std::error_code write_record_count(uint32_t count);
    [[nodiscard]] std::error_code write_data_start(uint32_t data_start);
    [[nodiscard]] std::error_code set_file_length(uint64_t length);

    [[nodiscard]] std::error_code write_at(uint64_t offset, const void* data, std::size_t len);
    [[nodiscard]] std::error_code read_at(uint64_t offset, void* data, std::size_t len) const;

    void reset_state();

    std::filesystem::path path_;
    StoreOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    int fd_ = -1;
    uint64_t file_length_ = 0;
    uint32_t data_start_  = 0;

    std::vector<format::IndexEntry> entries_;               // slot order
    std::unordered_map<std::string, std::size_t> slots_;    // key -> slot
    std::map<uint32_t, std::size_t> occupants_;             // data_pointer -> slot (capacity > 0)
    FreeSpaceMap free_;
    std::optional<ReadCache> cache_;
};

} // namespace recdb
