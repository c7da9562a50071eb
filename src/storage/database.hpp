#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/store_config.hpp"
#include "storage/record_file.hpp"
#include "storage/write_queue.hpp"

namespace recdb {

// ── Database ─────────────────────────────────────────────────────────────────
//
// Access coordinator: one RecordFile (with its ReadCache) plus an optional
// WriteQueue, behind a single coarse lock.
//
// Routing:
//   - write()/append() go to the queue when it is enabled; a full queue is
//     flushed and the write admitted again (still full -> queue_overflow).
//   - get() returns an unflushed queued payload before touching the engine.
//   - remove() drops any queued write for the key before deleting from disk,
//     and restores it if the delete fails.
//   - every committed mutation invalidates the key's cache entry.
//
// Concurrency model:
//   - exists() / record_count() / keys() / stats() acquire a shared lock.
//   - everything else acquires an exclusive lock (get() included, since a
//     cache hit reorders the LRU list).

enum class CloseMode {
    Safe,    // flush queued writes, then close the file
    Unsafe,  // close the file and discard queued writes
};

struct Stats {
    uint64_t    reads   = 0;
    uint64_t    writes  = 0;
    std::size_t records = 0;
    std::size_t queued  = 0;
    std::chrono::system_clock::time_point last_modified;
};

class Database {
public:
    Database(std::filesystem::path path,
             StoreOptions options,
             std::shared_ptr<spdlog::logger> logger = {});

    // Closes safely, falling back to an unsafe close; failures are logged.
    ~Database();

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // Opens the underlying file.  queue_capacity and cache_size are checked
    // before the file is touched.
    [[nodiscard]] std::error_code open();

    // Safe mode keeps the file open and returns the error if the queue
    // cannot be flushed.
    [[nodiscard]] std::error_code close(CloseMode mode = CloseMode::Safe);

    // Reads `key`: queued write first, then cache, then disk. Errc::not_found.
    [[nodiscard]] std::error_code get(std::string_view key, std::string& out);

    // Insert-or-update, through the queue when enabled.
    [[nodiscard]] std::error_code write(std::string_view key, std::string_view payload);

    // Like write(), but a new key is placed at the end of the file.
    [[nodiscard]] std::error_code append(std::string_view key, std::string_view payload);

    // Insert-or-update straight to disk, bypassing the queue.
    [[nodiscard]] std::error_code quick_write(std::string_view key, std::string_view payload);

    // Insert-or-update straight to disk; a new key is placed at the end of the file.
    [[nodiscard]] std::error_code quick_append(std::string_view key, std::string_view payload);

    // Deletes `key` (queued and on disk).  Errc::not_found_on_delete if it
    // exists in neither.
    [[nodiscard]] std::error_code remove(std::string_view key);

    // Commits every queued write.
    [[nodiscard]] std::error_code flush();

    // Turns the write queue on or off at runtime.  Disabling flushes first.
    [[nodiscard]] std::error_code set_queue_enabled(bool enabled);

    [[nodiscard]] bool exists(std::string_view key) const;
    [[nodiscard]] bool queue_enabled() const;
    [[nodiscard]] bool is_open() const;

    // Records on disk (queued inserts not included).
    [[nodiscard]] std::size_t record_count() const;

    // Keys on disk in index order, followed by queued keys not yet on disk.
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] Stats stats() const;

    // Underlying engine (not synchronised – for tests and diagnostics).
    [[nodiscard]] const RecordFile& file() const noexcept { return file_; }

private:
    [[nodiscard]] std::error_code write_locked(std::string_view key,
                                               std::string_view payload,
                                               bool append);
    [[nodiscard]] std::error_code commit(const PendingWrite& write);
    [[nodiscard]] std::error_code flush_locked();
    void touch();

    StoreOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex mutex_;
    RecordFile file_;
    std::optional<WriteQueue> queue_;

    uint64_t reads_  = 0;
    uint64_t writes_ = 0;
    std::chrono::system_clock::time_point last_modified_;
};

} // namespace recdb
