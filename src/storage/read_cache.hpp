#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace recdb {

// ── ReadCache ────────────────────────────────────────────────────────────────
//
// Bounded key -> payload map with strict least-recently-used eviction.
// get() and put() both promote the key to most-recently-used; a put() that
// would exceed capacity drops the least recently used entry first.
//
// NOT thread-safe; the owning RecordFile is serialised by Database.

class ReadCache {
public:
    // Throws std::system_error(Errc::cache_size) if capacity == 0.
    explicit ReadCache(std::size_t capacity);

    ReadCache(const ReadCache&)            = delete;
    ReadCache& operator=(const ReadCache&) = delete;
    ReadCache(ReadCache&&)                 = default;
    ReadCache& operator=(ReadCache&&)      = default;

    // Returns the cached payload and promotes it, or std::nullopt on miss.
    [[nodiscard]] std::optional<std::string> get(std::string_view key);

    // Inserts or replaces `key`, promoting it; may evict the LRU entry.
    void put(std::string key, std::string value);

    // Removes `key`. Returns true if it was cached.
    bool erase(std::string_view key);

    // Lookup without promotion.
    [[nodiscard]] bool contains(std::string_view key) const;

    // Keys from most to least recently used.
    [[nodiscard]] std::vector<std::string> keys() const;

    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    using Entry = std::pair<std::string, std::string>;

    std::size_t capacity_;
    std::list<Entry> order_;  // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace recdb
