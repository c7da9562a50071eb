#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace recdb {

// ── PendingWrite ─────────────────────────────────────────────────────────────
// A write that has been accepted but not yet committed to the RecordFile.
// `append` selects quick_insert (no free-space search) when the key is new.

struct PendingWrite {
    std::string key;
    std::string payload;
    bool append = false;
};

// ── WriteQueue ───────────────────────────────────────────────────────────────
//
// Bounded key -> pending write map.  Repeated writes to one key coalesce into
// a single entry that keeps its original position; drain_all() hands entries
// back in admission order.
//
// NOT thread-safe; owned and serialised by Database.

class WriteQueue {
public:
    // Throws std::system_error(Errc::queue_capacity) if capacity == 0.
    explicit WriteQueue(std::size_t capacity);

    WriteQueue(const WriteQueue&)            = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    // Queues `write`.  Returns false only if the key is not queued yet and the
    // queue is full; the caller must flush and retry.
    [[nodiscard]] bool admit(PendingWrite write);

    // Non-destructive lookup (read-your-writes).
    [[nodiscard]] std::optional<PendingWrite> peek(std::string_view key) const;

    // Discards any pending write for `key`. Returns true if one was queued.
    bool drop(std::string_view key);

    // Removes and returns every pending write in admission order.
    [[nodiscard]] std::vector<PendingWrite> drain_all();

    // Discards every pending write.
    void clear();

    // Queued keys in admission order.
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::list<PendingWrite> entries_;
    std::unordered_map<std::string, std::list<PendingWrite>::iterator> index_;
};

} // namespace recdb
