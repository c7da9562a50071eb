#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace recdb {

// ── FreeBlock ────────────────────────────────────────────────────────────────
// A reclaimed span of the data region: [offset, offset + length).

struct FreeBlock {
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] uint64_t end() const noexcept {
        return static_cast<uint64_t>(offset) + length;
    }

    bool operator==(const FreeBlock&) const = default;
};

// ── FreeSpaceMap ─────────────────────────────────────────────────────────────
//
// Offset-ordered set of free blocks owned by RecordFile.  Adjacent blocks are
// always merged, so no two blocks in the map touch.  Never persisted: the
// engine rebuilds it from the index gaps when a file is opened.
//
// NOT thread-safe.

class FreeSpaceMap {
public:
    // Adds [offset, offset + length), merging with adjacent neighbours.
    // Zero-length releases are ignored.
    void release(uint32_t offset, uint32_t length);

    // Removes and returns the lowest-offset block with length >= min_length.
    [[nodiscard]] std::optional<FreeBlock> take_first_fit(uint32_t min_length);

    // Removes and returns the block starting exactly at `offset`.
    [[nodiscard]] std::optional<FreeBlock> take_at(uint32_t offset);

    // Removes and returns the block ending exactly at `end`.
    [[nodiscard]] std::optional<FreeBlock> take_ending_at(uint64_t end);

    void clear();

    [[nodiscard]] bool empty() const noexcept { return blocks_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return blocks_.size(); }

    // Sum of all free block lengths.
    [[nodiscard]] uint64_t total_bytes() const noexcept { return total_bytes_; }

    // Snapshot in offset order.
    [[nodiscard]] std::vector<FreeBlock> blocks() const;

private:
    std::map<uint32_t, uint32_t> blocks_;  // offset -> length
    uint64_t total_bytes_ = 0;
};

} // namespace recdb
