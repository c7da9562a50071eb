#include "storage/free_space.hpp"

#include <iterator>

namespace recdb {

void FreeSpaceMap::release(uint32_t offset, uint32_t length) {
    if (length == 0) {
        return;
    }

    uint64_t start = offset;
    uint64_t end   = static_cast<uint64_t>(offset) + length;
    total_bytes_ += length;

    // Merge with the following block.
    auto next = blocks_.lower_bound(offset);
    if (next != blocks_.end() && next->first == end) {
        end += next->second;
        next = blocks_.erase(next);
    }

    // Merge with the preceding block.
    if (next != blocks_.begin()) {
        auto prev = std::prev(next);
        if (static_cast<uint64_t>(prev->first) + prev->second == start) {
            start = prev->first;
            blocks_.erase(prev);
        }
    }

    blocks_[static_cast<uint32_t>(start)] = static_cast<uint32_t>(end - start);
}

std::optional<FreeBlock> FreeSpaceMap::take_first_fit(uint32_t min_length) {
    for (auto it = blocks_.begin(); it != blocks_.end(); ++it) {
        if (it->second >= min_length) {
            FreeBlock block{it->first, it->second};
            total_bytes_ -= block.length;
            blocks_.erase(it);
            return block;
        }
    }
    return std::nullopt;
}

std::optional<FreeBlock> FreeSpaceMap::take_at(uint32_t offset) {
    auto it = blocks_.find(offset);
    if (it == blocks_.end()) {
        return std::nullopt;
    }
    FreeBlock block{it->first, it->second};
    total_bytes_ -= block.length;
    blocks_.erase(it);
    return block;
}

std::optional<FreeBlock> FreeSpaceMap::take_ending_at(uint64_t end) {
    if (blocks_.empty()) {
        return std::nullopt;
    }
    // The only candidate is the last block starting before `end`.
    auto it = blocks_.lower_bound(end > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(end));
    if (it == blocks_.begin()) {
        return std::nullopt;
    }
    --it;
    if (static_cast<uint64_t>(it->first) + it->second != end) {
        return std::nullopt;
    }
    FreeBlock block{it->first, it->second};
    total_bytes_ -= block.length;
    blocks_.erase(it);
    return block;
}

void FreeSpaceMap::clear() {
    blocks_.clear();
    total_bytes_ = 0;
}

std::vector<FreeBlock> FreeSpaceMap::blocks() const {
    std::vector<FreeBlock> out;
    out.reserve(blocks_.size());
    for (const auto& [offset, length] : blocks_) {
        out.push_back({offset, length});
    }
    return out;
}

} // namespace recdb
