#include "storage/write_queue.hpp"

#include "common/error.hpp"

#include <iterator>
#include <system_error>
#include <utility>

namespace recdb {

WriteQueue::WriteQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::system_error(make_error_code(Errc::queue_capacity));
    }
    index_.reserve(capacity_);
}

bool WriteQueue::admit(PendingWrite write) {
    auto it = index_.find(write.key);
    if (it != index_.end()) {
        *it->second = std::move(write);
        return true;
    }

    if (entries_.size() >= capacity_) {
        return false;
    }

    entries_.push_back(std::move(write));
    auto pos = std::prev(entries_.end());
    index_.emplace(pos->key, pos);
    return true;
}

std::optional<PendingWrite> WriteQueue::peek(std::string_view key) const {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

bool WriteQueue::drop(std::string_view key) {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

std::vector<PendingWrite> WriteQueue::drain_all() {
    std::vector<PendingWrite> result;
    result.reserve(entries_.size());
    for (auto& w : entries_) {
        result.push_back(std::move(w));
    }
    entries_.clear();
    index_.clear();
    return result;
}

void WriteQueue::clear() {
    entries_.clear();
    index_.clear();
}

std::vector<std::string> WriteQueue::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& w : entries_) {
        result.push_back(w.key);
    }
    return result;
}

bool WriteQueue::contains(std::string_view key) const {
    return index_.find(std::string(key)) != index_.end();
}

} // namespace recdb
