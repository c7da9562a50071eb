#include "storage/read_cache.hpp"

#include "common/error.hpp"

#include <system_error>

namespace recdb {

ReadCache::ReadCache(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::system_error(make_error_code(Errc::cache_size));
    }
    index_.reserve(capacity_);
}

std::optional<std::string> ReadCache::get(std::string_view key) {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second);
    return it->second->second;
}

void ReadCache::put(std::string key, std::string value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(value);
        order_.splice(order_.begin(), order_, it->second);
        return;
    }

    if (index_.size() >= capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
    }

    order_.emplace_front(std::move(key), std::move(value));
    index_.emplace(order_.front().first, order_.begin());
}

bool ReadCache::erase(std::string_view key) {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return false;
    }
    order_.erase(it->second);
    index_.erase(it);
    return true;
}

bool ReadCache::contains(std::string_view key) const {
    return index_.find(std::string(key)) != index_.end();
}

std::vector<std::string> ReadCache::keys() const {
    std::vector<std::string> result;
    result.reserve(order_.size());
    for (const auto& [k, _] : order_) {
        result.push_back(k);
    }
    return result;
}

void ReadCache::clear() {
    order_.clear();
    index_.clear();
}

} // namespace recdb
