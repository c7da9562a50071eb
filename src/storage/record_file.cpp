#include "storage/record_file.hpp"

#include "common/error.hpp"

#include <cerrno>
#include <cstdint>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace recdb {

namespace {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

constexpr uint64_t kMaxOffset = UINT32_MAX;

} // anonymous namespace

// ── Lifecycle ────────────────────────────────────────────────────────────────

RecordFile::RecordFile(std::filesystem::path path,
                       StoreOptions options,
                       std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path))
    , options_(std::move(options))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

RecordFile::~RecordFile() {
    if (auto ec = close()) {
        logger_->warn("Closing {} failed: {}", path_.string(), ec.message());
    }
}

std::error_code RecordFile::open() {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    // Construction parameters are checked before the file is touched.
    if (options_.cache_capacity == 0) {
        return make_error_code(Errc::cache_size);
    }
    if (auto ec = format::validate(options_.layout)) {
        return ec;
    }
    cache_.emplace(options_.cache_capacity);

    if (options_.read_only) {
        fd_ = ::open(path_.c_str(), O_RDONLY);
    } else {
        std::error_code ec;
        if (path_.has_parent_path() && !std::filesystem::exists(path_, ec)) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) return ec;
        }
        fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    }
    if (fd_ < 0) {
        auto ec = make_errno_error();
        fd_ = -1;
        logger_->error("Failed to open {}: {}", path_.string(), ec.message());
        return ec;
    }

    struct stat st{};
    if (::fstat(fd_, &st) < 0) {
        auto ec = make_errno_error();
        ::close(fd_);
        fd_ = -1;
        return ec;
    }
    const auto size = static_cast<uint64_t>(st.st_size);

    std::error_code ec;
    if (size == 0 && !options_.read_only) {
        ec = create_new();
    } else {
        ec = load_existing(size);
    }
    if (ec) {
        ::close(fd_);
        fd_ = -1;
        reset_state();
        return ec;
    }

    logger_->info("Opened {} ({}, {} records, data_start={}, length={}, free={})",
                  path_.string(), options_.read_only ? "read-only" : "read-write",
                  entries_.size(), data_start_, file_length_, free_.total_bytes());
    return {};
}

std::error_code RecordFile::close() {
    if (fd_ == -1) {
        return {};
    }

    std::error_code ec;
    if (!options_.read_only) {
        ec = write_record_count(static_cast<uint32_t>(entries_.size()));
        if (!ec) ec = write_data_start(data_start_);
        if (!ec && ::fdatasync(fd_) < 0) ec = make_errno_error();
    }

    if (::close(fd_) < 0 && !ec) {
        ec = make_errno_error();
    }
    fd_ = -1;

    logger_->info("Closed {} ({} records)", path_.string(), entries_.size());
    reset_state();
    return ec;
}

void RecordFile::reset_state() {
    file_length_ = 0;
    data_start_  = 0;
    entries_.clear();
    slots_.clear();
    occupants_.clear();
    free_.clear();
    if (cache_) cache_->clear();
}

std::error_code RecordFile::create_new() {
    const uint64_t data_start =
        options_.layout.index_entry_offset(options_.initial_index_capacity);
    if (data_start > kMaxOffset) {
        return make_error_code(Errc::invalid_layout);
    }

    const auto header = format::encode_header(
        options_.layout, {.record_count = 0, .data_start = static_cast<uint32_t>(data_start)});
    if (auto ec = write_at(0, header.data(), header.size())) return ec;
    if (auto ec = set_file_length(data_start)) return ec;

    data_start_ = static_cast<uint32_t>(data_start);
    logger_->info("Created {} with {} reserved index slots",
                  path_.string(), options_.initial_index_capacity);
    return {};
}

std::error_code RecordFile::load_existing(uint64_t size) {
    const auto& layout = options_.layout;

    auto format_error = [&](const char* what) {
        logger_->error("Format error in {}: {}", path_.string(), what);
        return make_error_code(Errc::format_error);
    };

    if (size < layout.header_length) {
        return format_error("file shorter than header region");
    }
    if (size > kMaxOffset) {
        return format_error("file larger than addressable data region");
    }

    std::vector<uint8_t> header_bytes(layout.header_length);
    if (auto ec = read_at(0, header_bytes.data(), header_bytes.size())) return ec;

    format::FileHeader header;
    if (auto ec = format::decode_header(layout, header_bytes, header)) return ec;

    const uint64_t index_end = layout.index_entry_offset(header.record_count);
    if (header.data_start < index_end) {
        return format_error("data start overlaps the index region");
    }
    if (header.data_start > size) {
        return format_error("data start beyond end of file");
    }

    std::vector<uint8_t> index_bytes(index_end - layout.header_length);
    if (!index_bytes.empty()) {
        if (auto ec = read_at(layout.header_length, index_bytes.data(), index_bytes.size())) {
            return ec;
        }
    }

    entries_.reserve(header.record_count);
    slots_.reserve(header.record_count);
    const std::size_t entry_len = layout.index_entry_length();

    for (std::size_t slot = 0; slot < header.record_count; ++slot) {
        format::IndexEntry e;
        std::span<const uint8_t> bytes(index_bytes.data() + slot * entry_len, entry_len);
        if (format::decode_index_entry(layout, bytes, e)) {
            return format_error("malformed index entry");
        }
        if (e.data_capacity > 0 &&
            (e.data_pointer < header.data_start || e.data_end() > size)) {
            return format_error("index entry points outside the data region");
        }
        if (!slots_.emplace(e.key, slot).second) {
            return format_error("duplicate key in index");
        }
        if (e.data_capacity > 0 && !occupants_.emplace(e.data_pointer, slot).second) {
            return format_error("overlapping data ranges");
        }
        entries_.push_back(std::move(e));
    }

    // Rebuild the free set from the gaps between live ranges.
    uint64_t cursor = header.data_start;
    for (const auto& [pointer, slot] : occupants_) {
        if (pointer < cursor) {
            return format_error("overlapping data ranges");
        }
        if (pointer > cursor) {
            free_.release(static_cast<uint32_t>(cursor),
                          static_cast<uint32_t>(pointer - cursor));
        }
        cursor = entries_[slot].data_end();
    }
    if (cursor < size) {
        free_.release(static_cast<uint32_t>(cursor), static_cast<uint32_t>(size - cursor));
    }

    file_length_ = size;
    data_start_  = header.data_start;

    if (!options_.read_only) {
        return reclaim_tail();
    }
    return {};
}

// ── Record operations ────────────────────────────────────────────────────────

bool RecordFile::exists(std::string_view key) const {
    return slots_.find(std::string(key)) != slots_.end();
}

std::error_code RecordFile::read(std::string_view key, std::string& out) {
    if (fd_ == -1) return make_error_code(Errc::closed);

    if (auto hit = cache_->get(key)) {
        out = std::move(*hit);
        return {};
    }

    auto it = slots_.find(std::string(key));
    if (it == slots_.end()) {
        return make_error_code(Errc::not_found);
    }

    const auto& e = entries_[it->second];
    std::string payload(e.data_length, '\0');
    if (e.data_length > 0) {
        if (auto ec = read_at(e.data_pointer, payload.data(), payload.size())) {
            logger_->error("Reading '{}' from {} failed: {}", e.key, path_.string(), ec.message());
            return ec;
        }
    }

    cache_->put(e.key, payload);
    out = std::move(payload);
    return {};
}

std::error_code RecordFile::insert(std::string_view key, std::string_view payload) {
    return insert_record(key, payload, Placement::FirstFit);
}

std::error_code RecordFile::quick_insert(std::string_view key, std::string_view payload) {
    return insert_record(key, payload, Placement::Append);
}

std::error_code RecordFile::insert_record(std::string_view key,
                                          std::string_view payload,
                                          Placement placement) {
    if (auto ec = check_writable()) return ec;
    if (!format::key_fits(options_.layout, key)) {
        return make_error_code(Errc::key_too_long);
    }
    if (exists(key)) {
        return make_error_code(Errc::duplicate_key);
    }
    if (auto ec = check_payload(payload)) return ec;

    const std::size_t slot = entries_.size();
    if (auto ec = ensure_index_space(slot + 1)) return ec;

    const auto length = static_cast<uint32_t>(payload.size());
    uint32_t pointer  = 0;
    uint32_t capacity = 0;
    if (auto ec = allocate(length, placement, pointer, capacity)) return ec;

    format::IndexEntry e{
        .key           = std::string(key),
        .data_pointer  = pointer,
        .data_capacity = capacity,
        .data_length   = length,
    };

    std::error_code ec;
    if (length > 0) {
        ec = write_at(pointer, payload.data(), length);
    }
    if (!ec) ec = write_index_entry(slot, e);
    if (!ec) ec = write_record_count(static_cast<uint32_t>(slot + 1));
    if (ec) {
        logger_->error("Insert of '{}' into {} failed: {}", e.key, path_.string(), ec.message());
        if (auto rel = release_block(pointer, capacity)) {
            logger_->warn("Could not release block at {}: {}", pointer, rel.message());
        }
        return ec;
    }

    slots_.emplace(e.key, slot);
    entries_.push_back(std::move(e));
    track(slot);

    cache_->put(std::string(key), std::string(payload));
    return {};
}

std::error_code RecordFile::update(std::string_view key, std::string_view payload) {
    if (auto ec = check_writable()) return ec;

    auto it = slots_.find(std::string(key));
    if (it == slots_.end()) {
        return make_error_code(Errc::not_found_on_update);
    }
    if (auto ec = check_payload(payload)) return ec;

    const std::size_t slot = it->second;
    const format::IndexEntry old = entries_[slot];
    const auto length = static_cast<uint32_t>(payload.size());

    if (length <= old.data_capacity) {
        // Fits: overwrite in place, the location does not change.
        format::IndexEntry e = old;
        e.data_length = length;

        std::error_code ec;
        if (length > 0) {
            ec = write_at(e.data_pointer, payload.data(), length);
        }
        if (!ec) ec = write_index_entry(slot, e);
        if (ec) {
            logger_->error("Update of '{}' in {} failed: {}", e.key, path_.string(), ec.message());
            cache_->erase(key);
            return ec;
        }
        entries_[slot] = std::move(e);
        cache_->put(std::string(key), std::string(payload));
        return {};
    }

    // Relocate: the new block is allocated while the old one is still held,
    // so the payload always moves and the index never points at unwritten data.
    uint32_t pointer  = 0;
    uint32_t capacity = 0;
    if (auto ec = allocate(length, Placement::FirstFit, pointer, capacity)) return ec;

    format::IndexEntry e = old;
    e.data_pointer  = pointer;
    e.data_capacity = capacity;
    e.data_length   = length;

    auto ec = write_at(pointer, payload.data(), length);
    if (!ec) ec = write_index_entry(slot, e);
    if (ec) {
        logger_->error("Relocating '{}' in {} failed: {}", e.key, path_.string(), ec.message());
        if (auto rel = release_block(pointer, capacity)) {
            logger_->warn("Could not release block at {}: {}", pointer, rel.message());
        }
        return ec;
    }

    untrack(old);
    entries_[slot] = std::move(e);
    track(slot);

    logger_->debug("Relocated '{}' from {} (capacity {}) to {} (capacity {})",
                   old.key, old.data_pointer, old.data_capacity, pointer, capacity);

    cache_->put(std::string(key), std::string(payload));
    if (auto ec = release_block(old.data_pointer, old.data_capacity)) {
        logger_->warn("Could not reclaim block at {} in {}: {}",
                      old.data_pointer, path_.string(), ec.message());
    }
    return {};
}

std::error_code RecordFile::remove(std::string_view key) {
    if (auto ec = check_writable()) return ec;

    auto it = slots_.find(std::string(key));
    if (it == slots_.end()) {
        return make_error_code(Errc::not_found_on_delete);
    }

    const std::size_t slot = it->second;
    const std::size_t last = entries_.size() - 1;
    const format::IndexEntry victim = entries_[slot];

    // Swap-and-shrink: the last entry takes over the freed slot.
    if (slot != last) {
        if (auto ec = write_index_entry(slot, entries_[last])) return ec;
    }
    if (auto ec = write_record_count(static_cast<uint32_t>(last))) return ec;

    untrack(victim);
    slots_.erase(it);
    if (slot != last) {
        untrack(entries_[last]);
        entries_[slot] = std::move(entries_[last]);
        slots_[entries_[slot].key] = slot;
        track(slot);
    }
    entries_.pop_back();

    cache_->erase(key);
    if (auto ec = release_block(victim.data_pointer, victim.data_capacity)) {
        logger_->warn("Could not reclaim block at {} in {}: {}",
                      victim.data_pointer, path_.string(), ec.message());
    }
    return {};
}

void RecordFile::invalidate(std::string_view key) {
    if (cache_) {
        cache_->erase(key);
    }
}

std::error_code RecordFile::sync() {
    if (fd_ == -1) return make_error_code(Errc::closed);
    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    return {};
}

std::vector<std::string> RecordFile::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.push_back(e.key);
    }
    return result;
}

std::optional<format::IndexEntry> RecordFile::entry(std::string_view key) const {
    auto it = slots_.find(std::string(key));
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return entries_[it->second];
}

// ── Space management ─────────────────────────────────────────────────────────

std::error_code RecordFile::check_writable() const {
    if (fd_ == -1) return make_error_code(Errc::closed);
    if (options_.read_only) return make_error_code(Errc::read_only);
    return {};
}

std::error_code RecordFile::check_payload(std::string_view payload) const {
    if (file_length_ + payload.size() > kMaxOffset) {
        return make_error_code(Errc::payload_too_large);
    }
    return {};
}

std::error_code RecordFile::allocate(uint32_t length, Placement placement,
                                     uint32_t& pointer, uint32_t& capacity) {
    if (length == 0) {
        pointer  = static_cast<uint32_t>(file_length_);
        capacity = 0;
        return {};
    }

    if (placement == Placement::FirstFit) {
        if (auto block = free_.take_first_fit(length)) {
            pointer  = block->offset;
            capacity = block->length;
            return {};
        }
    }

    const uint64_t start = file_length_;
    if (start + length > kMaxOffset) {
        return make_error_code(Errc::payload_too_large);
    }
    if (auto ec = set_file_length(start + length)) return ec;

    pointer  = static_cast<uint32_t>(start);
    capacity = length;
    return {};
}

std::error_code RecordFile::release_block(uint32_t pointer, uint32_t capacity) {
    if (capacity == 0) {
        return {};
    }
    free_.release(pointer, capacity);
    return reclaim_tail();
}

std::error_code RecordFile::reclaim_tail() {
    while (auto tail = free_.take_ending_at(file_length_)) {
        if (auto ec = set_file_length(tail->offset)) {
            free_.release(tail->offset, tail->length);
            return ec;
        }
    }
    return {};
}

std::error_code RecordFile::ensure_index_space(uint64_t required_slots) {
    const uint64_t index_end = options_.layout.index_entry_offset(required_slots);
    if (index_end > kMaxOffset) {
        return make_error_code(Errc::payload_too_large);
    }
    if (index_end <= data_start_) {
        return {};
    }

    // Records moved out of the way must land past the new index end; the
    // bytes in between become a free block that the watermark absorbs below.
    if (data_start_ < file_length_ && file_length_ < index_end) {
        const uint64_t old_length = file_length_;
        if (auto ec = set_file_length(index_end)) return ec;
        free_.release(static_cast<uint32_t>(old_length),
                      static_cast<uint32_t>(index_end - old_length));
    }

    while (index_end > data_start_) {
        // Empty data region: the watermark just moves.
        if (data_start_ >= file_length_) {
            if (file_length_ < index_end) {
                if (auto ec = set_file_length(index_end)) return ec;
            }
            if (auto ec = write_data_start(static_cast<uint32_t>(index_end))) return ec;
            data_start_ = static_cast<uint32_t>(index_end);
            break;
        }

        uint32_t next_start = 0;
        if (auto block = free_.take_at(data_start_)) {
            // Only the part below the new index end is absorbed.
            if (block->end() > index_end) {
                free_.release(static_cast<uint32_t>(index_end),
                              static_cast<uint32_t>(block->end() - index_end));
                next_start = static_cast<uint32_t>(index_end);
            } else {
                next_start = static_cast<uint32_t>(block->end());
            }
        } else {
            auto occ = occupants_.find(data_start_);
            if (occ == occupants_.end()) {
                logger_->error("No block at data start {} in {}", data_start_, path_.string());
                return make_error_code(Errc::format_error);
            }
            next_start = static_cast<uint32_t>(entries_[occ->second].data_end());
            if (auto ec = relocate_to_end(occ->second)) return ec;
        }

        if (auto ec = write_data_start(next_start)) return ec;
        data_start_ = next_start;
    }
    return {};
}

std::error_code RecordFile::relocate_to_end(std::size_t slot) {
    const format::IndexEntry old = entries_[slot];

    std::string data(old.data_length, '\0');
    if (old.data_length > 0) {
        if (auto ec = read_at(old.data_pointer, data.data(), data.size())) return ec;
    }

    const uint64_t pointer = file_length_;
    if (pointer + data.size() > kMaxOffset) {
        return make_error_code(Errc::payload_too_large);
    }
    if (auto ec = set_file_length(pointer + data.size())) return ec;

    format::IndexEntry e = old;
    e.data_pointer  = static_cast<uint32_t>(pointer);
    e.data_capacity = old.data_length;

    std::error_code ec;
    if (!data.empty()) {
        ec = write_at(pointer, data.data(), data.size());
    }
    if (!ec) ec = write_index_entry(slot, e);
    if (ec) return ec;

    untrack(old);
    entries_[slot] = std::move(e);
    track(slot);

    logger_->debug("Index growth moved '{}' from {} to {}", old.key, old.data_pointer, pointer);
    return {};
}

void RecordFile::track(std::size_t slot) {
    const auto& e = entries_[slot];
    if (e.data_capacity > 0) {
        occupants_[e.data_pointer] = slot;
    }
}

void RecordFile::untrack(const format::IndexEntry& e) {
    if (e.data_capacity > 0) {
        occupants_.erase(e.data_pointer);
    }
}

// ── Raw I/O ──────────────────────────────────────────────────────────────────

std::error_code RecordFile::write_index_entry(std::size_t slot, const format::IndexEntry& e) {
    const auto bytes = format::encode_index_entry(options_.layout, e);
    return write_at(options_.layout.index_entry_offset(slot), bytes.data(), bytes.size());
}

std::error_code RecordFile::write_record_count(uint32_t count) {
    const auto bytes = format::encode_u32(count);
    return write_at(format::kRecordCountOffset, bytes.data(), bytes.size());
}

std::error_code RecordFile::write_data_start(uint32_t data_start) {
    const auto bytes = format::encode_u32(data_start);
    return write_at(options_.layout.data_start_offset, bytes.data(), bytes.size());
}

std::error_code RecordFile::set_file_length(uint64_t length) {
    if (::ftruncate(fd_, static_cast<off_t>(length)) < 0) {
        return make_errno_error();
    }
    file_length_ = length;
    return {};
}

std::error_code RecordFile::write_at(uint64_t offset, const void* data, std::size_t len) {
    const auto* ptr = static_cast<const uint8_t*>(data);
    std::size_t written = 0;
    while (written < len) {
        auto n = ::pwrite(fd_, ptr + written, len - written,
                          static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code RecordFile::read_at(uint64_t offset, void* data, std::size_t len) const {
    auto* ptr = static_cast<uint8_t*>(data);
    std::size_t total = 0;
    while (total < len) {
        auto n = ::pread(fd_, ptr + total, len - total,
                         static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) {
            return make_error_code(Errc::io_failure);  // unexpected EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return {};
}

} // namespace recdb
