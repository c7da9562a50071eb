#include "format/layout.hpp"

#include "common/error.hpp"

#include <cstring>

namespace recdb::format {

namespace {

void put_u16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

void put_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) |
           (static_cast<uint16_t>(p[1]) << 8);
}

} // anonymous namespace

std::array<uint8_t, 4> encode_u32(uint32_t v) noexcept {
    std::array<uint8_t, 4> out{};
    put_u32(out.data(), v);
    return out;
}

uint32_t decode_u32(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// ── Layout ───────────────────────────────────────────────────────────────────

std::error_code validate(const Layout& layout) {
    // record_count occupies [0, 4); data_start must not overlap it.
    if (layout.data_start_offset < kMinDataStartOffset) {
        return make_error_code(Errc::invalid_layout);
    }
    if (static_cast<uint64_t>(layout.data_start_offset) + 4 > layout.header_length) {
        return make_error_code(Errc::invalid_layout);
    }
    // The key region must hold the length prefix and at least one byte.
    if (layout.max_key_length <= kKeyLengthPrefix ||
        layout.max_key_length > kKeyLengthPrefix + 0xFFFF) {
        return make_error_code(Errc::invalid_layout);
    }
    if (layout.record_header_length < kMinRecordHeaderLength) {
        return make_error_code(Errc::invalid_layout);
    }
    return {};
}

// ── Header ───────────────────────────────────────────────────────────────────

std::vector<uint8_t> encode_header(const Layout& layout, const FileHeader& header) {
    std::vector<uint8_t> buf(layout.header_length, 0);
    put_u32(buf.data() + kRecordCountOffset, header.record_count);
    put_u32(buf.data() + layout.data_start_offset, header.data_start);
    return buf;
}

std::error_code decode_header(const Layout& layout,
                              std::span<const uint8_t> bytes,
                              FileHeader& header) {
    if (bytes.size() < layout.header_length) {
        return make_error_code(Errc::format_error);
    }
    header.record_count = decode_u32(bytes.data() + kRecordCountOffset);
    header.data_start   = decode_u32(bytes.data() + layout.data_start_offset);
    return {};
}

// ── Index entry ──────────────────────────────────────────────────────────────

bool key_fits(const Layout& layout, std::string_view key) noexcept {
    return key.size() + kKeyLengthPrefix <= layout.max_key_length;
}

std::vector<uint8_t> encode_index_entry(const Layout& layout, const IndexEntry& entry) {
    std::vector<uint8_t> buf(layout.index_entry_length(), 0);

    put_u16(buf.data(), static_cast<uint16_t>(entry.key.size()));
    std::memcpy(buf.data() + kKeyLengthPrefix, entry.key.data(), entry.key.size());

    uint8_t* rec = buf.data() + layout.max_key_length;
    put_u32(rec,     entry.data_pointer);
    put_u32(rec + 4, entry.data_capacity);
    put_u32(rec + 8, entry.data_length);
    return buf;
}

std::error_code decode_index_entry(const Layout& layout,
                                   std::span<const uint8_t> bytes,
                                   IndexEntry& entry) {
    if (bytes.size() < layout.index_entry_length()) {
        return make_error_code(Errc::format_error);
    }

    const uint16_t key_len = get_u16(bytes.data());
    if (static_cast<uint32_t>(key_len) + kKeyLengthPrefix > layout.max_key_length) {
        return make_error_code(Errc::format_error);
    }
    entry.key.assign(reinterpret_cast<const char*>(bytes.data() + kKeyLengthPrefix), key_len);

    const uint8_t* rec = bytes.data() + layout.max_key_length;
    entry.data_pointer  = decode_u32(rec);
    entry.data_capacity = decode_u32(rec + 4);
    entry.data_length   = decode_u32(rec + 8);

    if (entry.data_length > entry.data_capacity) {
        return make_error_code(Errc::format_error);
    }
    return {};
}

} // namespace recdb::format
