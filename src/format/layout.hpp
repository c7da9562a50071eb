#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace recdb::format {

// ── File layout ──────────────────────────────────────────────────────────────
//
//   [ header region            ] header_length bytes
//       [record_count: u32 LE] @ 0
//       [data_start:   u32 LE] @ data_start_offset
//       zero padding
//   [ index region             ] one fixed-size entry per slot
//       [key_len: u16 LE][key][zero padding]           max_key_length bytes
//       [data_pointer: u32 LE][data_capacity: u32 LE]
//       [data_length: u32 LE][zero padding]             record_header_length bytes
//   [ reserved index slots     ] up to data_start
//   [ data region              ] data_start .. end of file
//
// Index entry i lives at header_length + i * index_entry_length().
// The layout is not stored in the file: whoever opens a file must pass the
// layout it was created with.

static constexpr uint32_t kRecordCountOffset      = 0;
static constexpr uint32_t kMinDataStartOffset     = 4;
static constexpr uint32_t kMinRecordHeaderLength  = 12;
static constexpr uint32_t kKeyLengthPrefix        = 2;

struct Layout {
    uint32_t header_length        = 16;
    uint32_t data_start_offset    = 4;
    uint32_t max_key_length       = 64;
    uint32_t record_header_length = 16;

    [[nodiscard]] uint32_t index_entry_length() const noexcept {
        return max_key_length + record_header_length;
    }

    // Byte offset of index slot `slot`.
    [[nodiscard]] uint64_t index_entry_offset(uint64_t slot) const noexcept {
        return static_cast<uint64_t>(header_length) +
               slot * static_cast<uint64_t>(index_entry_length());
    }

    bool operator==(const Layout&) const = default;
};

// Returns Errc::invalid_layout if the header fields overlap, do not fit in the
// header region, or the key / record-header regions are too small.
[[nodiscard]] std::error_code validate(const Layout& layout);

// ── Header ───────────────────────────────────────────────────────────────────

struct FileHeader {
    uint32_t record_count = 0;
    uint32_t data_start   = 0;
};

// Serialise a full header region (header_length bytes, zero padded).
[[nodiscard]] std::vector<uint8_t> encode_header(const Layout& layout,
                                                 const FileHeader& header);

// Parse the header region. `bytes` must hold at least header_length bytes.
[[nodiscard]] std::error_code decode_header(const Layout& layout,
                                            std::span<const uint8_t> bytes,
                                            FileHeader& header);

// ── Index entry ──────────────────────────────────────────────────────────────

struct IndexEntry {
    std::string key;
    uint32_t data_pointer  = 0;
    uint32_t data_capacity = 0;
    uint32_t data_length   = 0;

    // One past the last byte reserved for this entry.
    [[nodiscard]] uint64_t data_end() const noexcept {
        return static_cast<uint64_t>(data_pointer) + data_capacity;
    }

    bool operator==(const IndexEntry&) const = default;
};

// True if `key` (with its u16 length prefix) fits in the key region.
[[nodiscard]] bool key_fits(const Layout& layout, std::string_view key) noexcept;

// Serialise one index slot (index_entry_length() bytes).
// Precondition: key_fits(layout, entry.key).
[[nodiscard]] std::vector<uint8_t> encode_index_entry(const Layout& layout,
                                                      const IndexEntry& entry);

// Parse one index slot. Fails with Errc::format_error if the key length
// prefix overruns the key region or data_length exceeds data_capacity.
[[nodiscard]] std::error_code decode_index_entry(const Layout& layout,
                                                 std::span<const uint8_t> bytes,
                                                 IndexEntry& entry);

// ── Little-endian helpers ────────────────────────────────────────────────────

[[nodiscard]] std::array<uint8_t, 4> encode_u32(uint32_t v) noexcept;
[[nodiscard]] uint32_t decode_u32(const uint8_t* p) noexcept;

} // namespace recdb::format
