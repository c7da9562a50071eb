#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace recdb {

// ── Error codes ───────────────────────────────────────────────────────────────
//
// Every failure of the record store is reported as a std::error_code.
// Logical misses (duplicate_key, not_found*) are recoverable: the operation
// simply did not apply.  format_error and queue_overflow indicate a
// structurally broken file or a consistency bug.  OS-level I/O failures keep
// their system_category code; short reads are reported as io_failure.

enum class Errc {
    ok = 0,

    // Logical, caller-recoverable.
    duplicate_key = 1,
    not_found,
    not_found_on_update,
    not_found_on_delete,

    // Structural / fatal.
    format_error,
    io_failure,
    queue_overflow,

    // Invalid construction parameters.
    cache_size,
    queue_capacity,
    invalid_layout,

    // Usage.
    read_only,
    closed,
    key_too_long,
    payload_too_large,
};

[[nodiscard]] const std::error_category& recdb_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// True for duplicate_key / not_found / not_found_on_update / not_found_on_delete.
[[nodiscard]] bool is_logical_miss(const std::error_code& ec) noexcept;

// True for OS errors and short reads.
[[nodiscard]] bool is_io_failure(const std::error_code& ec) noexcept;

} // namespace recdb

namespace std {

template <>
struct is_error_code_enum<recdb::Errc> : true_type {};

} // namespace std
