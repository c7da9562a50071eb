#include "common/error.hpp"

namespace recdb {

namespace {

class RecdbCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "recdb"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::ok:                  return "success";
            case Errc::duplicate_key:       return "key already exists";
            case Errc::not_found:           return "key not found";
            case Errc::not_found_on_update: return "key not found on update";
            case Errc::not_found_on_delete: return "key not found on delete";
            case Errc::format_error:        return "file is not a valid record store";
            case Errc::io_failure:          return "I/O failure";
            case Errc::queue_overflow:      return "write queue refused admission after flush";
            case Errc::cache_size:          return "read cache capacity must be greater than 0";
            case Errc::queue_capacity:      return "write queue capacity must be greater than 0";
            case Errc::invalid_layout:      return "invalid file layout parameters";
            case Errc::read_only:           return "store was opened read-only";
            case Errc::closed:              return "store is closed";
            case Errc::key_too_long:        return "key is larger than permitted size";
            case Errc::payload_too_large:   return "payload does not fit in the data region";
        }
        return "unknown recdb error";
    }
};

} // anonymous namespace

const std::error_category& recdb_category() noexcept {
    static const RecdbCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), recdb_category()};
}

bool is_logical_miss(const std::error_code& ec) noexcept {
    return ec == Errc::duplicate_key ||
           ec == Errc::not_found ||
           ec == Errc::not_found_on_update ||
           ec == Errc::not_found_on_delete;
}

bool is_io_failure(const std::error_code& ec) noexcept {
    return ec.category() == std::system_category() ||
           ec.category() == std::generic_category() ||
           ec == Errc::io_failure;
}

} // namespace recdb
