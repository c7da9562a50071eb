#include "storage/database.hpp"

#include "common/error.hpp"

#include <mutex>
#include <shared_mutex>
#include <unordered_set>

namespace recdb {

Database::Database(std::filesystem::path path,
                   StoreOptions options,
                   std::shared_ptr<spdlog::logger> logger)
    : options_(options)
    , logger_(logger ? logger : spdlog::default_logger())
    , file_(std::move(path), std::move(options), logger_)
    , last_modified_(std::chrono::system_clock::now())
{
}

Database::~Database() {
    if (auto ec = close(CloseMode::Safe)) {
        logger_->error("Closing {} failed: {}", file_.path().string(), ec.message());
        if (auto unsafe = close(CloseMode::Unsafe)) {
            logger_->error("Closing {} failed: {}", file_.path().string(), unsafe.message());
        }
    }
}

std::error_code Database::open() {
    std::unique_lock lock(mutex_);

    if (options_.use_queue && options_.queue_capacity == 0) {
        return make_error_code(Errc::queue_capacity);
    }
    if (auto ec = file_.open()) {
        return ec;
    }
    if (options_.use_queue && !queue_) {
        queue_.emplace(options_.queue_capacity);
    }
    return {};
}

std::error_code Database::close(CloseMode mode) {
    std::unique_lock lock(mutex_);

    if (!file_.is_open()) {
        return {};
    }

    if (queue_) {
        if (mode == CloseMode::Safe) {
            // Pending writes are still queued on failure; the file stays open
            // so the caller can retry or close Unsafe.
            if (auto ec = flush_locked()) {
                logger_->error("Not closing {}: {} queued writes could not be flushed",
                               file_.path().string(), queue_->size());
                return ec;
            }
        } else if (!queue_->empty()) {
            logger_->warn("Discarding {} queued writes for {}",
                          queue_->size(), file_.path().string());
            queue_->clear();
        }
    }

    return file_.close();
}

// ── Reads ────────────────────────────────────────────────────────────────────

std::error_code Database::get(std::string_view key, std::string& out) {
    std::unique_lock lock(mutex_);
    ++reads_;

    if (queue_) {
        if (auto pending = queue_->peek(key)) {
            out = std::move(pending->payload);
            return {};
        }
    }
    return file_.read(key, out);
}

bool Database::exists(std::string_view key) const {
    std::shared_lock lock(mutex_);
    if (queue_ && queue_->contains(key)) {
        return true;
    }
    return file_.exists(key);
}

// ── Writes ───────────────────────────────────────────────────────────────────

std::error_code Database::write(std::string_view key, std::string_view payload) {
    std::unique_lock lock(mutex_);
    return write_locked(key, payload, false);
}

std::error_code Database::append(std::string_view key, std::string_view payload) {
    std::unique_lock lock(mutex_);
    return write_locked(key, payload, true);
}

std::error_code Database::quick_write(std::string_view key, std::string_view payload) {
    std::unique_lock lock(mutex_);
    ++writes_;

    // A queued value for the same key is older than this one.
    if (queue_) queue_->drop(key);

    auto ec = commit({std::string(key), std::string(payload), false});
    if (ec) return ec;
    file_.invalidate(key);
    touch();
    return {};
}

std::error_code Database::quick_append(std::string_view key, std::string_view payload) {
    std::unique_lock lock(mutex_);
    ++writes_;

    if (queue_) queue_->drop(key);

    auto ec = commit({std::string(key), std::string(payload), true});
    if (ec) return ec;
    file_.invalidate(key);
    touch();
    return {};
}

std::error_code Database::write_locked(std::string_view key,
                                       std::string_view payload,
                                       bool append) {
    ++writes_;

    if (!file_.is_open()) return make_error_code(Errc::closed);
    if (file_.read_only()) return make_error_code(Errc::read_only);
    // Reject here rather than at flush time, where the caller is long gone.
    if (!format::key_fits(options_.layout, key)) {
        return make_error_code(Errc::key_too_long);
    }

    PendingWrite pending{std::string(key), std::string(payload), append};

    if (queue_) {
        if (!queue_->admit(pending)) {
            if (auto ec = flush_locked()) return ec;
            if (!queue_->admit(std::move(pending))) {
                logger_->critical("Write queue for {} refused '{}' after a full flush",
                                  file_.path().string(), key);
                return make_error_code(Errc::queue_overflow);
            }
        }
    } else {
        if (auto ec = commit(pending)) return ec;
    }

    file_.invalidate(key);
    touch();
    return {};
}

std::error_code Database::remove(std::string_view key) {
    std::unique_lock lock(mutex_);
    ++writes_;

    // Drop first so a stale queued insert cannot resurrect the key.
    std::optional<PendingWrite> held;
    if (queue_) {
        held = queue_->peek(key);
        if (held) queue_->drop(key);
    }

    auto ec = file_.remove(key);
    if (ec == Errc::not_found_on_delete && held) {
        ec.clear();  // it only ever existed in the queue
    }
    if (ec) {
        // The delete did not happen: the newer queued value stays current.
        if (held && !queue_->admit(std::move(*held))) {
            logger_->critical("Lost queued write for '{}' after failed delete in {}",
                              key, file_.path().string());
        }
        return ec;
    }

    file_.invalidate(key);
    touch();
    return {};
}

std::error_code Database::flush() {
    std::unique_lock lock(mutex_);
    return flush_locked();
}

std::error_code Database::set_queue_enabled(bool enabled) {
    std::unique_lock lock(mutex_);

    if (enabled) {
        if (queue_) return {};
        if (options_.queue_capacity == 0) {
            return make_error_code(Errc::queue_capacity);
        }
        queue_.emplace(options_.queue_capacity);
        logger_->debug("Write queue enabled for {} (capacity {})",
                       file_.path().string(), options_.queue_capacity);
        return {};
    }

    if (!queue_) return {};
    if (auto ec = flush_locked()) return ec;
    queue_.reset();
    logger_->debug("Write queue disabled for {}", file_.path().string());
    return {};
}

std::error_code Database::commit(const PendingWrite& w) {
    if (file_.exists(w.key)) {
        return file_.update(w.key, w.payload);
    }
    if (w.append) {
        return file_.quick_insert(w.key, w.payload);
    }
    return file_.insert(w.key, w.payload);
}

std::error_code Database::flush_locked() {
    if (!queue_ || queue_->empty()) {
        return {};
    }
    if (!file_.is_open()) return make_error_code(Errc::closed);

    auto pending = queue_->drain_all();
    logger_->debug("Flushing {} queued writes to {}", pending.size(), file_.path().string());

    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (auto ec = commit(pending[i])) {
            logger_->error("Flushing '{}' to {} failed: {}",
                           pending[i].key, file_.path().string(), ec.message());
            // Put the uncommitted tail back; the queue was just emptied so
            // there is room for all of it.
            for (std::size_t j = i; j < pending.size(); ++j) {
                if (!queue_->admit(std::move(pending[j]))) {
                    logger_->critical("Lost queued write while restoring queue of {}",
                                      file_.path().string());
                }
            }
            return ec;
        }
        file_.invalidate(pending[i].key);
    }
    touch();
    return {};
}

void Database::touch() {
    last_modified_ = std::chrono::system_clock::now();
}

// ── Introspection ────────────────────────────────────────────────────────────

bool Database::queue_enabled() const {
    std::shared_lock lock(mutex_);
    return queue_.has_value();
}

bool Database::is_open() const {
    std::shared_lock lock(mutex_);
    return file_.is_open();
}

std::size_t Database::record_count() const {
    std::shared_lock lock(mutex_);
    return file_.record_count();
}

std::vector<std::string> Database::keys() const {
    std::shared_lock lock(mutex_);

    auto result = file_.keys();
    if (queue_ && !queue_->empty()) {
        std::unordered_set<std::string> on_disk(result.begin(), result.end());
        for (auto& k : queue_->keys()) {
            if (!on_disk.contains(k)) result.push_back(std::move(k));
        }
    }
    return result;
}

Stats Database::stats() const {
    std::shared_lock lock(mutex_);
    return Stats{
        .reads         = reads_,
        .writes        = writes_,
        .records       = file_.record_count(),
        .queued        = queue_ ? queue_->size() : 0,
        .last_modified = last_modified_,
    };
}

} // namespace recdb
