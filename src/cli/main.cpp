#include "common/error.hpp"
#include "common/logger.hpp"
#include "common/store_config.hpp"
#include "storage/database.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

// Exit codes.
constexpr int kExitOk       = 0;
constexpr int kExitFailure  = 1;
constexpr int kExitNotFound = 2;

int report(const std::string& what, const std::error_code& ec) {
    if (recdb::is_logical_miss(ec)) {
        fprintf(stdout, "NOT_FOUND\n");
        return kExitNotFound;
    }
    spdlog::error("recdb: {} failed: {}", what, ec.message());
    fprintf(stderr, "ERROR %s\n", ec.message().c_str());
    return kExitFailure;
}

int run(recdb::Database& db, const recdb::CliConfig& cfg) {
    const auto& cmd  = cfg.command;
    const auto& args = cfg.args;

    if (cmd == "put" || cmd == "append") {
        auto ec = cmd == "put" ? db.write(args[0], args[1]) : db.append(args[0], args[1]);
        if (ec) return report(cmd, ec);
        fprintf(stdout, "OK\n");
        return kExitOk;
    }

    if (cmd == "get") {
        std::string value;
        if (auto ec = db.get(args[0], value)) return report(cmd, ec);
        fwrite(value.data(), 1, value.size(), stdout);
        fprintf(stdout, "\n");
        return kExitOk;
    }

    if (cmd == "del") {
        if (auto ec = db.remove(args[0])) return report(cmd, ec);
        fprintf(stdout, "DELETED\n");
        return kExitOk;
    }

    if (cmd == "exists") {
        const bool found = db.exists(args[0]);
        fprintf(stdout, "%s\n", found ? "1" : "0");
        return found ? kExitOk : kExitNotFound;
    }

    if (cmd == "keys") {
        for (const auto& k : db.keys()) {
            fprintf(stdout, "%s\n", k.c_str());
        }
        return kExitOk;
    }

    if (cmd == "stats") {
        const auto& file = db.file();
        fprintf(stdout, "records      %zu\n", db.record_count());
        fprintf(stdout, "file_length  %llu\n",
                static_cast<unsigned long long>(file.file_length()));
        fprintf(stdout, "data_start   %u\n", file.data_start());
        fprintf(stdout, "free_bytes   %llu\n",
                static_cast<unsigned long long>(file.free_bytes()));
        fprintf(stdout, "free_blocks  %zu\n", file.free_blocks().size());
        for (const auto& k : db.keys()) {
            if (auto e = file.entry(k)) {
                fprintf(stdout, "  %-24s ptr=%u cap=%u len=%u\n",
                        k.c_str(), e->data_pointer, e->data_capacity, e->data_length);
            }
        }
        return kExitOk;
    }

    // parse_config() has already rejected anything else.
    throw std::logic_error("unhandled command " + cmd);
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    recdb::CliConfig cfg;
    try {
        cfg = recdb::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return kExitFailure;
    }

    const auto level = recdb::parse_log_level(cfg.log_level);
    recdb::init_default_logger(level);

    spdlog::debug("recdb: {} on {} ({})", cfg.command, cfg.file,
                  cfg.options.read_only ? "read-only" : "read-write");

    try {
        recdb::Database db{cfg.file, cfg.options, recdb::make_store_logger("cli", level)};
        if (auto ec = db.open()) {
            return report("open " + cfg.file, ec);
        }

        const int rc = run(db, cfg);

        if (auto ec = db.close(recdb::CloseMode::Safe)) {
            return report("close", ec);
        }
        return rc;

    } catch (const std::exception& ex) {
        spdlog::error("recdb: exception: {}", ex.what());
        return kExitFailure;
    }
}
