// Throughput benchmark: compares the write paths of a recdb store.
//
// For each mode a fresh store file is created in the temp directory and N
// records are written, then every record is read back twice (cold, then
// warm through the read cache):
//   (1) write        – insert with free-space search, no queue
//   (2) quick_append – insert at end of file, no queue
//   (3) queued write – write through a write queue
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "common/logger.hpp"
#include "storage/database.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    std::size_t failures{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, std::size_t failures) {
    BenchResult r;
    r.total_ops = latencies_ns.size();
    r.failures  = failures;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const std::string& label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu (%zu failed)\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label.c_str(), r.total_ops, r.failures, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// Time `op` for i in [0, n).
BenchResult measure(std::size_t n, const std::function<std::error_code(std::size_t)>& op) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);
    std::size_t failures = 0;

    for (std::size_t i = 0; i < n; ++i) {
        auto t0 = clock::now();
        auto ec = op(i);
        auto t1 = clock::now();
        if (ec) ++failures;
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
    return compute_stats(latencies, failures);
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

enum class Mode { Write, QuickAppend, Queued };

void bench(const char* label, Mode mode, std::size_t n) {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() /
        ("recdb_bench_" + std::to_string(static_cast<int>(mode)) + ".db");
    std::error_code fs_ec;
    fs::remove(path, fs_ec);

    recdb::StoreOptions options;
    options.initial_index_capacity = 64;
    options.cache_capacity         = n;
    if (mode == Mode::Queued) {
        options.use_queue      = true;
        options.queue_capacity = 256;
    }

    recdb::Database db{path, options};
    if (auto ec = db.open()) {
        spdlog::error("benchmark: cannot open {}: {}", path.string(), ec.message());
        return;
    }

    const std::string value(100, 'v');
    auto writes = measure(n, [&](std::size_t i) {
        const std::string key = "key" + std::to_string(i);
        return mode == Mode::QuickAppend ? db.quick_append(key, value)
                                         : db.write(key, value);
    });
    if (auto ec = db.flush()) {
        spdlog::error("benchmark: flush failed: {}", ec.message());
    }

    std::string out;
    auto cold = measure(n, [&](std::size_t i) { return db.get("key" + std::to_string(i), out); });
    auto warm = measure(n, [&](std::size_t i) { return db.get("key" + std::to_string(i), out); });

    print_result(std::string(label) + " / write", writes);
    print_result(std::string(label) + " / read (cold)", cold);
    print_result(std::string(label) + " / read (warm)", warm);

    if (auto ec = db.close()) {
        spdlog::error("benchmark: close failed: {}", ec.message());
    }
    fs::remove(path, fs_ec);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    recdb::init_default_logger(spdlog::level::warn);

    std::size_t num_records = 10'000;
    if (argc > 1) {
        num_records = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_records == 0) num_records = 10'000;
    }

    fprintf(stdout,
        "recdb Write Path Benchmark\n"
        "==========================\n"
        "Records:  %zu (100-byte payloads)\n",
        num_records);

    bench("write",        Mode::Write,       num_records);
    bench("quick_append", Mode::QuickAppend, num_records);
    bench("queued write", Mode::Queued,      num_records);

    fprintf(stdout, "\n");
    return 0;
}
