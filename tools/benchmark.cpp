// Throughput benchmark for the async storage façade.
//
// Opens a scratch database, then drives N inserts, N point gets and one full
// forward scan through the Pool from C concurrent coroutines on one
// io_context.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "common/db_config.hpp"
#include "storage/database.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <numeric>
#include <string>
#include <vector>

namespace {

namespace asio = boost::asio;
using sluice::storage::Database;
using sluice::storage::Map;
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

constexpr std::size_t kConcurrency = 16;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, clock::duration wall) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = std::chrono::duration<double>(wall).count();
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

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

std::string key_of(std::size_t i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "key%010zu", i);
    return buf;
}

// ── Benchmark runners ────────────────────────────────────────────────────────

// Operation `i` for i in [worker, n) stepping by kConcurrency.
template <typename Op>
asio::awaitable<void> lane(std::size_t worker, std::size_t n, Op op,
                           std::vector<int64_t>& latencies, std::size_t& failures) {
    for (std::size_t i = worker; i < n; i += kConcurrency) {
        auto t0 = clock::now();
        auto ec = co_await op(i);
        auto t1 = clock::now();
        if (ec) {
            ++failures;
            continue;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
}

template <typename Op>
BenchResult run_phase(const char* label, std::size_t n, Op op) {
    asio::io_context ioc;
    std::vector<int64_t> latencies;
    latencies.reserve(n);
    std::size_t failures = 0;

    const auto start = clock::now();
    for (std::size_t w = 0; w < kConcurrency; ++w) {
        asio::co_spawn(ioc, lane(w, n, op, latencies, failures), asio::detached);
    }
    ioc.run();
    const auto wall = clock::now() - start;

    if (failures > 0) {
        spdlog::warn("{}: {} operations failed", label, failures);
    }
    return compute_stats(latencies, wall);
}

asio::awaitable<void> scan_all(Map& map, std::vector<int64_t>& latencies) {
    auto items = map.entries();
    for (;;) {
        auto t0 = clock::now();
        auto [ec, item] = co_await items.next();
        auto t1 = clock::now();
        if (ec || !item) {
            break;
        }
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
}

BenchResult bench_scan(Map& map) {
    asio::io_context ioc;
    std::vector<int64_t> latencies;

    const auto start = clock::now();
    asio::co_spawn(ioc, scan_all(map, latencies), asio::detached);
    ioc.run();
    return compute_stats(latencies, clock::now() - start);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 100'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 100'000;
    }

    const auto dir = std::filesystem::temp_directory_path() / "sluice_benchmark";
    std::filesystem::remove_all(dir);

    sluice::DbConfig cfg;
    cfg.path = dir.string();
    cfg.compression = "none";

    fprintf(stdout,
        "Sluice Storage Benchmark\n"
        "========================\n"
        "Operations:  %zu per phase\n"
        "Concurrency: %zu coroutines\n"
        "Pool:        %u workers, queue %u\n"
        "Path:        %s\n",
        num_ops, kConcurrency, sluice::pool_worker_count(cfg),
        sluice::pool_queue_size(cfg), cfg.path.c_str());

    {
        auto db = Database::open(cfg, sluice::storage::describe({"bench"}));
        auto map = db->get("bench");
        const std::string value(100, 'v');

        auto insert_result = run_phase("insert", num_ops,
            [&](std::size_t i) { return map->insert(key_of(i), value); });

        auto get_result = run_phase("get", num_ops,
            [&](std::size_t i) -> asio::awaitable<std::error_code> {
                auto [ec, v] = co_await map->get(key_of(i));
                co_return ec;
            });

        auto scan_result = bench_scan(*map);

        print_result("Insert", insert_result);
        print_result("Point get", get_result);
        print_result("Forward scan (per item)", scan_result);
        fprintf(stdout, "\n");
    }

    std::filesystem::remove_all(dir);
    return 0;
}
