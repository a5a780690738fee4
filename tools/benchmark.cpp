// Throughput benchmark for one cache backend.
//
// Opens the backend selected by the usual cache options (--backend, --path,
// --base-dir), runs N set+get cycles on a single io_context thread, walks the
// table once with for_each(), then stops the backend (which forces out any
// pending flush).
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for the set/get phase, plus traversal and shutdown times.

#include "cache/cache.hpp"
#include "cache/cache_factory.hpp"
#include "common/cache_config.hpp"
#include "common/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace asio = boost::asio;
namespace po   = boost::program_options;
using clock    = std::chrono::steady_clock;
using ns       = std::chrono::nanoseconds;

constexpr const char* kTable = "bench";

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

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.elapsed_sec > 0 ? static_cast<double>(r.total_ops) / r.elapsed_sec : 0.0;
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

double elapsed_ms(clock::time_point since) {
    return std::chrono::duration<double, std::milli>(clock::now() - since).count();
}

// ── Benchmark runner ─────────────────────────────────────────────────────────

asio::awaitable<void> run(kvcache::Cache& cache, std::size_t num_cycles) {
    co_await cache.start();

    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2); // set + get per cycle

    for (std::size_t i = 0; i < num_cycles; ++i) {
        std::string key = "key" + std::to_string(i);

        // SET
        {
            auto t0 = clock::now();
            kvcache::Value value{{"n", i}, {"tag", "v" + std::to_string(i)}};
            co_await cache.set(kTable, key, std::move(value));
            latencies.push_back(std::chrono::duration_cast<ns>(clock::now() - t0).count());
        }

        // GET
        {
            auto t0 = clock::now();
            auto value = co_await cache.get(kTable, key);
            latencies.push_back(std::chrono::duration_cast<ns>(clock::now() - t0).count());
            if (!value) {
                spdlog::error("key {} missing right after set", key);
            }
        }
    }
    print_result("Set + Get", compute_stats(latencies));

    std::size_t visited = 0;
    auto t0 = clock::now();
    co_await cache.for_each(kTable, [&visited](kvcache::Value, std::string) -> asio::awaitable<void> {
        ++visited;
        co_return;
    });
    fprintf(stdout, "\n── for_each ──\n  Entries:      %zu\n  Elapsed:      %.3f ms\n",
            visited, elapsed_ms(t0));

    t0 = clock::now();
    co_await cache.stop();
    fprintf(stdout, "\n── stop ──\n  Elapsed:      %.3f ms\n\n", elapsed_ms(t0));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("kvcache-bench options");
    kvcache::add_options(desc);
    desc.add_options()
        ("ops",
            po::value<std::size_t>()->default_value(10'000),
            "Number of set+get cycles");

    kvcache::CacheConfig cfg;
    std::size_t num_cycles = 0;
    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            fprintf(stdout, "%s\n", oss.str().c_str());
            return 0;
        }
        po::notify(vm);
        cfg = kvcache::config_from_variables(vm);
        num_cycles = vm["ops"].as<std::size_t>();
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    if (num_cycles == 0) num_cycles = 10'000;

    const auto level = kvcache::parse_log_level(cfg.log_level);
    kvcache::init_default_logger(level);
    auto logger = kvcache::make_cache_logger("cache", level);

    fprintf(stdout,
        "Cache Backend Benchmark\n"
        "=======================\n"
        "Backend:  %s\n"
        "Path:     %s\n"
        "Cycles:   %zu (each cycle = 1 set + 1 get = 2 ops)\n",
        cfg.backend.c_str(), kvcache::resolve_path(cfg).string().c_str(), num_cycles);

    asio::io_context ioc{1};
    auto cache = kvcache::make_cache(cfg, ioc.get_executor(), logger);

    int exit_code = 0;
    asio::co_spawn(ioc, run(*cache, num_cycles), [&exit_code](std::exception_ptr error) {
        if (!error) return;
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            spdlog::error("benchmark failed: {}", e.what());
            exit_code = 1;
        }
    });
    ioc.run();

    return exit_code;
}
