/**
 * @file  bench/bench_extract.cpp
 * @brief Google Benchmark suite for line extraction and best-per-episode
 *        reduction.
 *
 * Benchmarks
 * ----------
 *   BM_Extract_Match        canonical line, full grammar match
 *   BM_Extract_RejectEarly  noise line with no "- Iter:" candidate
 *   BM_Extract_RejectLate   valid line with a broken Reward token
 *   BM_Reducer_Update       BestPerEpisode::update over N records
 *   BM_Accumulator_Stream   RunAccumulator over an in-memory log
 *
 * Build (CMake):
 *   cmake -DTRAINLOG_BENCH=ON ..
 *   cmake --build build --target bench_extract
 *   ./build/bench_extract --benchmark_format=json
 *
 * Throughput units: items/second (lines or records processed).
 * Custom counter "Mlines_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "trainlog/grammar.hpp"
#include "trainlog/orchestrator.hpp"
#include "trainlog/reducer.hpp"
#include "trainlog/sink.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace {

const std::string kMatchLine =
    "2024-05-01 12:00:01 INFO - Iter: 100/3 A1-B2 - Rand Eps: 0.10 lr: 0.001 "
    "Ret = 5.0 Last Crash = 2 t=0.05 SF = 1.0 Seen=1 Reward: 50.0";

const std::string kNoiseLine =
    "2024-05-01 12:00:01 INFO Loading checkpoint from disk, please wait";

const std::string kLateRejectLine =
    "2024-05-01 12:00:01 INFO - Iter: 100/3 A1-B2 - Rand Eps: 0.10 lr: 0.001 "
    "Ret = 5.0 Last Crash = 2 t=0.05 SF = 1.0 Seen=1 Reward: n/a";

/// N records spread over `episodes` episodes with varying Ret.
std::vector<trainlog::LogRecord> make_records(std::size_t n, std::size_t episodes) {
    std::vector<trainlog::LogRecord> rs(n);
    for (std::size_t i = 0; i < n; ++i) {
        rs[i].step     = i;
        rs[i].episode  = std::to_string(i % episodes);
        rs[i].decision = "A1-B2";
        rs[i].ret      = static_cast<double>((i * 7919) % 1000);
    }
    return rs;
}

/// Sink that drops everything.
class NullSink final : public trainlog::io::OutputSink {
public:
    void begin_run(const std::string&) override {}
    void on_record(const trainlog::LogRecord& r) override { benchmark::DoNotOptimize(r.step); }
    void on_best(const std::vector<trainlog::LogRecord>&) override {}
    void on_config(const std::vector<trainlog::ConfigParameter>&) override {}
    void end_run(const trainlog::ParseReport&) override {}
};

void set_line_counters(benchmark::State& state, std::size_t per_iter) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(per_iter));
    state.counters["Mlines_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(per_iter) / 1e6,
        benchmark::Counter::kIsRate);
}

} // anonymous namespace

// ── Extraction ─────────────────────────────────────────────────────────────────

static void BM_Extract_Match(benchmark::State& state) {
    for (auto _ : state) {
        auto rec = trainlog::grammar::extract(kMatchLine);
        benchmark::DoNotOptimize(rec);
    }
    set_line_counters(state, 1);
}
BENCHMARK(BM_Extract_Match);

static void BM_Extract_RejectEarly(benchmark::State& state) {
    for (auto _ : state) {
        auto rec = trainlog::grammar::extract(kNoiseLine);
        benchmark::DoNotOptimize(rec);
    }
    set_line_counters(state, 1);
}
BENCHMARK(BM_Extract_RejectEarly);

static void BM_Extract_RejectLate(benchmark::State& state) {
    for (auto _ : state) {
        auto rec = trainlog::grammar::extract(kLateRejectLine);
        benchmark::DoNotOptimize(rec);
    }
    set_line_counters(state, 1);
}
BENCHMARK(BM_Extract_RejectLate);

// ── Reduction ──────────────────────────────────────────────────────────────────

static void BM_Reducer_Update(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto records = make_records(n, 1000);
    for (auto _ : state) {
        trainlog::reduce::BestPerEpisode table;
        for (const auto& r : records) table.update(r);
        auto best = table.finalize();
        benchmark::DoNotOptimize(best.data());
        benchmark::ClobberMemory();
    }
    set_line_counters(state, n);
}
BENCHMARK(BM_Reducer_Update)->RangeMultiplier(8)->Range(1024, 1 << 18)->Unit(benchmark::kMicrosecond);

// ── Whole-stream accumulation ──────────────────────────────────────────────────

static void BM_Accumulator_Stream(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    std::string log;
    for (std::size_t i = 0; i < n; ++i) {
        log += (i % 4 == 3) ? kNoiseLine : kMatchLine;
        log += '\n';
    }

    const trainlog::grammar::IterLineGrammar grammar;
    for (auto _ : state) {
        NullSink sink;
        trainlog::core::RunAccumulator acc(grammar, sink);
        std::istringstream in(log);
        auto lines = acc.feed_stream(in);
        benchmark::DoNotOptimize(lines);
    }
    set_line_counters(state, n);
}
BENCHMARK(BM_Accumulator_Stream)->RangeMultiplier(8)->Range(1024, 1 << 16)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
