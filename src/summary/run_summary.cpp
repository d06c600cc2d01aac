/// @file src/summary/run_summary.cpp
/// @brief Dashboard aggregates over a run's full and best tables.
///
/// Column reductions use Eigen arrays: the column of interest is gathered
/// (or mapped, for per-bucket samples) into an ArrayXd and reduced there.

#include "trainlog/summary.hpp"
#include "trainlog/table_io.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <system_error>

namespace trainlog::summary {

namespace {

/// Gather one double-valued column into an Eigen array.
template <typename Field>
Eigen::ArrayXd column(std::span<const LogRecord> records, Field field) {
    Eigen::ArrayXd out(static_cast<Eigen::Index>(records.size()));
    for (std::size_t i = 0; i < records.size(); ++i) {
        out[static_cast<Eigen::Index>(i)] = records[i].*field;
    }
    return out;
}

struct BucketAccum {
    std::vector<double>                          step_times;
    std::size_t                                  successes{0};
    std::set<std::string, EpisodeNumericLess>    episodes;
};

}  // namespace

// ─── Aggregates ───────────────────────────────────────────────────────────────

double total_hours(std::span<const LogRecord> records) noexcept {
    if (records.empty()) return 0.0;
    const Eigen::ArrayXd t = column(records, &LogRecord::step_time);
    return t.sum() / constants::SECONDS_PER_HOUR;
}

std::size_t count_successes(std::span<const LogRecord> records,
                            double threshold) noexcept {
    if (records.empty()) return 0;
    const Eigen::ArrayXd reward = column(records, &LogRecord::reward);
    return static_cast<std::size_t>((reward >= threshold).count());
}

std::vector<StepBucket>
step_buckets(std::span<const LogRecord> records,
             std::uint64_t width,
             double success_threshold) noexcept {
    if (width == 0) return {};

    std::map<std::uint64_t, BucketAccum> accums;
    for (const auto& r : records) {
        auto& acc = accums[(r.step / width) * width];
        acc.step_times.push_back(r.step_time);
        if (r.reward >= success_threshold) ++acc.successes;
        acc.episodes.insert(r.episode);
    }

    std::vector<StepBucket> buckets;
    buckets.reserve(accums.size());
    for (const auto& [start, acc] : accums) {
        const Eigen::Map<const Eigen::ArrayXd> t(
            acc.step_times.data(), static_cast<Eigen::Index>(acc.step_times.size()));
        buckets.push_back(StepBucket{
            .start          = start,
            .records        = acc.step_times.size(),
            .mean_step_time = t.mean(),
            .successes      = acc.successes,
            .episodes       = acc.episodes.size(),
        });
    }
    return buckets;
}

std::vector<LogRecord>
top_by_return(std::span<const LogRecord> records, std::size_t n) noexcept {
    std::vector<LogRecord> sorted(records.begin(), records.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const LogRecord& a, const LogRecord& b) { return a.ret > b.ret; });
    if (sorted.size() > n) {
        sorted.resize(n);
    }
    return sorted;
}

std::optional<RunSummary>
summarize(std::span<const LogRecord> records,
          std::span<const LogRecord> best,
          const SummaryConfig& config) noexcept {
    if (config.bucket_width == 0) {
        return std::nullopt;
    }

    RunSummary s;
    s.records        = records.size();
    s.best_records   = best.size();
    s.total_hours    = total_hours(records);
    s.success_threshold = config.success_threshold;
    s.best_successes = count_successes(best, config.success_threshold);
    s.buckets        = step_buckets(records, config.bucket_width, config.success_threshold);
    s.top_best       = top_by_return(best, config.top_n);
    return s;
}

// ─── RunSummary::to_string ────────────────────────────────────────────────────

std::string RunSummary::to_string() const {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "Run: {}\n"
        "  Records: {}   Best episodes: {}\n"
        "  Total training time: {:.2f} h\n"
        "  Successes among best (Reward >= {}): {}\n",
        run_name, records, best_records, total_hours,
        success_threshold, best_successes);

    fmt::format_to(it, "\n  {:>12}  {:>8}  {:>12}  {:>9}  {:>8}\n",
                   "Step bucket", "Rows", "Mean t [s]", "Successes", "Episodes");
    for (const auto& b : buckets) {
        fmt::format_to(it, "  {:>12}  {:>8}  {:>12.6f}  {:>9}  {:>8}\n",
                       b.start, b.records, b.mean_step_time, b.successes, b.episodes);
    }

    fmt::format_to(it, "\n  Top {} best records by Ret\n", top_best.size());
    fmt::format_to(it, "  {:>8}  {:>10}  {:>8}  {:>12}  {:>12}\n",
                   "Episode", "Step", "Decision", "Ret", "Reward");
    for (const auto& r : top_best) {
        fmt::format_to(it, "  {:>8}  {:>10}  {:>8}  {:>12.4f}  {:>12.4f}\n",
                       r.episode, r.step, r.decision, r.ret, r.reward);
    }
    return out;
}

// ─── Persisted runs ───────────────────────────────────────────────────────────

std::optional<RunSummary>
load_summary(const std::filesystem::path& output_root,
             const std::string& run_name,
             const SummaryConfig& config) noexcept {
    const auto run_dir = output_root / run_name;
    const auto records = io::load_records_csv(run_dir / constants::FULL_TABLE_FILE);
    const auto best    = io::load_records_csv(run_dir / constants::BEST_TABLE_FILE);
    if (!records || !best) {
        return std::nullopt;
    }

    auto s = summarize(*records, *best, config);
    if (s) {
        s->run_name = run_name;
    }
    return s;
}

std::vector<std::string>
list_runs(const std::filesystem::path& output_root) noexcept {
    std::vector<std::string> runs;
    std::error_code ec;
    std::filesystem::directory_iterator it(output_root, ec);
    if (ec) return runs;

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            runs.push_back(it->path().filename().string());
        }
    }
    std::sort(runs.begin(), runs.end());
    return runs;
}

}  // namespace trainlog::summary
