#pragma once

/// @file include/trainlog/summary.hpp
/// @brief Run Summary: dashboard aggregates over a run's persisted tables.
///
/// # Module: Run Summary
///
/// ## Responsibility
/// Compute, from the full and best tables of one run:
///   - total training time in hours:           Σ t / 3600
///   - best-record successes:                  #{best : Reward ≥ 100}
///   - per Step bucket (width 10 000):         mean t, successes, distinct episodes
///   - top 100 best records by Ret, descending
///
/// Bucket of a record: `(Step / width) * width` (integer division).
///
/// ## Guarantees
/// - Pure functions over spans; no I/O except `load_summary` / `list_runs`
/// - Never throws; degenerate configuration returns `nullopt`
/// - Ties in Ret keep table order in the top list
///
/// ## NOT Responsible For
/// - Producing the tables (see orchestrator.hpp)
/// - Chart rendering

#include "trainlog/constants.hpp"
#include "trainlog/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace trainlog::summary {

// ─── Types ────────────────────────────────────────────────────────────────────

struct SummaryConfig {
    /// Width of a Step bucket. Must be positive.
    std::uint64_t bucket_width = constants::STEP_BUCKET_WIDTH;

    /// Reward at or above which a record is a success.
    double success_threshold = constants::SUCCESS_REWARD_THRESHOLD;

    /// Length of the top-by-Ret list.
    std::size_t top_n = constants::TOP_BEST_COUNT;
};

/// Aggregates for one Step bucket of the full table.
struct StepBucket {
    std::uint64_t start{0};          ///< First step of the bucket
    std::size_t   records{0};        ///< Rows in the bucket
    double        mean_step_time{0.0}; ///< Mean of t
    std::size_t   successes{0};      ///< Rows with Reward ≥ threshold
    std::size_t   episodes{0};       ///< Distinct Episode values
};

/// Dashboard aggregates of one run.
struct RunSummary {
    std::string              run_name;
    std::size_t              records{0};        ///< Full-table rows
    std::size_t              best_records{0};   ///< Best-table rows
    double                   total_hours{0.0};
    double                   success_threshold{constants::SUCCESS_REWARD_THRESHOLD};
    std::size_t              best_successes{0};
    std::vector<StepBucket>  buckets;           ///< Ascending by start
    std::vector<LogRecord>   top_best;          ///< Ret descending

    /// Multi-line terminal rendering.
    [[nodiscard]] std::string to_string() const;
};

// ─── Aggregates ───────────────────────────────────────────────────────────────

/// Σ step_time / 3600.
[[nodiscard]] double total_hours(std::span<const LogRecord> records) noexcept;

/// Number of records with reward ≥ threshold.
[[nodiscard]] std::size_t count_successes(std::span<const LogRecord> records,
                                          double threshold) noexcept;

/// Per-bucket aggregates, ascending by bucket start. Empty if width is 0.
[[nodiscard]] std::vector<StepBucket>
step_buckets(std::span<const LogRecord> records,
             std::uint64_t width,
             double success_threshold) noexcept;

/// The `n` records with the highest Ret, descending; ties keep input order.
[[nodiscard]] std::vector<LogRecord>
top_by_return(std::span<const LogRecord> records, std::size_t n) noexcept;

/// All aggregates at once.
///
/// # Returns
/// `nullopt` if `config.bucket_width` is 0.
[[nodiscard]] std::optional<RunSummary>
summarize(std::span<const LogRecord> records,
          std::span<const LogRecord> best,
          const SummaryConfig& config = SummaryConfig{}) noexcept;

// ─── Persisted runs ───────────────────────────────────────────────────────────

/// Summarize `output_root/run_name` from its trainlog.csv and best_results.csv.
///
/// # Returns
/// `nullopt` if either table is missing or unreadable.
[[nodiscard]] std::optional<RunSummary>
load_summary(const std::filesystem::path& output_root,
             const std::string& run_name,
             const SummaryConfig& config = SummaryConfig{}) noexcept;

/// Sorted names of the run directories under `output_root`; empty if the
/// directory does not exist.
[[nodiscard]] std::vector<std::string>
list_runs(const std::filesystem::path& output_root) noexcept;

} // namespace trainlog::summary
