#pragma once

#include <cstddef>
#include <string_view>

/// @file include/trainlog/constants.hpp
/// @brief File names, column names and dashboard thresholds for trainlog.

namespace trainlog::constants {

// ─── Input Discovery ──────────────────────────────────────────────────────────

/// Default extension of training-log files inside a run directory.
static constexpr std::string_view DEFAULT_LOG_EXTENSION = ".txt";

/// Default extensions of ini-style config files inside a run directory.
static constexpr std::string_view DEFAULT_CONFIG_EXTENSIONS[] = {".ini", ".cfg"};

/// Registry name of the default line grammar.
static constexpr std::string_view DEFAULT_GRAMMAR = "iter-v1";

// ─── Output Tables ────────────────────────────────────────────────────────────

static constexpr std::string_view FULL_TABLE_FILE   = "trainlog.csv";
static constexpr std::string_view BEST_TABLE_FILE   = "best_results.csv";
static constexpr std::string_view CONFIG_TABLE_FILE = "config.csv";

/// Column header shared by the full-record and best tables.
static constexpr std::string_view RECORD_COLUMNS[] = {
    "Step", "Episode", "Decision", "Eps", "lr",
    "Ret", "Last Crash", "t", "SF", "Found", "Reward",
};

static constexpr std::size_t RECORD_COLUMN_COUNT = 11;

static constexpr std::string_view CONFIG_COLUMNS[] = {"parameter", "value"};

// ─── Run Summary ──────────────────────────────────────────────────────────────

/// Width of a Step bucket for the per-bucket aggregates.
static constexpr std::size_t STEP_BUCKET_WIDTH = 10'000;

/// A record counts as a success when Reward is at least this value.
static constexpr double SUCCESS_REWARD_THRESHOLD = 100.0;

/// Number of best records listed by Ret descending.
static constexpr std::size_t TOP_BEST_COUNT = 100;

static constexpr double SECONDS_PER_HOUR = 3600.0;

} // namespace trainlog::constants
