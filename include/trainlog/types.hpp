#pragma once

/// @file include/trainlog/types.hpp
/// @brief Shared value types for the trainlog pipeline.
///
/// Every module includes this file. It defines the parsed record, the config
/// parameter pair and the per-run parse report.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trainlog {

// ─── LogRecord ────────────────────────────────────────────────────────────────

/// One successfully parsed training-log line.
///
/// Field order matches the column order of the full-record and best tables.
struct LogRecord {
    std::uint64_t step{0};          ///< Global step counter
    std::string   episode;          ///< Episode id, ASCII digits only
    std::string   decision;         ///< Decision label, e.g. "A1-B2"
    double        eps{0.0};         ///< Exploration parameter ε
    double        learning_rate{0.0}; ///< Learning rate ("lr")
    double        ret{0.0};         ///< Episode return ("Ret"), ranking field
    std::uint64_t last_crash{0};    ///< Opaque crash counter ("Last Crash")
    double        step_time{0.0};   ///< Wall time of the step in seconds ("t")
    double        sf{0.0};          ///< Opaque scalar ("SF")
    bool          found{false};     ///< Target seen flag ("Seen=0|1")
    double        reward{0.0};      ///< Step reward

    bool operator==(const LogRecord&) const = default;
};

// ─── ConfigParameter ──────────────────────────────────────────────────────────

/// A section-qualified ini parameter: `parameter` is "section.key".
struct ConfigParameter {
    std::string parameter;
    std::string value;  ///< Raw, untyped

    bool operator==(const ConfigParameter&) const = default;
};

// ─── ParseReport ──────────────────────────────────────────────────────────────

/// Parse yield for one run. Advisory only; never used for control flow.
struct ParseReport {
    std::string run_name;
    std::size_t files_scanned{0};     ///< Log files read
    std::size_t total_lines_seen{0};  ///< Lines offered to the extractor
    std::size_t lines_parsed{0};      ///< Lines that produced a LogRecord
    std::size_t episodes{0};          ///< Rows in the best table
    std::size_t config_files{0};      ///< Config files harvested
    std::optional<std::string> config_error;  ///< Set if the config pass failed

    [[nodiscard]] std::size_t lines_discarded() const noexcept {
        return total_lines_seen - lines_parsed;
    }

    /// lines_parsed / total_lines_seen, or 0 if no lines were seen.
    [[nodiscard]] double yield() const noexcept {
        if (total_lines_seen == 0) return 0.0;
        return static_cast<double>(lines_parsed)
             / static_cast<double>(total_lines_seen);
    }
};

// ─── Episode ids ──────────────────────────────────────────────────────────────

/// Three-way numeric comparison of two digit strings of any length.
///
/// Leading zeros are ignored, so "03" and "3" compare equal. Precondition:
/// both ids consist of ASCII digits only (the grammar guarantees this).
[[nodiscard]] int compare_episode_ids(std::string_view a,
                                      std::string_view b) noexcept;

/// Strict-weak "less than" over episode ids by numeric value.
struct EpisodeNumericLess {
    [[nodiscard]] bool operator()(std::string_view a,
                                  std::string_view b) const noexcept {
        return compare_episode_ids(a, b) < 0;
    }
};

} // namespace trainlog
