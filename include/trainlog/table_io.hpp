#pragma once

/// @file include/trainlog/table_io.hpp
/// @brief CSV rendering and loading of the record and config tables.
///
/// # Module: Table I/O
///
/// ## Table Format
/// ```
/// Step,Episode,Decision,Eps,lr,Ret,Last Crash,t,SF,Found,Reward
/// 100,3,A1-B2,0.1,0.001,5.0,2,0.05,1.0,True,50.0
/// ```
/// Decimals are written as the shortest text that round-trips, with ".0"
/// appended to integral values. `Found` is written as `True`/`False`.
///
/// ## Guarantees
/// - Rendering is deterministic (byte-identical output for identical input)
/// - Loading never throws on bad rows: malformed rows are skipped
/// - Loading returns `nullopt` if the file cannot be opened or the header
///   does not match

#include "trainlog/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trainlog::io {

// ─── Rendering ────────────────────────────────────────────────────────────────

/// Shortest round-trip text for `value`, with ".0" appended when integral.
[[nodiscard]] std::string format_decimal(double value);

/// Quote `field` per RFC 4180 if it contains `,`, `"`, CR or LF.
[[nodiscard]] std::string csv_escape(std::string_view field);

/// "Step,Episode,...,Reward" (no trailing newline).
[[nodiscard]] std::string record_header();

/// One record as a CSV row (no trailing newline).
[[nodiscard]] std::string record_row(const LogRecord& record);

/// "parameter,value" (no trailing newline).
[[nodiscard]] std::string config_header();

/// One config parameter as a CSV row (no trailing newline).
[[nodiscard]] std::string config_row(const ConfigParameter& param);

/// Header plus one row per record, each line newline-terminated.
[[nodiscard]] std::string render_records(const std::vector<LogRecord>& records);

/// Header plus one row per parameter, each line newline-terminated.
[[nodiscard]] std::string render_config(const std::vector<ConfigParameter>& params);

// ─── Loading ──────────────────────────────────────────────────────────────────

/// Split one CSV line into fields, honouring RFC 4180 quoting.
///
/// # Returns
/// `nullopt` on an unterminated quoted field.
[[nodiscard]] std::optional<std::vector<std::string>>
split_csv_line(std::string_view line) noexcept;

/// Parse a single record row. Returns `nullopt` if any field is malformed.
[[nodiscard]] std::optional<LogRecord>
parse_record_row(std::string_view line) noexcept;

/// Parse a full or best table from text.
///
/// # Returns
/// - `nullopt` if the first line is not the record header
/// - Records in file order, skipping malformed rows
[[nodiscard]] std::optional<std::vector<LogRecord>>
parse_records_csv(std::string_view csv_content) noexcept;

/// Load a full or best table from disk. `nullopt` if unreadable or the
/// header does not match.
[[nodiscard]] std::optional<std::vector<LogRecord>>
load_records_csv(const std::filesystem::path& path) noexcept;

/// Load a config table from disk. `nullopt` if unreadable or the header
/// does not match.
[[nodiscard]] std::optional<std::vector<ConfigParameter>>
load_config_csv(const std::filesystem::path& path) noexcept;

} // namespace trainlog::io
