#pragma once

/// @file include/trainlog/ini_config.hpp
/// @brief Config Harvester: ini-style run configuration as key/value pairs.
///
/// # Module: Config Harvester
///
/// ## Responsibility
/// Read the ini files stored next to a run's logs and flatten them into
/// `section.key = value` parameters for the config table.
///
/// ## Accepted Syntax
/// ```
/// # comment            ; comment
/// [training]
/// lr = 0.001
/// batch_size: 64
/// ```
/// - Blank lines and lines starting with `#` or `;` are ignored
/// - A pair splits at the first `=` or `:`; key and value are trimmed
/// - Inline comments are part of the value
/// - Keys and section names are case-sensitive
///
/// ## Errors
/// `IniParseError` on a pair before the first section header, a malformed
/// or empty section header, a line with no delimiter, or an empty key.

#include "trainlog/types.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace trainlog::config {

// ─── IniParseError ────────────────────────────────────────────────────────────

/// Syntax error in an ini file. `what()` reads "source:line: message".
class IniParseError : public std::runtime_error {
public:
    IniParseError(std::string source, std::size_t line, const std::string& message);

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    std::string source_;
    std::size_t line_;
};

// ─── Parsing ──────────────────────────────────────────────────────────────────

/// Parse ini text into parameters, in file order. A key repeated within the
/// same section appears once, with its last value, at its first position.
///
/// # Arguments
/// * `text`   : Full file contents
/// * `source` : Name used in error messages (usually the file path)
///
/// # Throws
/// `IniParseError` on any syntax error.
[[nodiscard]] std::vector<ConfigParameter>
parse_ini(std::string_view text, const std::string& source = "<string>");

/// Read and parse an ini file.
///
/// # Throws
/// `std::runtime_error` if the file cannot be read, `IniParseError` on syntax
/// errors.
[[nodiscard]] std::vector<ConfigParameter>
load_ini(const std::filesystem::path& path);

// ─── ConfigTable ──────────────────────────────────────────────────────────────

/// Parameters merged across files; a later file wins on identical names.
class ConfigTable {
public:
    /// Merge one file's parameters, overwriting existing names.
    void merge(const std::vector<ConfigParameter>& params);

    /// All parameters sorted by name.
    [[nodiscard]] std::vector<ConfigParameter> parameters() const;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

private:
    std::map<std::string, std::string> values_;
};

} // namespace trainlog::config
