/// @file src/io/table_io.cpp
/// @brief CSV rendering and loading of record and config tables.

#include "trainlog/table_io.hpp"
#include "trainlog/constants.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

namespace trainlog::io {

namespace {

std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::optional<double> parse_finite(std::string_view s) noexcept {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return std::nullopt;
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

bool all_digits(std::string_view s) noexcept {
    if (s.empty()) return false;
    for (const char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

/// Read a whole file; `nullopt` if it cannot be opened or read.
std::optional<std::string> read_file(const std::filesystem::path& path) noexcept {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return contents.str();
}

/// Iterate the lines of `text` with trailing CR removed.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        start = end + 1;
        if (!fn(line)) return;
    }
}

} // anonymous namespace

// ─── Rendering ────────────────────────────────────────────────────────────────

std::string format_decimal(double value) {
    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string record_header() {
    return fmt::format("{}", fmt::join(constants::RECORD_COLUMNS, ","));
}

std::string record_row(const LogRecord& r) {
    return fmt::format("{},{},{},{},{},{},{},{},{},{},{}",
        r.step,
        csv_escape(r.episode),
        csv_escape(r.decision),
        format_decimal(r.eps),
        format_decimal(r.learning_rate),
        format_decimal(r.ret),
        r.last_crash,
        format_decimal(r.step_time),
        format_decimal(r.sf),
        r.found ? "True" : "False",
        format_decimal(r.reward));
}

std::string config_header() {
    return fmt::format("{}", fmt::join(constants::CONFIG_COLUMNS, ","));
}

std::string config_row(const ConfigParameter& param) {
    return fmt::format("{},{}", csv_escape(param.parameter), csv_escape(param.value));
}

std::string render_records(const std::vector<LogRecord>& records) {
    std::string out = record_header();
    out += '\n';
    for (const auto& r : records) {
        out += record_row(r);
        out += '\n';
    }
    return out;
}

std::string render_config(const std::vector<ConfigParameter>& params) {
    std::string out = config_header();
    out += '\n';
    for (const auto& p : params) {
        out += config_row(p);
        out += '\n';
    }
    return out;
}

// ─── split_csv_line ───────────────────────────────────────────────────────────

std::optional<std::vector<std::string>>
split_csv_line(std::string_view line) noexcept {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }

    if (quoted) return std::nullopt;
    fields.push_back(std::move(field));
    return fields;
}

// ─── parse_record_row ─────────────────────────────────────────────────────────

std::optional<LogRecord> parse_record_row(std::string_view line) noexcept {
    const auto fields = split_csv_line(line);
    if (!fields || fields->size() != constants::RECORD_COLUMN_COUNT) {
        return std::nullopt;
    }
    const auto& f = *fields;

    const auto step       = parse_u64(f[0]);
    const auto eps        = parse_finite(f[3]);
    const auto lr         = parse_finite(f[4]);
    const auto ret        = parse_finite(f[5]);
    const auto last_crash = parse_u64(f[6]);
    const auto step_time  = parse_finite(f[7]);
    const auto sf         = parse_finite(f[8]);
    const auto reward     = parse_finite(f[10]);

    if (!step || !eps || !lr || !ret || !last_crash || !step_time || !sf || !reward) {
        return std::nullopt;
    }
    if (!all_digits(f[1]) || f[2].empty()) return std::nullopt;
    if (f[9] != "True" && f[9] != "False") return std::nullopt;

    return LogRecord{
        .step          = *step,
        .episode       = f[1],
        .decision      = f[2],
        .eps           = *eps,
        .learning_rate = *lr,
        .ret           = *ret,
        .last_crash    = *last_crash,
        .step_time     = *step_time,
        .sf            = *sf,
        .found         = f[9] == "True",
        .reward        = *reward,
    };
}

// ─── parse_records_csv ────────────────────────────────────────────────────────

std::optional<std::vector<LogRecord>>
parse_records_csv(std::string_view csv_content) noexcept {
    const std::string header = record_header();
    std::vector<LogRecord> records;
    bool header_ok   = false;
    bool header_seen = false;

    for_each_line(csv_content, [&](std::string_view line) {
        if (!header_seen) {
            header_seen = true;
            header_ok   = line == header;
            return header_ok;
        }
        if (line.empty()) return true;
        if (auto rec = parse_record_row(line)) {
            records.push_back(std::move(*rec));
        }
        return true;
    });

    if (!header_ok) return std::nullopt;
    return records;
}

// ─── load_records_csv ─────────────────────────────────────────────────────────

std::optional<std::vector<LogRecord>>
load_records_csv(const std::filesystem::path& path) noexcept {
    const auto contents = read_file(path);
    if (!contents) return std::nullopt;
    return parse_records_csv(*contents);
}

// ─── load_config_csv ──────────────────────────────────────────────────────────

std::optional<std::vector<ConfigParameter>>
load_config_csv(const std::filesystem::path& path) noexcept {
    const auto contents = read_file(path);
    if (!contents) return std::nullopt;

    const std::string header = config_header();
    std::vector<ConfigParameter> params;
    bool header_ok   = false;
    bool header_seen = false;

    // Values may span lines inside quotes, so rows are accumulated until the
    // quotes balance.
    std::string pending;
    for_each_line(*contents, [&](std::string_view line) {
        if (!header_seen) {
            header_seen = true;
            header_ok   = line == header;
            return header_ok;
        }
        if (!pending.empty()) pending += '\n';
        pending += line;

        const auto fields = split_csv_line(pending);
        if (!fields) return true;  // quoted field continues on the next line
        if (fields->size() == 2) {
            params.push_back(ConfigParameter{(*fields)[0], (*fields)[1]});
        }
        pending.clear();
        return true;
    });

    if (!header_ok) return std::nullopt;
    return params;
}

} // namespace trainlog::io
