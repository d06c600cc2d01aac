/// @file src/config/ini_config.cpp
/// @brief Ini parser and last-file-wins ConfigTable.

#include "trainlog/ini_config.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <unordered_map>

namespace trainlog::config {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ─── IniParseError ────────────────────────────────────────────────────────────

IniParseError::IniParseError(std::string source, std::size_t line,
                             const std::string& message)
    : std::runtime_error(fmt::format("{}:{}: {}", source, line, message))
    , source_(std::move(source))
    , line_(line)
{}

// ─── parse_ini ────────────────────────────────────────────────────────────────

std::vector<ConfigParameter>
parse_ini(std::string_view text, const std::string& source) {
    std::vector<ConfigParameter> params;
    std::unordered_map<std::string, std::size_t> seen;  // parameter → slot
    std::string section;
    bool have_section = false;

    std::size_t line_no = 0;
    std::size_t start   = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        const std::string_view raw = text.substr(start, end - start);
        start = end + 1;
        ++line_no;

        const std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw IniParseError(source, line_no, "unterminated section header");
            }
            const auto name = trim(line.substr(1, line.size() - 2));
            if (name.empty()) {
                throw IniParseError(source, line_no, "empty section name");
            }
            section      = std::string(name);
            have_section = true;
            continue;
        }

        if (!have_section) {
            throw IniParseError(source, line_no, "key/value pair before any section header");
        }

        const auto delim = line.find_first_of("=:");
        if (delim == std::string_view::npos) {
            throw IniParseError(source, line_no,
                                fmt::format("expected 'key = value', got '{}'", line));
        }
        const auto key = trim(line.substr(0, delim));
        if (key.empty()) {
            throw IniParseError(source, line_no, "empty key");
        }

        std::string name = fmt::format("{}.{}", section, key);
        std::string value(trim(line.substr(delim + 1)));

        const auto it = seen.find(name);
        if (it != seen.end()) {
            params[it->second].value = std::move(value);
        } else {
            seen.emplace(name, params.size());
            params.push_back(ConfigParameter{std::move(name), std::move(value)});
        }
    }

    return params;
}

// ─── load_ini ─────────────────────────────────────────────────────────────────

std::vector<ConfigParameter> load_ini(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Read error in config file: " + path.string());
    }

    return parse_ini(contents.str(), path.string());
}

// ─── ConfigTable ──────────────────────────────────────────────────────────────

void ConfigTable::merge(const std::vector<ConfigParameter>& params) {
    for (const auto& p : params) {
        values_.insert_or_assign(p.parameter, p.value);
    }
}

std::vector<ConfigParameter> ConfigTable::parameters() const {
    std::vector<ConfigParameter> out;
    out.reserve(values_.size());
    for (const auto& [name, value] : values_) {
        out.push_back(ConfigParameter{name, value});
    }
    return out;
}

} // namespace trainlog::config
