/// @file src/grammar/iter_line_grammar.cpp
/// @brief IterLineGrammar and the grammar registry.
///
/// The matcher is a hand-written cursor over the line. Each token consumes
/// greedily and never needs to backtrack: every numeric token is followed by
/// mandatory whitespace (or ends the grammar), so a shorter match could never
/// succeed where the greedy one failed. The only search is over the `-` that
/// introduces `Iter:`.

#include "trainlog/grammar.hpp"

#include <charconv>
#include <cstdint>
#include <system_error>

namespace trainlog::grammar {

namespace {

// ─── Character classes ────────────────────────────────────────────────────────

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr bool is_upper(char c) noexcept {
    return c >= 'A' && c <= 'Z';
}

// ─── Cursor ───────────────────────────────────────────────────────────────────

/// Forward-only scanner. Every method either consumes its token and returns
/// success, or fails; after a failure the caller abandons the whole match.
class Cursor {
public:
    explicit Cursor(std::string_view text) noexcept : text_(text) {}

    /// `\s*` when `required` is false, `\s+` otherwise.
    bool spaces(bool required) noexcept {
        const std::size_t start = pos_;
        while (pos_ < text_.size() && is_space(text_[pos_])) ++pos_;
        return !required || pos_ > start;
    }

    bool literal(std::string_view lit) noexcept {
        if (text_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    /// `\d+`, returned as a view into the line.
    std::optional<std::string_view> digits() noexcept {
        const std::size_t start = pos_;
        while (pos_ < text_.size() && is_digit(text_[pos_])) ++pos_;
        if (pos_ == start) return std::nullopt;
        return text_.substr(start, pos_ - start);
    }

    /// `\d+` converted to a 64-bit unsigned integer; overflow fails.
    std::optional<std::uint64_t> unsigned_int() noexcept {
        const auto tok = digits();
        if (!tok) return std::nullopt;
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(tok->data(), tok->data() + tok->size(), value);
        if (ec != std::errc{} || ptr != tok->data() + tok->size()) return std::nullopt;
        return value;
    }

    /// `[+-]?\d+(\.\d+)?` converted to double; out-of-range fails.
    std::optional<double> decimal() noexcept {
        const std::size_t start = pos_;
        bool plus = false;
        if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
            plus = text_[pos_] == '+';
            ++pos_;
        }
        if (!digits()) return std::nullopt;
        if (pos_ + 1 < text_.size() && text_[pos_] == '.' && is_digit(text_[pos_ + 1])) {
            ++pos_;
            digits();
        }

        // from_chars rejects a leading '+'.
        const char* first = text_.data() + start + (plus ? 1 : 0);
        const char* last  = text_.data() + pos_;
        double value = 0.0;
        const auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::fixed);
        if (ec != std::errc{} || ptr != last) return std::nullopt;
        return value;
    }

    /// `[A-Z][0-9]-[A-Z][0-9]`
    std::optional<std::string_view> decision() noexcept {
        if (text_.size() - pos_ < 5) return std::nullopt;
        const std::string_view tok = text_.substr(pos_, 5);
        if (!is_upper(tok[0]) || !is_digit(tok[1]) || tok[2] != '-' ||
            !is_upper(tok[3]) || !is_digit(tok[4])) {
            return std::nullopt;
        }
        pos_ += 5;
        return tok;
    }

    /// `[01]` as a boolean.
    std::optional<bool> flag() noexcept {
        if (pos_ >= text_.size()) return std::nullopt;
        const char c = text_[pos_];
        if (c != '0' && c != '1') return std::nullopt;
        ++pos_;
        return c == '1';
    }

private:
    std::string_view text_;
    std::size_t      pos_{0};
};

} // anonymous namespace

// ─── IterLineGrammar::match_body ──────────────────────────────────────────────

std::optional<LogRecord>
IterLineGrammar::match_body(std::string_view body) noexcept {
    Cursor cur(body);
    LogRecord rec;

    // step/episode
    if (!cur.spaces(true)) return std::nullopt;
    const auto step = cur.unsigned_int();
    if (!step) return std::nullopt;
    cur.spaces(false);
    if (!cur.literal("/")) return std::nullopt;
    cur.spaces(false);
    const auto episode = cur.digits();
    if (!episode) return std::nullopt;
    if (!cur.spaces(true)) return std::nullopt;

    // decision, then " - "
    const auto decision = cur.decision();
    if (!decision) return std::nullopt;
    if (!cur.spaces(true) || !cur.literal("-") || !cur.spaces(true)) return std::nullopt;

    // Rand|Pred Eps:
    if (!cur.literal("Rand") && !cur.literal("Pred")) return std::nullopt;
    if (!cur.spaces(true) || !cur.literal("Eps:") || !cur.spaces(true)) return std::nullopt;
    const auto eps = cur.decimal();
    if (!eps) return std::nullopt;

    // lr:
    if (!cur.spaces(true) || !cur.literal("lr:") || !cur.spaces(true)) return std::nullopt;
    const auto lr = cur.decimal();
    if (!lr) return std::nullopt;

    // Ret =
    if (!cur.spaces(true) || !cur.literal("Ret")) return std::nullopt;
    cur.spaces(false);
    if (!cur.literal("=")) return std::nullopt;
    cur.spaces(false);
    const auto ret = cur.decimal();
    if (!ret) return std::nullopt;

    // Last Crash =
    if (!cur.spaces(true) || !cur.literal("Last") || !cur.spaces(true) ||
        !cur.literal("Crash")) {
        return std::nullopt;
    }
    cur.spaces(false);
    if (!cur.literal("=")) return std::nullopt;
    cur.spaces(false);
    const auto last_crash = cur.unsigned_int();
    if (!last_crash) return std::nullopt;

    // t=
    if (!cur.spaces(true) || !cur.literal("t=")) return std::nullopt;
    const auto step_time = cur.decimal();
    if (!step_time) return std::nullopt;

    // SF =
    if (!cur.spaces(true) || !cur.literal("SF")) return std::nullopt;
    cur.spaces(false);
    if (!cur.literal("=")) return std::nullopt;
    cur.spaces(false);
    const auto sf = cur.decimal();
    if (!sf) return std::nullopt;

    // Seen=
    if (!cur.spaces(true) || !cur.literal("Seen=")) return std::nullopt;
    cur.spaces(false);
    const auto found = cur.flag();
    if (!found) return std::nullopt;

    // Reward:
    if (!cur.spaces(true) || !cur.literal("Reward:")) return std::nullopt;
    cur.spaces(false);
    const auto reward = cur.decimal();
    if (!reward) return std::nullopt;

    rec.step          = *step;
    rec.episode       = std::string(*episode);
    rec.decision      = std::string(*decision);
    rec.eps           = *eps;
    rec.learning_rate = *lr;
    rec.ret           = *ret;
    rec.last_crash    = *last_crash;
    rec.step_time     = *step_time;
    rec.sf            = *sf;
    rec.found         = *found;
    rec.reward        = *reward;
    return rec;
}

// ─── IterLineGrammar::extract ─────────────────────────────────────────────────

std::optional<LogRecord>
IterLineGrammar::extract(std::string_view line) const noexcept {
    static constexpr std::string_view ITER = "Iter:";

    std::size_t pos = 0;
    while (pos < line.size() && is_space(line[pos])) ++pos;

    // The skipped prefix may not span a line break.
    for (; pos < line.size() && line[pos] != '\n'; ++pos) {
        if (line[pos] != '-') continue;

        std::size_t p = pos + 1;
        const std::size_t ws_start = p;
        while (p < line.size() && is_space(line[p])) ++p;
        if (p == ws_start || line.substr(p, ITER.size()) != ITER) continue;

        // Candidate found; a failed body match moves on to the next '-'.
        if (auto rec = match_body(line.substr(p + ITER.size()))) {
            return rec;
        }
    }
    return std::nullopt;
}

// ─── Registry ─────────────────────────────────────────────────────────────────

std::unique_ptr<LineGrammar> make_grammar(std::string_view name) {
    if (name == IterLineGrammar::NAME) {
        return std::make_unique<IterLineGrammar>();
    }
    return nullptr;
}

std::vector<std::string_view> grammar_names() {
    return {IterLineGrammar::NAME};
}

std::optional<LogRecord> extract(std::string_view line) noexcept {
    static const IterLineGrammar grammar;
    return grammar.extract(line);
}

} // namespace trainlog::grammar
