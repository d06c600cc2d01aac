#pragma once

/// @file include/trainlog/grammar.hpp
/// @brief Record Extractor: line grammars that turn log text into LogRecords.
///
/// # Module: Record Extractor
///
/// ## Responsibility
/// Match one raw log line against a fixed grammar and return a typed
/// `LogRecord`, or reject the line.
///
/// ## Line Format (iter-v1)
/// ```
/// 12:00:01 worker-3 - Iter: 100/3 A1-B2 - Rand Eps: 0.10 lr: 0.001 Ret = 5.0
///     Last Crash = 2 t=0.05 SF = 1.0 Seen=1 Reward: 50.0
/// ```
/// (a single line in practice). Everything before the first `-  Iter:` that
/// lets the rest of the line match is skipped, and text after `Reward:` is
/// ignored.
///
/// ## Guarantees
/// - Pure and deterministic: same text, same result
/// - Never throws; malformed input yields `nullopt`
/// - All-or-nothing: one bad token rejects the whole line
///
/// ## NOT Responsible For
/// - Reading files (see orchestrator.hpp)
/// - Ranking records (see reducer.hpp)

#include "trainlog/types.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace trainlog::grammar {

// ─── LineGrammar ──────────────────────────────────────────────────────────────

/// A named log-line format. Implementations must be stateless and `noexcept`.
class LineGrammar {
public:
    virtual ~LineGrammar() = default;

    /// Registry name of this grammar, e.g. "iter-v1".
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Parse one line (with or without its trailing newline).
    ///
    /// # Returns
    /// The record if the whole grammar matched, `nullopt` otherwise.
    [[nodiscard]] virtual std::optional<LogRecord>
    extract(std::string_view line) const noexcept = 0;
};

// ─── IterLineGrammar ──────────────────────────────────────────────────────────

/// The `- Iter: step/episode ...` format written by the training harness.
///
/// After the `-\s+Iter:\s+` prefix the line must read, with `\s` standing for
/// ASCII whitespace:
///
///     step\s*/\s*episode\s+ D\s+-\s+ (Rand|Pred)\s+Eps:\s+N
///     \s+lr:\s+N \s+Ret\s*=\s*N \s+Last\s+Crash\s*=\s*U \s+t=N
///     \s+SF\s*=\s*N \s+Seen=\s*[01] \s+Reward:\s*N
///
/// where D is `[A-Z][0-9]-[A-Z][0-9]`, N is `[+-]?\d+(\.\d+)?` and U is `\d+`.
class IterLineGrammar final : public LineGrammar {
public:
    static constexpr std::string_view NAME = "iter-v1";

    [[nodiscard]] std::string_view name() const noexcept override {
        return NAME;
    }

    [[nodiscard]] std::optional<LogRecord>
    extract(std::string_view line) const noexcept override;

private:
    /// Match the grammar body starting right after `Iter:`.
    [[nodiscard]] static std::optional<LogRecord>
    match_body(std::string_view body) noexcept;
};

// ─── Registry ─────────────────────────────────────────────────────────────────

/// Create the grammar registered under `name`.
///
/// # Returns
/// `nullptr` if no grammar has that name.
[[nodiscard]] std::unique_ptr<LineGrammar> make_grammar(std::string_view name);

/// Names accepted by `make_grammar`, default first.
[[nodiscard]] std::vector<std::string_view> grammar_names();

/// Parse `line` with the default `IterLineGrammar`.
[[nodiscard]] std::optional<LogRecord> extract(std::string_view line) noexcept;

} // namespace trainlog::grammar
