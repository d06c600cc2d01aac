#pragma once

/// @file include/trainlog/orchestrator.hpp
/// @brief Run Orchestrator: drives extractor and reducer over a run's files.
///
/// # Module: Run Orchestrator
///
/// ## Responsibility
/// Turn one run directory into its derived tables:
///   log files → LineGrammar → (record | discard) → BestPerEpisode
///            ↘ sink.on_record                     ↘ sink.on_best
///   ini files → ConfigTable → sink.on_config
///
/// ## Usage
/// ```cpp
/// RunConfig cfg{.input_root = "data", .output_root = "output"};
/// RunOrchestrator orch(cfg);
/// io::CsvDirectorySink sink(cfg.output_root);
/// auto report = orch.process("run1", cfg.input_root / "run1", sink);
/// fmt::print("{}/{} lines parsed\n", report.lines_parsed, report.total_lines_seen);
/// ```
///
/// ## Guarantees
/// - A malformed line is counted and skipped, never fatal
/// - Files are read in sorted path order, so best-record tie-breaks are
///   reproducible
/// - Runs share no state; `process_all` isolates failures per run
///
/// ## Errors
/// `process` throws `std::runtime_error` if the input directory is missing
/// or unreadable, a log file cannot be read, or the sink fails to write.
/// A failed config pass (unreadable or malformed ini file) is not thrown: it
/// is stored in `ParseReport::config_error` and the log tables still stand.

#include "trainlog/constants.hpp"
#include "trainlog/grammar.hpp"
#include "trainlog/reducer.hpp"
#include "trainlog/sink.hpp"
#include "trainlog/types.hpp"

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trainlog::core {

// ─── RunConfig ────────────────────────────────────────────────────────────────

/// Configuration of the orchestrator. No process-wide paths exist elsewhere.
struct RunConfig {
    /// Directory whose subdirectories are runs (batch mode).
    std::filesystem::path input_root;

    /// Directory receiving one subdirectory of tables per run.
    std::filesystem::path output_root;

    /// Extensions (with leading dot, case-sensitive) of log files.
    std::vector<std::string> log_extensions{
        std::string(constants::DEFAULT_LOG_EXTENSION)};

    /// Extensions of ini-style config files.
    std::vector<std::string> config_extensions{
        std::string(constants::DEFAULT_CONFIG_EXTENSIONS[0]),
        std::string(constants::DEFAULT_CONFIG_EXTENSIONS[1])};

    /// Run the config pass.
    bool harvest_config = true;

    /// If true, emit per-file progress to stderr.
    bool verbose = false;
};

// ─── RunAccumulator ───────────────────────────────────────────────────────────

/// Per-run line-processing state: counts, reducer, and a record callback.
///
/// Holds no file handles, so it can be driven with in-memory input.
class RunAccumulator {
public:
    /// `sink` receives every parsed record; it must outlive the accumulator.
    RunAccumulator(const grammar::LineGrammar& grammar, io::OutputSink& sink) noexcept;

    /// Classify one line. Returns true if it produced a record.
    bool feed_line(std::string_view line);

    /// Feed every line of `in`, including an unterminated last line.
    /// Trailing CR is stripped.
    ///
    /// # Returns
    /// Number of lines read. `in.bad()` is left for the caller to check.
    std::size_t feed_stream(std::istream& in);

    [[nodiscard]] std::size_t total_lines_seen() const noexcept { return total_; }
    [[nodiscard]] std::size_t lines_parsed() const noexcept { return parsed_; }
    [[nodiscard]] std::size_t lines_discarded() const noexcept { return total_ - parsed_; }

    [[nodiscard]] const reduce::BestPerEpisode& best() const noexcept { return best_; }

private:
    const grammar::LineGrammar& grammar_;
    io::OutputSink&             sink_;
    reduce::BestPerEpisode      best_;
    std::size_t                 total_{0};
    std::size_t                 parsed_{0};
};

// ─── RunOutcome ───────────────────────────────────────────────────────────────

/// Result of one run in batch mode.
struct RunOutcome {
    std::string                run_name;
    std::optional<ParseReport> report;  ///< Set on success
    std::string                error;   ///< Set on failure

    [[nodiscard]] bool ok() const noexcept { return report.has_value(); }
};

// ─── RunOrchestrator ──────────────────────────────────────────────────────────

class RunOrchestrator {
public:
    /// Construct with the default `IterLineGrammar`.
    explicit RunOrchestrator(RunConfig config = RunConfig{});

    /// Construct with an explicit grammar (must not be null).
    RunOrchestrator(RunConfig config, std::shared_ptr<const grammar::LineGrammar> grammar);

    /// Process one run directory and stream its tables to `sink`.
    ///
    /// # Arguments
    /// * `run_name`  : Name passed to the sink (usually the directory name)
    /// * `input_dir` : Directory holding the run's log and config files;
    ///                 subdirectories are not searched
    /// * `sink`      : Receives records, best table, config table, report
    ///
    /// # Throws
    /// `std::runtime_error` on a missing directory or any read/write error.
    ParseReport process(const std::string& run_name,
                        const std::filesystem::path& input_dir,
                        io::OutputSink& sink) const;

    /// Process every subdirectory of `config.input_root` as an independent
    /// run, in sorted name order. A failed run is logged and reported; the
    /// remaining runs still execute.
    ///
    /// # Throws
    /// `std::runtime_error` if `input_root` itself is not a readable directory.
    std::vector<RunOutcome> process_all(const io::OutputSinkFactory& make_sink) const;

    /// Log files of `dir` in processing order.
    [[nodiscard]] std::vector<std::filesystem::path>
    log_files(const std::filesystem::path& dir) const;

    /// Config files of `dir` in processing order.
    [[nodiscard]] std::vector<std::filesystem::path>
    config_files(const std::filesystem::path& dir) const;

    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }
    [[nodiscard]] const grammar::LineGrammar& grammar() const noexcept { return *grammar_; }

private:
    /// Regular files directly in `dir` whose extension is in `extensions`,
    /// sorted by path.
    [[nodiscard]] static std::vector<std::filesystem::path>
    list_files(const std::filesystem::path& dir,
               const std::vector<std::string>& extensions);

    /// Harvest config files into `report` and `sink`. Ini read and syntax
    /// errors are recorded in `report`; sink write errors propagate.
    void harvest_config(const std::filesystem::path& input_dir,
                        io::OutputSink& sink,
                        ParseReport& report) const;

    RunConfig                                   config_;
    std::shared_ptr<const grammar::LineGrammar> grammar_;
};

} // namespace trainlog::core
