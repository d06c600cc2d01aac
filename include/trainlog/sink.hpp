#pragma once

/// @file include/trainlog/sink.hpp
/// @brief Output sinks receiving a run's full, best and config tables.
///
/// # Module: Output Sinks
///
/// ## Call Sequence (one run)
/// ```
/// begin_run(name)
/// on_record(r) ...          // every parsed line, in input order
/// on_best(best)             // once, sorted by episode
/// on_config(params)         // at most once, only if config files exist
/// end_run(report)
/// ```
///
/// ## Implementations
/// - `CsvDirectorySink` : `<output_root>/<run>/trainlog.csv`,
///   `best_results.csv`, `config.csv`
/// - `MemorySink` : keeps every table in memory (tests, summaries)

#include "trainlog/types.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace trainlog::io {

// ─── OutputSink ───────────────────────────────────────────────────────────────

/// Receives the derived tables of one run. Implementations report write
/// failures by throwing `std::runtime_error`.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void begin_run(const std::string& run_name) = 0;
    virtual void on_record(const LogRecord& record) = 0;
    virtual void on_best(const std::vector<LogRecord>& best) = 0;
    virtual void on_config(const std::vector<ConfigParameter>& params) = 0;
    virtual void end_run(const ParseReport& report) = 0;
};

/// Creates a fresh sink for each run in batch mode.
using OutputSinkFactory = std::function<std::unique_ptr<OutputSink>(const std::string& run_name)>;

// ─── MemorySink ───────────────────────────────────────────────────────────────

/// Collects one run's tables in memory.
class MemorySink final : public OutputSink {
public:
    void begin_run(const std::string& run_name) override;
    void on_record(const LogRecord& record) override;
    void on_best(const std::vector<LogRecord>& best) override;
    void on_config(const std::vector<ConfigParameter>& params) override;
    void end_run(const ParseReport& report) override;

    [[nodiscard]] const std::string& run_name() const noexcept { return run_name_; }
    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept { return records_; }
    [[nodiscard]] const std::vector<LogRecord>& best() const noexcept { return best_; }
    [[nodiscard]] const std::vector<ConfigParameter>& config() const noexcept { return config_; }
    [[nodiscard]] bool has_config() const noexcept { return has_config_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] const ParseReport& report() const noexcept { return report_; }

private:
    std::string                  run_name_;
    std::vector<LogRecord>       records_;
    std::vector<LogRecord>       best_;
    std::vector<ConfigParameter> config_;
    ParseReport                  report_;
    bool                         has_config_{false};
    bool                         finished_{false};
};

// ─── CsvDirectorySink ─────────────────────────────────────────────────────────

/// Writes one run's tables as CSV files under `<output_root>/<run_name>/`.
///
/// The full table is streamed row by row; the directory is created on
/// `begin_run`. Files from a previous run of the same name are overwritten.
class CsvDirectorySink final : public OutputSink {
public:
    explicit CsvDirectorySink(std::filesystem::path output_root);

    void begin_run(const std::string& run_name) override;
    void on_record(const LogRecord& record) override;
    void on_best(const std::vector<LogRecord>& best) override;
    void on_config(const std::vector<ConfigParameter>& params) override;
    void end_run(const ParseReport& report) override;

    /// Directory of the current (or last) run.
    [[nodiscard]] const std::filesystem::path& run_dir() const noexcept { return run_dir_; }

private:
    /// Open `path` for writing or throw.
    [[nodiscard]] static std::ofstream open_output(const std::filesystem::path& path);

    /// Throw if `out` has entered a failed state.
    static void check_stream(const std::ofstream& out, const std::filesystem::path& path);

    std::filesystem::path output_root_;
    std::filesystem::path run_dir_;
    std::ofstream         full_out_;
};

} // namespace trainlog::io
