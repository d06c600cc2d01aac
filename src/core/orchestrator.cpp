/// @file src/core/orchestrator.cpp
/// @brief Run Orchestrator and RunAccumulator.

#include "trainlog/orchestrator.hpp"
#include "trainlog/ini_config.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace trainlog::core {

namespace fs = std::filesystem;

// ─── RunAccumulator ───────────────────────────────────────────────────────────

RunAccumulator::RunAccumulator(const grammar::LineGrammar& grammar,
                               io::OutputSink& sink) noexcept
    : grammar_(grammar)
    , sink_(sink)
{}

bool RunAccumulator::feed_line(std::string_view line) {
    ++total_;
    auto rec = grammar_.extract(line);
    if (!rec) {
        return false;
    }
    ++parsed_;
    best_.update(*rec);
    sink_.on_record(*rec);
    return true;
}

std::size_t RunAccumulator::feed_stream(std::istream& in) {
    std::size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        feed_line(line);
        ++lines;
    }
    return lines;
}

// ─── RunOrchestrator constructors ─────────────────────────────────────────────

RunOrchestrator::RunOrchestrator(RunConfig config)
    : RunOrchestrator(std::move(config), std::make_shared<grammar::IterLineGrammar>())
{}

RunOrchestrator::RunOrchestrator(RunConfig config,
                                 std::shared_ptr<const grammar::LineGrammar> grammar)
    : config_(std::move(config))
    , grammar_(std::move(grammar))
{
    if (!grammar_) {
        throw std::invalid_argument("RunOrchestrator requires a grammar");
    }
}

// ─── File discovery ───────────────────────────────────────────────────────────

std::vector<fs::path>
RunOrchestrator::list_files(const fs::path& dir,
                            const std::vector<std::string>& extensions) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + dir.string() + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("Cannot read directory " + dir.string() + ": " + ec.message());
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string ext = it->path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw std::runtime_error("Cannot read directory " + dir.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> RunOrchestrator::log_files(const fs::path& dir) const {
    return list_files(dir, config_.log_extensions);
}

std::vector<fs::path> RunOrchestrator::config_files(const fs::path& dir) const {
    return list_files(dir, config_.config_extensions);
}

// ─── RunOrchestrator::process ─────────────────────────────────────────────────

ParseReport RunOrchestrator::process(const std::string& run_name,
                                     const fs::path& input_dir,
                                     io::OutputSink& sink) const {
    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        throw std::runtime_error("Input directory not found: " + input_dir.string());
    }

    const auto files = log_files(input_dir);

    ParseReport report;
    report.run_name = run_name;

    sink.begin_run(run_name);
    RunAccumulator acc(*grammar_, sink);

    // ── Log pass ─────────────────────────────────────────────────────────────
    for (const auto& path : files) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Cannot open log file: " + path.string());
        }

        const std::size_t parsed_before = acc.lines_parsed();
        const std::size_t lines = acc.feed_stream(in);
        if (in.bad()) {
            throw std::runtime_error("Read error in log file: " + path.string());
        }
        ++report.files_scanned;

        if (config_.verbose) {
            fmt::print(stderr, "  [{}] {}: {}/{} lines parsed\n",
                       run_name, path.filename().string(),
                       acc.lines_parsed() - parsed_before, lines);
        }
    }

    const auto best = acc.best().finalize();
    sink.on_best(best);

    report.total_lines_seen = acc.total_lines_seen();
    report.lines_parsed     = acc.lines_parsed();
    report.episodes         = best.size();

    // ── Config pass ──────────────────────────────────────────────────────────
    if (config_.harvest_config) {
        harvest_config(input_dir, sink, report);
    }

    sink.end_run(report);
    return report;
}

// ─── RunOrchestrator::harvest_config ──────────────────────────────────────────

void RunOrchestrator::harvest_config(const fs::path& input_dir,
                                     io::OutputSink& sink,
                                     ParseReport& report) const {
    config::ConfigTable table;
    std::size_t harvested = 0;
    try {
        for (const auto& path : config_files(input_dir)) {
            table.merge(config::load_ini(path));
            ++harvested;
        }
    } catch (const std::runtime_error& ex) {
        report.config_error = ex.what();
        fmt::print(stderr, "[WARN] run '{}': config pass failed: {}\n",
                   report.run_name, ex.what());
        return;
    }

    if (harvested == 0) {
        return;
    }
    report.config_files = harvested;
    sink.on_config(table.parameters());
}

// ─── RunOrchestrator::process_all ─────────────────────────────────────────────

std::vector<RunOutcome>
RunOrchestrator::process_all(const io::OutputSinkFactory& make_sink) const {
    std::error_code ec;
    if (!fs::is_directory(config_.input_root, ec)) {
        throw std::runtime_error("Data directory not found: " + config_.input_root.string());
    }

    std::vector<fs::path> run_dirs;
    fs::directory_iterator it(config_.input_root, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + config_.input_root.string()
                                 + ": " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) {
            run_dirs.push_back(it->path());
        }
    }
    if (ec) {
        throw std::runtime_error("Cannot read directory " + config_.input_root.string()
                                 + ": " + ec.message());
    }
    std::sort(run_dirs.begin(), run_dirs.end());

    std::vector<RunOutcome> outcomes;
    outcomes.reserve(run_dirs.size());

    for (const auto& dir : run_dirs) {
        RunOutcome outcome;
        outcome.run_name = dir.filename().string();
        try {
            auto sink = make_sink(outcome.run_name);
            outcome.report = process(outcome.run_name, dir, *sink);
        } catch (const std::exception& ex) {
            outcome.error = ex.what();
            fmt::print(stderr, "[FATAL] run '{}': {}\n", outcome.run_name, ex.what());
        }
        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}

} // namespace trainlog::core
