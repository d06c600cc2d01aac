/// @file src/io/sinks.cpp
/// @brief MemorySink and CsvDirectorySink.

#include "trainlog/sink.hpp"
#include "trainlog/constants.hpp"
#include "trainlog/table_io.hpp"

#include <stdexcept>
#include <system_error>

namespace trainlog::io {

namespace fs = std::filesystem;

// ─── MemorySink ───────────────────────────────────────────────────────────────

void MemorySink::begin_run(const std::string& run_name) {
    run_name_ = run_name;
    records_.clear();
    best_.clear();
    config_.clear();
    report_     = ParseReport{};
    has_config_ = false;
    finished_   = false;
}

void MemorySink::on_record(const LogRecord& record) {
    records_.push_back(record);
}

void MemorySink::on_best(const std::vector<LogRecord>& best) {
    best_ = best;
}

void MemorySink::on_config(const std::vector<ConfigParameter>& params) {
    config_     = params;
    has_config_ = true;
}

void MemorySink::end_run(const ParseReport& report) {
    report_   = report;
    finished_ = true;
}

// ─── CsvDirectorySink ─────────────────────────────────────────────────────────

CsvDirectorySink::CsvDirectorySink(fs::path output_root)
    : output_root_(std::move(output_root))
{}

std::ofstream CsvDirectorySink::open_output(const fs::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output: " + path.string());
    }
    return out;
}

void CsvDirectorySink::check_stream(const std::ofstream& out, const fs::path& path) {
    if (!out) {
        throw std::runtime_error("Write failed: " + path.string());
    }
}

void CsvDirectorySink::begin_run(const std::string& run_name) {
    run_dir_ = output_root_ / run_name;

    std::error_code ec;
    fs::create_directories(run_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + run_dir_.string()
                                 + ": " + ec.message());
    }

    // A config table left by an earlier run would outlive a config-less rerun.
    fs::remove(run_dir_ / constants::CONFIG_TABLE_FILE, ec);

    const fs::path full_path = run_dir_ / constants::FULL_TABLE_FILE;
    full_out_ = open_output(full_path);
    full_out_ << record_header() << '\n';
    check_stream(full_out_, full_path);
}

void CsvDirectorySink::on_record(const LogRecord& record) {
    full_out_ << record_row(record) << '\n';
    check_stream(full_out_, run_dir_ / constants::FULL_TABLE_FILE);
}

void CsvDirectorySink::on_best(const std::vector<LogRecord>& best) {
    const fs::path full_path = run_dir_ / constants::FULL_TABLE_FILE;
    full_out_.close();
    check_stream(full_out_, full_path);

    const fs::path best_path = run_dir_ / constants::BEST_TABLE_FILE;
    auto out = open_output(best_path);
    out << render_records(best);
    out.close();
    check_stream(out, best_path);
}

void CsvDirectorySink::on_config(const std::vector<ConfigParameter>& params) {
    const fs::path config_path = run_dir_ / constants::CONFIG_TABLE_FILE;
    auto out = open_output(config_path);
    out << render_config(params);
    out.close();
    check_stream(out, config_path);
}

void CsvDirectorySink::end_run(const ParseReport& /*report*/) {
    if (full_out_.is_open()) {
        full_out_.close();
        check_stream(full_out_, run_dir_ / constants::FULL_TABLE_FILE);
    }
}

} // namespace trainlog::io
