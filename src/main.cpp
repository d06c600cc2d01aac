/// @file src/main.cpp
/// @brief trainlog CLI entry point.
///
/// Usage:
///   trainlog --parse-all <data_dir> <output_dir> [options]   Parse every run
///   trainlog --parse <run_dir> <output_dir> [options]        Parse one run
///   trainlog --summary <output_dir> <run_name> [--top N] [--bucket W]
///   trainlog --list <output_dir>                             List parsed runs
///   trainlog --help                                          Print usage

#include "trainlog/constants.hpp"
#include "trainlog/grammar.hpp"
#include "trainlog/orchestrator.hpp"
#include "trainlog/sink.hpp"
#include "trainlog/summary.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  trainlog --parse-all <data_dir> <output_dir> [options]\n"
        "  trainlog --parse <run_dir> <output_dir> [options]\n"
        "  trainlog --summary <output_dir> <run_name> [--top N] [--bucket W]\n"
        "  trainlog --list <output_dir>\n"
        "  trainlog --help\n"
        "\n"
        "Parse options:\n"
        "  --log-ext <ext>     Log file extension (repeatable, default .txt)\n"
        "  --no-config         Skip the ini config pass\n"
        "  --grammar <name>    Line grammar (default {})\n"
        "  --verbose           Per-file progress on stderr\n",
        trainlog::constants::DEFAULT_GRAMMAR);
}

// ─── Option parsing ───────────────────────────────────────────────────────────

struct Options {
    trainlog::core::RunConfig     run;
    trainlog::summary::SummaryConfig summary;
    std::string                   grammar{trainlog::constants::DEFAULT_GRAMMAR};
};

std::optional<std::uint64_t> parse_count(std::string_view s) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

/// Parse trailing options starting at argv[first]. Returns nullopt (after
/// printing the reason) on an unknown option or a missing value.
std::optional<Options> parse_options(int argc, char* argv[], int first) {
    Options opts;
    bool custom_ext = false;

    for (int i = first; i < argc; ++i) {
        const std::string_view key(argv[i]);
        const bool has_value = i + 1 < argc;

        if (key == "--verbose") {
            opts.run.verbose = true;
        } else if (key == "--no-config") {
            opts.run.harvest_config = false;
        } else if (key == "--log-ext" && has_value) {
            if (!custom_ext) {
                opts.run.log_extensions.clear();
                custom_ext = true;
            }
            std::string ext(argv[++i]);
            if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
            opts.run.log_extensions.push_back(std::move(ext));
        } else if (key == "--grammar" && has_value) {
            opts.grammar = argv[++i];
        } else if ((key == "--top" || key == "--bucket") && has_value) {
            const auto n = parse_count(argv[++i]);
            if (!n || (key == "--bucket" && *n == 0)) {
                fmt::print(stderr, "Error: {} requires a positive integer\n", key);
                return std::nullopt;
            }
            if (key == "--top") {
                opts.summary.top_n = static_cast<std::size_t>(*n);
            } else {
                opts.summary.bucket_width = *n;
            }
        } else {
            fmt::print(stderr, "Error: unknown or incomplete option '{}'\n", key);
            return std::nullopt;
        }
    }
    return opts;
}

std::optional<trainlog::core::RunOrchestrator> make_orchestrator(const Options& opts) {
    std::shared_ptr<const trainlog::grammar::LineGrammar> grammar =
        trainlog::grammar::make_grammar(opts.grammar);
    if (!grammar) {
        fmt::print(stderr, "Error: unknown grammar '{}'\n", opts.grammar);
        return std::nullopt;
    }
    return trainlog::core::RunOrchestrator(opts.run, std::move(grammar));
}

void print_report(const trainlog::ParseReport& r) {
    fmt::print("Run '{}': parsed {}/{} lines ({} episodes) -> {}, {}\n",
               r.run_name, r.lines_parsed, r.total_lines_seen, r.episodes,
               trainlog::constants::FULL_TABLE_FILE,
               trainlog::constants::BEST_TABLE_FILE);
    if (r.config_files > 0) {
        fmt::print("Run '{}': {} config file(s) -> {}\n",
                   r.run_name, r.config_files, trainlog::constants::CONFIG_TABLE_FILE);
    }
}

// ─── Modes ────────────────────────────────────────────────────────────────────

/// Parse every run under data_dir. Returns 0 if all runs succeeded.
int run_parse_all(const Options& opts) {
    auto orch = make_orchestrator(opts);
    if (!orch) return 1;

    const fs::path output_root = opts.run.output_root;
    std::vector<trainlog::core::RunOutcome> outcomes;
    try {
        outcomes = orch->process_all([&output_root](const std::string&) {
            return std::make_unique<trainlog::io::CsvDirectorySink>(output_root);
        });
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return 1;
    }

    std::size_t failed = 0;
    for (const auto& o : outcomes) {
        if (o.ok()) {
            print_report(*o.report);
        } else {
            ++failed;
        }
    }
    fmt::print("Processed {} run(s), {} failed.\n", outcomes.size(), failed);
    return failed == 0 ? 0 : 1;
}

/// Parse a single run directory. Returns 0 on success.
int run_parse_one(const fs::path& run_dir, const Options& opts) {
    auto orch = make_orchestrator(opts);
    if (!orch) return 1;

    const std::string run_name = run_dir.filename().empty()
        ? run_dir.parent_path().filename().string()
        : run_dir.filename().string();

    trainlog::io::CsvDirectorySink sink(opts.run.output_root);
    try {
        print_report(orch->process(run_name, run_dir, sink));
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] run '{}': {}\n", run_name, ex.what());
        return 1;
    }
    return 0;
}

int run_summary(const fs::path& output_root, const std::string& run_name,
                const Options& opts) {
    const auto s = trainlog::summary::load_summary(output_root, run_name, opts.summary);
    if (!s) {
        fmt::print(stderr, "Error: run '{}' not found under '{}' (run --parse first)\n",
                   run_name, output_root.string());
        return 1;
    }
    fmt::print("{}", s->to_string());
    return 0;
}

int run_list(const fs::path& output_root) {
    const auto runs = trainlog::summary::list_runs(output_root);
    if (runs.empty()) {
        fmt::print("No runs under '{}'.\n", output_root.string());
        return 0;
    }
    for (const auto& r : runs) {
        fmt::print("{}\n", r);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--list") {
        if (argc != 3) {
            fmt::print(stderr, "Error: --list requires an output directory\n");
            return 1;
        }
        return run_list(argv[2]);
    }

    if (mode == "--parse-all" || mode == "--parse" || mode == "--summary") {
        if (argc < 4) {
            fmt::print(stderr, "Error: {} requires two arguments\n", mode);
            print_usage();
            return 1;
        }
        auto opts = parse_options(argc, argv, 4);
        if (!opts) {
            print_usage();
            return 1;
        }

        if (mode == "--summary") {
            return run_summary(argv[2], argv[3], *opts);
        }

        opts->run.output_root = argv[3];
        if (mode == "--parse-all") {
            opts->run.input_root = argv[2];
            return run_parse_all(*opts);
        }
        opts->run.input_root = fs::path(argv[2]).parent_path();
        return run_parse_one(argv[2], *opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
