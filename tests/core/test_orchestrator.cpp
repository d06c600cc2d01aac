/// @file tests/core/test_orchestrator.cpp
/// @brief Unit tests for RunAccumulator and RunOrchestrator.
///
/// Test categories:
///   - RunAccumulator counting (every line counted once, parsed or discarded)
///   - Stream handling (CRLF, unterminated last line, empty input)
///   - File discovery (extension filter, sorting, no recursion)
///   - process(): missing directory, no log files, cross-file tie-break
///   - Config pass: merge, disabled, malformed file isolated from log tables
///   - process_all(): sorted runs, per-run failure isolation

#include <gtest/gtest.h>
#include "scratch_dir.hpp"
#include "trainlog/constants.hpp"
#include "trainlog/orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace trainlog;
using namespace trainlog::core;

namespace fs = std::filesystem;

namespace {

/// A valid line for `episode` with return `ret` at `step`.
std::string line(std::uint64_t step, int episode, double ret) {
    std::ostringstream ss;
    ss << "12:00:00 INFO - Iter: " << step << "/" << episode
       << " A1-B2 - Rand Eps: 0.1 lr: 0.001 Ret = " << ret
       << " Last Crash = 0 t=0.5 SF = 1.0 Seen=1 Reward: 10.0";
    return ss.str();
}

void write_file(const fs::path& p, const std::string& text) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << text;
}

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = test_support::scratch_dir("trainlog_orchestrator");
        fs::remove_all(root_);
        fs::create_directories(root_);
    }
    void TearDown() override { fs::remove_all(root_); }

    RunConfig config() const {
        RunConfig cfg;
        cfg.input_root  = root_ / "data";
        cfg.output_root = root_ / "out";
        return cfg;
    }

    fs::path root_;
};

/// Sink that fails as soon as a run begins.
class FailingSink final : public io::OutputSink {
public:
    void begin_run(const std::string& run_name) override {
        throw std::runtime_error("disk full for " + run_name);
    }
    void on_record(const LogRecord&) override {}
    void on_best(const std::vector<LogRecord>&) override {}
    void on_config(const std::vector<ConfigParameter>&) override {}
    void end_run(const ParseReport&) override {}
};

}  // anonymous namespace

// ─── RunAccumulator ───────────────────────────────────────────────────────────

TEST(RunAccumulator, CountsParsedAndDiscarded) {
    const grammar::IterLineGrammar g;
    io::MemorySink sink;
    RunAccumulator acc(g, sink);

    EXPECT_TRUE(acc.feed_line(line(1, 1, 1.0)));
    EXPECT_FALSE(acc.feed_line("Loading environment..."));
    EXPECT_FALSE(acc.feed_line(""));
    EXPECT_TRUE(acc.feed_line(line(2, 1, 2.0)));

    EXPECT_EQ(acc.total_lines_seen(), 4u);
    EXPECT_EQ(acc.lines_parsed(), 2u);
    EXPECT_EQ(acc.lines_discarded(), 2u);
    EXPECT_EQ(sink.records().size(), 2u);
    EXPECT_EQ(acc.best().size(), 1u);
    EXPECT_DOUBLE_EQ(acc.best().best_for("1")->ret, 2.0);
}

TEST(RunAccumulator, DiscardIncrementsByExactlyOne) {
    const grammar::IterLineGrammar g;
    io::MemorySink sink;
    RunAccumulator acc(g, sink);
    (void)acc.feed_line(line(1, 1, 1.0));

    const auto parsed_before    = acc.lines_parsed();
    const auto discarded_before = acc.lines_discarded();
    EXPECT_FALSE(acc.feed_line("- Iter: garbage"));
    EXPECT_EQ(acc.lines_parsed(), parsed_before);
    EXPECT_EQ(acc.lines_discarded(), discarded_before + 1);
}

TEST(RunAccumulator, StreamCrlfAndUnterminatedLastLine) {
    const grammar::IterLineGrammar g;
    io::MemorySink sink;
    RunAccumulator acc(g, sink);

    std::istringstream in(line(1, 1, 1.0) + "\r\nnoise\r\n" + line(2, 2, 2.0));
    EXPECT_EQ(acc.feed_stream(in), 3u);
    EXPECT_EQ(acc.total_lines_seen(), 3u);
    EXPECT_EQ(acc.lines_parsed(), 2u);
    EXPECT_EQ(sink.records().back().episode, "2");
}

TEST(RunAccumulator, EmptyStream_NoLines) {
    const grammar::IterLineGrammar g;
    io::MemorySink sink;
    RunAccumulator acc(g, sink);
    std::istringstream in("");
    EXPECT_EQ(acc.feed_stream(in), 0u);
    EXPECT_EQ(acc.total_lines_seen(), 0u);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(RunOrchestrator, NullGrammar_Throws) {
    EXPECT_THROW((void)RunOrchestrator(RunConfig{}, nullptr), std::invalid_argument);
}

TEST(RunOrchestrator, DefaultGrammarIsIterV1) {
    const RunOrchestrator orch;
    EXPECT_EQ(orch.grammar().name(), "iter-v1");
    EXPECT_EQ(orch.config().log_extensions, (std::vector<std::string>{".txt"}));
}

TEST(RunConfig, DefaultsFollowDiscoveryConstants) {
    const RunConfig cfg;
    ASSERT_EQ(cfg.log_extensions.size(), 1u);
    EXPECT_EQ(cfg.log_extensions[0], constants::DEFAULT_LOG_EXTENSION);
    ASSERT_EQ(cfg.config_extensions.size(), std::size(constants::DEFAULT_CONFIG_EXTENSIONS));
    for (std::size_t i = 0; i < cfg.config_extensions.size(); ++i) {
        EXPECT_EQ(cfg.config_extensions[i], constants::DEFAULT_CONFIG_EXTENSIONS[i]);
    }
    EXPECT_TRUE(cfg.harvest_config);
}

// ─── File discovery ───────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, LogFiles_FilteredSortedNotRecursive) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "b.txt", "");
    write_file(run / "a.txt", "");
    write_file(run / "notes.md", "");
    write_file(run / "c.TXT", "");
    write_file(run / "nested" / "d.txt", "");
    fs::create_directories(run / "e.txt");  // a directory, not a file

    const RunOrchestrator orch(config());
    const auto files = orch.log_files(run);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "a.txt");
    EXPECT_EQ(files[1].filename().string(), "b.txt");
}

TEST_F(OrchestratorTest, CustomExtensions) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "a.log", "");
    write_file(run / "b.txt", "");

    RunConfig cfg = config();
    cfg.log_extensions = {".log"};
    const RunOrchestrator orch(cfg);
    const auto files = orch.log_files(run);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "a.log");
}

// ─── process ──────────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, MissingDirectory_Throws) {
    const RunOrchestrator orch(config());
    io::MemorySink sink;
    EXPECT_THROW((void)orch.process("nope", root_ / "data" / "nope", sink), std::runtime_error);
    EXPECT_FALSE(sink.finished());
}

TEST_F(OrchestratorTest, NoLogFiles_EmptyTables) {
    const fs::path run = root_ / "data" / "run1";
    fs::create_directories(run);

    const RunOrchestrator orch(config());
    io::MemorySink sink;
    const auto report = orch.process("run1", run, sink);

    EXPECT_TRUE(sink.finished());
    EXPECT_TRUE(sink.records().empty());
    EXPECT_TRUE(sink.best().empty());
    EXPECT_FALSE(sink.has_config());
    EXPECT_EQ(report.files_scanned, 0u);
    EXPECT_EQ(report.total_lines_seen, 0u);
    EXPECT_DOUBLE_EQ(report.yield(), 0.0);
}

TEST_F(OrchestratorTest, MixedLines_ReportCounts) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "log.txt",
               line(1, 7, 5.0) + "\n" + line(2, 7, 8.2) + "\n" + line(3, 7, 8.2) + "\n"
               + "Episode finished\n");

    const RunOrchestrator orch(config());
    io::MemorySink sink;
    const auto report = orch.process("run1", run, sink);

    EXPECT_EQ(report.run_name, "run1");
    EXPECT_EQ(report.files_scanned, 1u);
    EXPECT_EQ(report.total_lines_seen, 4u);
    EXPECT_EQ(report.lines_parsed, 3u);
    EXPECT_EQ(report.lines_discarded(), 1u);
    EXPECT_EQ(report.episodes, 1u);
    EXPECT_DOUBLE_EQ(report.yield(), 0.75);

    ASSERT_EQ(sink.best().size(), 1u);
    EXPECT_EQ(sink.best()[0].step, 2u);
    EXPECT_EQ(sink.report().lines_parsed, 3u);
}

TEST_F(OrchestratorTest, TieAcrossFiles_SortedFileOrderDecides) {
    const fs::path run = root_ / "data" / "run1";
    // Written in reverse order; processing must still read a.txt first.
    write_file(run / "b.txt", line(200, 1, 9.0) + "\n");
    write_file(run / "a.txt", line(100, 1, 9.0) + "\n");

    const RunOrchestrator orch(config());
    io::MemorySink sink;
    (void)orch.process("run1", run, sink);

    ASSERT_EQ(sink.records().size(), 2u);
    EXPECT_EQ(sink.records()[0].step, 100u);
    ASSERT_EQ(sink.best().size(), 1u);
    EXPECT_EQ(sink.best()[0].step, 100u);
}

TEST_F(OrchestratorTest, BestSortedByNumericEpisode) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "log.txt",
               line(1, 10, 1.0) + "\n" + line(2, 2, 1.0) + "\n" + line(3, 1, 1.0) + "\n");

    const RunOrchestrator orch(config());
    io::MemorySink sink;
    (void)orch.process("run1", run, sink);

    ASSERT_EQ(sink.best().size(), 3u);
    EXPECT_EQ(sink.best()[0].episode, "1");
    EXPECT_EQ(sink.best()[1].episode, "2");
    EXPECT_EQ(sink.best()[2].episode, "10");
}

TEST_F(OrchestratorTest, ConfigHarvested_MergedAndSorted) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "log.txt", line(1, 1, 1.0) + "\n");
    write_file(run / "a.ini", "[train]\nlr = 0.1\nseed = 1\n");
    write_file(run / "b.cfg", "[train]\nlr = 0.01\n[env]\nname = maze\n");

    const RunOrchestrator orch(config());
    io::MemorySink sink;
    const auto report = orch.process("run1", run, sink);

    EXPECT_EQ(report.config_files, 2u);
    EXPECT_FALSE(report.config_error.has_value());
    ASSERT_TRUE(sink.has_config());
    EXPECT_EQ(sink.config(), (std::vector<ConfigParameter>{
        {"env.name", "maze"}, {"train.lr", "0.01"}, {"train.seed", "1"}}));
}

TEST_F(OrchestratorTest, ConfigDisabled_NotHarvested) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "a.ini", "[train]\nlr = 0.1\n");

    RunConfig cfg = config();
    cfg.harvest_config = false;
    const RunOrchestrator orch(cfg);
    io::MemorySink sink;
    const auto report = orch.process("run1", run, sink);

    EXPECT_FALSE(sink.has_config());
    EXPECT_EQ(report.config_files, 0u);
}

TEST_F(OrchestratorTest, MalformedConfig_LogTablesUnaffected) {
    const fs::path run = root_ / "data" / "run1";
    write_file(run / "log.txt", line(1, 1, 1.0) + "\n" + line(2, 2, 3.0) + "\n");
    write_file(run / "bad.ini", "lr = 0.1\n");

    const RunOrchestrator orch(config());
    io::MemorySink sink;
    const auto report = orch.process("run1", run, sink);

    ASSERT_TRUE(report.config_error.has_value());
    EXPECT_NE(report.config_error->find("bad.ini"), std::string::npos);
    EXPECT_FALSE(sink.has_config());
    EXPECT_EQ(sink.records().size(), 2u);
    EXPECT_EQ(sink.best().size(), 2u);
    EXPECT_TRUE(sink.finished());
}

// ─── process_all ──────────────────────────────────────────────────────────────

TEST_F(OrchestratorTest, ProcessAll_MissingRoot_Throws) {
    const RunOrchestrator orch(config());
    EXPECT_THROW((void)orch.process_all([](const std::string&) {
        return std::make_unique<io::MemorySink>();
    }), std::runtime_error);
}

TEST_F(OrchestratorTest, ProcessAll_FailureIsolatedPerRun) {
    write_file(root_ / "data" / "run_b" / "log.txt", line(1, 1, 1.0) + "\n");
    write_file(root_ / "data" / "run_a" / "log.txt", line(1, 1, 1.0) + "\n");
    write_file(root_ / "data" / "run_c" / "log.txt", line(1, 1, 1.0) + "\n");
    write_file(root_ / "data" / "stray.txt", "not a run\n");

    const RunOrchestrator orch(config());
    const auto outcomes = orch.process_all(
        [](const std::string& name) -> std::unique_ptr<io::OutputSink> {
            if (name == "run_b") return std::make_unique<FailingSink>();
            return std::make_unique<io::MemorySink>();
        });

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_EQ(outcomes[0].run_name, "run_a");
    EXPECT_EQ(outcomes[1].run_name, "run_b");
    EXPECT_EQ(outcomes[2].run_name, "run_c");

    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_FALSE(outcomes[1].ok());
    EXPECT_NE(outcomes[1].error.find("disk full"), std::string::npos);
    EXPECT_TRUE(outcomes[2].ok());
    EXPECT_EQ(outcomes[2].report->lines_parsed, 1u);
}
