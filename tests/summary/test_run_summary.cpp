/// @file tests/summary/test_run_summary.cpp
/// @brief Unit tests for the Run Summary aggregates.
///
/// Test categories:
///   - total_hours and count_successes (empty, threshold boundary)
///   - step_buckets (bucket edges, distinct episodes, zero width)
///   - top_by_return (ordering, ties, truncation)
///   - summarize configuration
///   - list_runs / load_summary on missing paths

#include <gtest/gtest.h>
#include "trainlog/summary.hpp"

#include <filesystem>
#include <vector>

using namespace trainlog;
using namespace trainlog::summary;

namespace {

LogRecord rec(std::uint64_t step, std::string episode, double ret,
              double t, double reward) {
    LogRecord r;
    r.step      = step;
    r.episode   = std::move(episode);
    r.decision  = "A1-B2";
    r.ret       = ret;
    r.step_time = t;
    r.reward    = reward;
    return r;
}

}  // anonymous namespace

// ─── total_hours / count_successes ────────────────────────────────────────────

TEST(TotalHours, Empty_Zero) {
    EXPECT_DOUBLE_EQ(total_hours({}), 0.0);
}

TEST(TotalHours, SumOverSecondsPerHour) {
    const std::vector<LogRecord> rs = {rec(1, "1", 0, 3600.0, 0), rec(2, "1", 0, 1800.0, 0)};
    EXPECT_DOUBLE_EQ(total_hours(rs), 1.5);
}

TEST(CountSuccesses, ThresholdIsInclusive) {
    const std::vector<LogRecord> rs = {
        rec(1, "1", 0, 0, 99.999), rec(2, "2", 0, 0, 100.0), rec(3, "3", 0, 0, 250.0)};
    EXPECT_EQ(count_successes(rs, 100.0), 2u);
    EXPECT_EQ(count_successes({}, 100.0), 0u);
}

// ─── step_buckets ─────────────────────────────────────────────────────────────

TEST(StepBuckets, EdgesAndAggregates) {
    const std::vector<LogRecord> rs = {
        rec(0,     "1", 0, 1.0, 100.0),
        rec(9999,  "2", 0, 3.0, 0.0),
        rec(9999,  "2", 0, 2.0, 0.0),
        rec(10000, "3", 0, 4.0, 150.0),
        rec(35000, "3", 0, 5.0, 0.0),
    };
    const auto buckets = step_buckets(rs, 10'000, 100.0);

    ASSERT_EQ(buckets.size(), 3u);
    EXPECT_EQ(buckets[0].start, 0u);
    EXPECT_EQ(buckets[0].records, 3u);
    EXPECT_DOUBLE_EQ(buckets[0].mean_step_time, 2.0);
    EXPECT_EQ(buckets[0].successes, 1u);
    EXPECT_EQ(buckets[0].episodes, 2u);

    EXPECT_EQ(buckets[1].start, 10000u);
    EXPECT_EQ(buckets[1].successes, 1u);

    // Empty buckets (20000) are not emitted.
    EXPECT_EQ(buckets[2].start, 30000u);
    EXPECT_EQ(buckets[2].episodes, 1u);
}

TEST(StepBuckets, ZeroWidth_Empty) {
    const std::vector<LogRecord> rs = {rec(1, "1", 0, 0, 0)};
    EXPECT_TRUE(step_buckets(rs, 0, 100.0).empty());
}

TEST(StepBuckets, EpisodeIdsCountedNumerically) {
    const std::vector<LogRecord> rs = {rec(1, "7", 0, 0, 0), rec(2, "007", 0, 0, 0)};
    const auto buckets = step_buckets(rs, 10, 100.0);
    ASSERT_EQ(buckets.size(), 1u);
    EXPECT_EQ(buckets[0].episodes, 1u);
}

// ─── top_by_return ────────────────────────────────────────────────────────────

TEST(TopByReturn, DescendingStableTruncated) {
    const std::vector<LogRecord> rs = {
        rec(1, "1", 2.0, 0, 0), rec(2, "2", 9.0, 0, 0),
        rec(3, "3", 2.0, 0, 0), rec(4, "4", -1.0, 0, 0)};

    const auto top = top_by_return(rs, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].episode, "2");
    EXPECT_EQ(top[1].episode, "1");
    EXPECT_EQ(top[2].episode, "3");
}

TEST(TopByReturn, FewerThanN_AllReturned) {
    const std::vector<LogRecord> rs = {rec(1, "1", 1.0, 0, 0)};
    EXPECT_EQ(top_by_return(rs, 100).size(), 1u);
    EXPECT_TRUE(top_by_return(rs, 0).empty());
}

// ─── summarize ────────────────────────────────────────────────────────────────

TEST(Summarize, ZeroBucketWidth_Nullopt) {
    SummaryConfig cfg;
    cfg.bucket_width = 0;
    EXPECT_FALSE(summarize({}, {}, cfg).has_value());
}

TEST(Summarize, EmptyTables) {
    const auto s = summarize({}, {});
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->records, 0u);
    EXPECT_DOUBLE_EQ(s->total_hours, 0.0);
    EXPECT_TRUE(s->buckets.empty());
    EXPECT_TRUE(s->top_best.empty());
    EXPECT_NE(s->to_string().find("Records: 0"), std::string::npos);
}

TEST(Summarize, CustomConfigApplied) {
    const std::vector<LogRecord> full = {rec(5, "1", 1.0, 0, 10.0), rec(15, "1", 2.0, 0, 30.0)};
    const std::vector<LogRecord> best = {rec(15, "1", 2.0, 0, 30.0)};

    SummaryConfig cfg;
    cfg.bucket_width      = 10;
    cfg.success_threshold = 20.0;
    cfg.top_n             = 1;
    const auto s = summarize(full, best, cfg);

    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->buckets.size(), 2u);
    EXPECT_EQ(s->best_successes, 1u);
    EXPECT_EQ(s->top_best.size(), 1u);
    EXPECT_DOUBLE_EQ(s->success_threshold, 20.0);
}

TEST(Summarize, ToStringShowsThresholdUsed) {
    const std::vector<LogRecord> best = {rec(1, "1", 1.0, 0, 30.0)};
    SummaryConfig cfg;
    cfg.success_threshold = 25.5;
    const auto s = summarize(best, best, cfg);

    ASSERT_TRUE(s.has_value());
    const std::string text = s->to_string();
    EXPECT_NE(text.find("(Reward >= 25.5): 1"), std::string::npos);
    EXPECT_EQ(text.find("Reward >= 100"), std::string::npos);
}

// ─── Persisted runs ───────────────────────────────────────────────────────────

TEST(PersistedRuns, MissingRoot) {
    const auto root = std::filesystem::temp_directory_path() / "trainlog_no_such_output";
    EXPECT_TRUE(list_runs(root).empty());
    EXPECT_FALSE(load_summary(root, "run").has_value());
}
