#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "include/result_table.hpp"

using namespace vantage::core;

namespace {

ProbeResult success(std::size_t index, std::string id, double latency_ms, double mbps, std::string label = "") {
    ProbeResult r;
    r.index = index;
    r.target = Target{std::move(id), TargetKind::Dns, std::move(label)};
    r.status = ProbeStatus::Success;
    r.latency = Milliseconds{latency_ms};
    r.throughput_mbps = mbps;
    return r;
}

ProbeResult failure(std::size_t index, std::string id, ProbeStatus status = ProbeStatus::Failed) {
    ProbeResult r;
    r.index = index;
    r.target = Target{std::move(id), TargetKind::Dns, ""};
    r.status = status;
    r.reason = "nope";
    return r;
}

std::vector<std::string> ids(const std::vector<ProbeResult>& rows) {
    std::vector<std::string> out;
    for (const auto& r : rows)
        out.push_back(r.target.id);
    return out;
}

std::vector<ProbeResult> sample() {
    return {
        failure(0, "a-timeout", ProbeStatus::Timeout),
        success(1, "b", 30.0, 10.0),
        failure(2, "c-failed"),
        success(3, "d", 10.0, 50.0),
        success(4, "e", 20.0, 50.0),
        failure(5, "f-pending", ProbeStatus::Pending),
    };
}

}  // namespace

TEST(SortResultsTest, FailuresSortLastInBothDirections) {
    auto asc = sort_results(sample(), {SortColumn::Latency, SortDirection::Ascending});
    EXPECT_EQ(ids(asc), (std::vector<std::string>{"d", "e", "b", "a-timeout", "c-failed", "f-pending"}));

    auto desc = sort_results(sample(), {SortColumn::Latency, SortDirection::Descending});
    EXPECT_EQ(ids(desc), (std::vector<std::string>{"b", "e", "d", "a-timeout", "c-failed", "f-pending"}));
}

TEST(SortResultsTest, ThroughputTiesKeepInputOrder) {
    auto desc = sort_results(sample(), {SortColumn::Throughput, SortDirection::Descending});
    EXPECT_EQ(ids(desc), (std::vector<std::string>{"d", "e", "b", "a-timeout", "c-failed", "f-pending"}));

    auto asc = sort_results(sample(), {SortColumn::Throughput, SortDirection::Ascending});
    EXPECT_EQ(ids(asc), (std::vector<std::string>{"b", "d", "e", "a-timeout", "c-failed", "f-pending"}));
}

TEST(SortResultsTest, SortingTwiceIsStable) {
    SortSpec spec{SortColumn::Throughput, SortDirection::Descending};
    auto once = sort_results(sample(), spec);
    auto twice = sort_results(once, spec);
    EXPECT_EQ(ids(once), ids(twice));
}

TEST(SortResultsTest, IdentifierIsLexicographic) {
    auto asc = sort_results(sample(), {SortColumn::Identifier, SortDirection::Ascending});
    EXPECT_EQ(ids(asc), (std::vector<std::string>{"a-timeout", "b", "c-failed", "d", "e", "f-pending"}));

    auto desc = sort_results(sample(), {SortColumn::Identifier, SortDirection::Descending});
    EXPECT_EQ(ids(desc), (std::vector<std::string>{"f-pending", "e", "d", "c-failed", "b", "a-timeout"}));
}

TEST(SortResultsTest, LabelFallsBackToIdentifier) {
    std::vector<ProbeResult> rows = {
        success(0, "https://z.example/", 1.0, 1.0, "Alpha"),
        success(1, "https://b.example/", 1.0, 1.0, ""),
    };
    auto asc = sort_results(rows, {SortColumn::Label, SortDirection::Ascending});
    EXPECT_EQ(asc[0].target.label, "Alpha");
}

TEST(RankTest, LatencyFirstBreaksTiesOnThroughput) {
    auto fast = success(0, "x", 10.0, 20.0);
    auto faster_pipe = success(1, "y", 10.0, 40.0);
    auto slow = success(2, "z", 30.0, 900.0);

    EXPECT_TRUE(ranks_better(fast, slow, RankPolicy::LatencyFirst));
    EXPECT_TRUE(ranks_better(faster_pipe, fast, RankPolicy::LatencyFirst));
    EXPECT_FALSE(ranks_better(fast, fast, RankPolicy::LatencyFirst));
}

TEST(RankTest, ThroughputFirstTreatsNearTiesAsEqual) {
    auto a = success(0, "a", 30.0, 100.0);
    auto b = success(1, "b", 10.0, 100.005);
    auto c = success(2, "c", 50.0, 200.0);

    EXPECT_TRUE(ranks_better(c, a, RankPolicy::ThroughputFirst));
    EXPECT_TRUE(ranks_better(b, a, RankPolicy::ThroughputFirst));
    EXPECT_FALSE(ranks_better(a, b, RankPolicy::ThroughputFirst));
}

class ResultTableTest : public ::testing::Test {
   protected:
    std::vector<Target> targets_ = {
        {"1.1.1.1", TargetKind::Dns, ""},
        {"8.8.8.8", TargetKind::Dns, ""},
        {"198.51.100.1", TargetKind::Dns, ""},
    };
    ResultTable table_;
};

TEST_F(ResultTableTest, BeginRunCreatesPendingSlots) {
    table_.begin_run(targets_);
    EXPECT_EQ(table_.status(), RunStatus::Running);
    ASSERT_EQ(table_.results().size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(table_.results()[i].index, i);
        EXPECT_EQ(table_.results()[i].status, ProbeStatus::Pending);
    }
    EXPECT_EQ(table_.last_result(), nullptr);
    EXPECT_EQ(table_.best(), nullptr);
}

TEST_F(ResultTableTest, TracksLastAndBestAsResultsArrive) {
    table_.begin_run(targets_);

    EXPECT_FALSE(table_.apply(ResultEvent{success(0, "1.1.1.1", 15.0, 90.0)}));
    EXPECT_FALSE(table_.apply(ProgressEvent{1, 3}));
    EXPECT_FALSE(table_.apply(ResultEvent{success(1, "8.8.8.8", 9.0, 40.0)}));
    EXPECT_FALSE(table_.apply(ProgressEvent{2, 3}));
    EXPECT_FALSE(table_.apply(ResultEvent{failure(2, "198.51.100.1", ProbeStatus::Timeout)}));
    EXPECT_FALSE(table_.apply(ProgressEvent{3, 3}));

    ASSERT_NE(table_.last_result(), nullptr);
    EXPECT_EQ(table_.last_result()->target.id, "198.51.100.1");
    ASSERT_NE(table_.best(), nullptr);
    EXPECT_EQ(table_.best()->target.id, "8.8.8.8");
    EXPECT_EQ(table_.completed(), 3u);
    EXPECT_EQ(table_.success_count(), 2u);

    EXPECT_TRUE(table_.apply(RunCompleteEvent{3}));
    EXPECT_EQ(table_.status(), RunStatus::Completed);

    table_.set_rank_policy(RankPolicy::ThroughputFirst);
    EXPECT_EQ(table_.best()->target.id, "1.1.1.1");
}

TEST_F(ResultTableTest, TerminalResultIsNeverOverwritten) {
    table_.begin_run(targets_);
    table_.apply(ResultEvent{success(0, "1.1.1.1", 15.0, 90.0)});
    table_.apply(ResultEvent{failure(0, "1.1.1.1")});
    EXPECT_EQ(table_.results()[0].status, ProbeStatus::Success);
}

TEST_F(ResultTableTest, CancelledRunLeavesUnreachedSlotsPending) {
    table_.begin_run(targets_);
    table_.apply(ResultEvent{success(0, "1.1.1.1", 15.0, 90.0)});
    table_.apply(ProgressEvent{1, 3});
    EXPECT_TRUE(table_.apply(CancelledEvent{1, 3}));

    EXPECT_EQ(table_.status(), RunStatus::Cancelled);
    EXPECT_EQ(table_.terminal_results().size(), 1u);
    EXPECT_EQ(table_.results()[1].status, ProbeStatus::Pending);
    EXPECT_EQ(table_.results()[2].status, ProbeStatus::Pending);
}

TEST_F(ResultTableTest, ResetKeepsTargets) {
    table_.begin_run(targets_);
    table_.apply(ResultEvent{success(0, "1.1.1.1", 15.0, 90.0)});
    table_.apply(RunCompleteEvent{3});

    table_.reset();
    EXPECT_EQ(table_.status(), RunStatus::Idle);
    EXPECT_TRUE(table_.results().empty());
    EXPECT_EQ(table_.best(), nullptr);
    ASSERT_EQ(table_.targets().size(), 3u);
    EXPECT_EQ(table_.targets()[2].id, "198.51.100.1");
}
