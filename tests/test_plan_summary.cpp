#include <gtest/gtest.h>
#include <plan/plan_summary.hpp>

using namespace cutplan;

TEST(PlanSummaryTest, SameLengthTolerance) {
    EXPECT_TRUE(same_length(0.1 + 0.2, 0.3));
    EXPECT_TRUE(same_length(1500.0, 1500.0));
    EXPECT_FALSE(same_length(1.0, 1.001));
    EXPECT_FALSE(same_length(1500.0, 1500.1));
}

TEST(PlanSummaryTest, CountsAndTotals) {
    std::vector<CutRequest> requests = {{100.0, 2}, {200.0, 1}, {50.0, 3}};
    std::vector<CutPlan> plans = {
        {{200.0, 100.0, 100.0}, 50.0},
        {{}, 400.0},
    };

    PlanSummary summary = summarize(requests, plans);

    ASSERT_EQ(summary.rows.size(), 3u);
    EXPECT_DOUBLE_EQ(summary.rows[0].length, 100.0);
    EXPECT_EQ(summary.rows[0].made, 2u);
    EXPECT_EQ(summary.rows[0].needed, 2u);
    EXPECT_EQ(summary.rows[1].made, 1u);
    EXPECT_EQ(summary.rows[2].made, 0u);
    EXPECT_EQ(summary.rows[2].needed, 3u);

    EXPECT_EQ(summary.total_made, 3u);
    EXPECT_EQ(summary.total_needed, 6u);
    EXPECT_DOUBLE_EQ(summary.total_waste, 450.0);
    EXPECT_EQ(summary.bars_used, 1u);
    EXPECT_EQ(summary.bar_count, 2u);
    EXPECT_EQ(summary.deficit(), 3u);
    EXPECT_FALSE(summary.complete());
}

TEST(PlanSummaryTest, DuplicateLengthsShareARow) {
    std::vector<CutRequest> requests = {{100.0, 2}, {200.0, 1}, {100.0, 3}};
    std::vector<CutPlan> plans = {{{200.0, 100.0, 100.0, 100.0, 100.0, 100.0}, 0.0}};

    PlanSummary summary = summarize(requests, plans);

    ASSERT_EQ(summary.rows.size(), 2u);
    EXPECT_DOUBLE_EQ(summary.rows[0].length, 100.0);
    EXPECT_EQ(summary.rows[0].needed, 5u);
    EXPECT_EQ(summary.rows[0].made, 5u);
    EXPECT_DOUBLE_EQ(summary.rows[1].length, 200.0);
    EXPECT_TRUE(summary.complete());
}

TEST(PlanSummaryTest, MatchesAfterUnitRoundTrip) {
    // 0.3m stored as 300mm and converted back
    std::vector<CutRequest> requests = {{0.3, 1}};
    std::vector<CutPlan> plans = {{{300.0 / 1000.0}, 0.7}};

    PlanSummary summary = summarize(requests, plans);
    EXPECT_EQ(summary.rows[0].made, 1u);
}

TEST(PlanSummaryTest, LargeQuantitiesDoNotWrap) {
    std::vector<CutRequest> requests = {{100.0, 3000000000u}, {200.0, 3000000000u}};
    std::vector<CutPlan> plans = {{{200.0, 100.0}, 0.0}};

    PlanSummary summary = summarize(requests, plans);

    EXPECT_EQ(summary.total_needed, 6000000000ull);
    EXPECT_EQ(summary.total_made, 2u);
    EXPECT_EQ(summary.deficit(), 5999999998ull);
    EXPECT_FALSE(summary.complete());

    std::vector<CutRequest> same_length_requests = {{100.0, 4000000000u}, {100.0, 4000000000u}};
    summary = summarize(same_length_requests, plans);
    ASSERT_EQ(summary.rows.size(), 1u);
    EXPECT_EQ(summary.rows[0].needed, 8000000000ull);
}

TEST(PlanSummaryTest, Empty) {
    PlanSummary summary = summarize({}, {});
    EXPECT_TRUE(summary.rows.empty());
    EXPECT_EQ(summary.bar_count, 0u);
    EXPECT_TRUE(summary.complete());
}
