#include <gtest/gtest.h>

#include <cmath>

#include "core/DateUtil.hpp"
#include "stats/StatsUtil.hpp"

using namespace stats;

TEST(StatsUtilTest, SummarizeIsUnbiased) {
    const Summary s = summarize({4.0, 1.0, 3.0, 2.0});
    EXPECT_EQ(s.n, 4u);
    EXPECT_DOUBLE_EQ(s.mean, 2.5);
    EXPECT_NEAR(s.variance, 5.0 / 3.0, 1e-12);
}

TEST(StatsUtilTest, SummarizeSmallInputs) {
    EXPECT_EQ(summarize({}).n, 0u);
    const Summary one = summarize({7.0});
    EXPECT_DOUBLE_EQ(one.mean, 7.0);
    EXPECT_DOUBLE_EQ(one.variance, 0.0);
}

TEST(StatsUtilTest, SortedSumIgnoresOrder) {
    EXPECT_DOUBLE_EQ(sorted_sum({0.1, 1e10, 0.2, -1e10}), sorted_sum({-1e10, 0.2, 1e10, 0.1}));
}

TEST(StatsUtilTest, StudentTCriticalValues) {
    EXPECT_NEAR(t_critical(0.05, 2), 4.303, 1e-3);
    EXPECT_NEAR(t_critical(0.05, 10), 2.228, 1e-3);
    EXPECT_NEAR(t_critical(0.05, 1000), 1.962, 1e-3);
    EXPECT_DOUBLE_EQ(t_critical(0.05, 0), 0.0);
}

TEST(StatsUtilTest, StudentTPValue) {
    EXPECT_NEAR(t_two_tailed_p(0.0, 5), 1.0, 1e-12);
    EXPECT_NEAR(t_two_tailed_p(2.571, 5), 0.05, 1e-3);
}

TEST(StatsUtilTest, RegularizedBetaBounds) {
    EXPECT_DOUBLE_EQ(regularized_beta(2.0, 3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(regularized_beta(2.0, 3.0, 1.0), 1.0);
    // I_x(1,1) = x
    EXPECT_NEAR(regularized_beta(1.0, 1.0, 0.3), 0.3, 1e-10);
}

TEST(StatsUtilTest, NormalPValue) {
    EXPECT_NEAR(normal_two_tailed_p(1.959964), 0.05, 1e-5);
    EXPECT_DOUBLE_EQ(normal_two_tailed_p(0.0), 1.0);
}

TEST(StatsUtilTest, ClampAndRounding) {
    EXPECT_DOUBLE_EQ(clamp01(-0.5), 0.0);
    EXPECT_DOUBLE_EQ(clamp01(1.5), 1.0);
    EXPECT_DOUBLE_EQ(clamp01(std::nan("")), 0.0);
    EXPECT_DOUBLE_EQ(round_to(7.3, 0.5), 7.5);
    EXPECT_DOUBLE_EQ(round_to(7.2, 0.5), 7.0);
    EXPECT_DOUBLE_EQ(round2(2.345678), 2.35);
}

// ==========================================
// Dates
// ==========================================

TEST(DateUtilTest, ParseAndFormat) {
    EXPECT_EQ(dateutil::days_from_civil(1970, 1, 1), 0);
    ASSERT_TRUE(dateutil::parse_date("2024-02-29").has_value());
    EXPECT_EQ(dateutil::format_date(*dateutil::parse_date("2024-02-29")), "2024-02-29");
    EXPECT_EQ(dateutil::parse_date("2024-03-01T10:00:00Z"), dateutil::parse_date("2024-03-01"));
}

TEST(DateUtilTest, RejectsBadDates) {
    EXPECT_FALSE(dateutil::parse_date("2023-02-29").has_value());
    EXPECT_FALSE(dateutil::parse_date("2024-13-01").has_value());
    EXPECT_FALSE(dateutil::parse_date("yesterday").has_value());
    EXPECT_FALSE(dateutil::parse_date("2024-01-01x").has_value());
    EXPECT_FALSE(dateutil::parse_date("").has_value());
}

TEST(DateUtilTest, QuarterBuckets) {
    const auto jan = *dateutil::parse_date("2024-01-15");
    const auto mar = *dateutil::parse_date("2024-03-31");
    const auto apr = *dateutil::parse_date("2024-04-01");
    EXPECT_EQ(dateutil::month_bucket(jan, 3), dateutil::month_bucket(mar, 3));
    EXPECT_EQ(dateutil::month_bucket(apr, 3), dateutil::month_bucket(jan, 3) + 1);
    EXPECT_EQ(dateutil::format_date(dateutil::bucket_start(dateutil::month_bucket(mar, 3), 3)), "2024-01-01");
}
