#include <gtest/gtest.h>

#include <algorithm>

#include "TestDocs.hpp"
#include "stats/TrendAnalyzer.hpp"

using namespace insights;
using testdocs::doc;

static Topic topic_with(const std::string& id, std::set<std::string> members) {
    Topic t;
    t.id = id;
    t.member_terms = std::move(members);
    return t;
}

class TrendAnalyzerTest : public ::testing::Test {
protected:
    Topic topic = topic_with("system_design.architecture", {"system design"});
    TrendConfig cfg;
};

TEST_F(TrendAnalyzerTest, TooFewBucketsIsStable) {
    const TrendResult r = analyze_trend(topic, {10.0, 50.0, 90.0}, cfg);
    EXPECT_EQ(r.topic_id, "system_design.architecture");
    EXPECT_EQ(r.direction, TrendDirection::Stable);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
    EXPECT_DOUBLE_EQ(r.strength, 0.0);
    EXPECT_FALSE(r.significant);
    EXPECT_EQ(r.bucket_count, 3);
}

TEST_F(TrendAnalyzerTest, LoweredMinimumBucketsStillNeedsFour) {
    cfg.min_buckets = 2;
    const TrendResult r = analyze_trend(topic, {10.0, 20.0, 30.0}, cfg);
    EXPECT_EQ(r.direction, TrendDirection::Stable);
    EXPECT_DOUBLE_EQ(r.strength, 0.0);
    EXPECT_FALSE(r.significant);
}

TEST_F(TrendAnalyzerTest, EmptySeries) {
    const TrendResult r = analyze_trend(topic, {}, cfg);
    EXPECT_EQ(r.direction, TrendDirection::Stable);
    EXPECT_EQ(r.bucket_count, 0);
}

TEST_F(TrendAnalyzerTest, MonotonicIncreaseIsSignificantRise) {
    const TrendResult r = analyze_trend(topic, {10.0, 20.0, 30.0, 40.0, 50.0, 60.0}, cfg);
    EXPECT_EQ(r.direction, TrendDirection::Rising);
    EXPECT_TRUE(r.significant);
    EXPECT_LT(r.p_value, 0.05);
    EXPECT_DOUBLE_EQ(r.statistic, 15.0);
    EXPECT_DOUBLE_EQ(r.strength, 1.0);
    EXPECT_DOUBLE_EQ(r.slope, 10.0);
}

TEST_F(TrendAnalyzerTest, MonotonicDecreaseIsSignificantFall) {
    const TrendResult r = analyze_trend(topic, {60.0, 50.0, 40.0, 30.0, 20.0, 10.0}, cfg);
    EXPECT_EQ(r.direction, TrendDirection::Falling);
    EXPECT_TRUE(r.significant);
    EXPECT_DOUBLE_EQ(r.statistic, -15.0);
    EXPECT_DOUBLE_EQ(r.slope, -10.0);
}

TEST_F(TrendAnalyzerTest, ConstantSeriesIsStable) {
    const TrendResult r = analyze_trend(topic, {5.0, 5.0, 5.0, 5.0, 5.0}, cfg);
    EXPECT_EQ(r.direction, TrendDirection::Stable);
    EXPECT_FALSE(r.significant);
    EXPECT_DOUBLE_EQ(r.p_value, 1.0);
}

TEST_F(TrendAnalyzerTest, ShortNoisyRiseNotSignificant) {
    const TrendResult r = analyze_trend(topic, {10.0, 30.0, 20.0, 40.0}, cfg);
    EXPECT_EQ(r.direction, TrendDirection::Rising);
    EXPECT_FALSE(r.significant);
    EXPECT_GT(r.p_value, 0.05);
}

TEST(SensSlopeTest, MedianOfPairwiseSlopes) {
    EXPECT_DOUBLE_EQ(sens_slope({1.0, 2.0, 4.0}), 1.5);
    EXPECT_DOUBLE_EQ(sens_slope({3.0}), 0.0);
}

TEST(TopicSeriesTest, QuarterlyCoverage) {
    const std::vector<NormalizedDocument> docs = {
        doc("1", "system design", "2024-01-10"),
        doc("2", "heap", "2024-02-10"),
        doc("3", "system design round", "2024-05-10"),
    };
    const Topic t = topic_with("system_design.architecture", {"system design"});
    const auto series = build_topic_series(t, docs, *Taxonomy::builtin(), EngineConfig{});

    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(dateutil::format_date(series[0].start_date), "2024-01-01");
    EXPECT_EQ(series[0].documents, 2);
    EXPECT_EQ(series[0].referencing, 1);
    EXPECT_DOUBLE_EQ(series[0].value, 50.0);
    EXPECT_EQ(dateutil::format_date(series[1].start_date), "2024-04-01");
    EXPECT_DOUBLE_EQ(series[1].value, 100.0);

    EXPECT_EQ(series_values(series), (std::vector<double>{50.0, 100.0}));
}

TEST(TopicSeriesTest, IndependentOfDocumentOrder) {
    std::vector<NormalizedDocument> docs = {
        doc("1", "system design", "2023-01-10"),
        doc("2", "heap", "2023-05-10"),
        doc("3", "system design", "2023-08-10"),
        doc("4", "graph", "2023-11-10"),
        doc("5", "system design", "2024-02-10"),
    };
    const Topic t = topic_with("system_design.architecture", {"system design"});
    const auto a = series_values(build_topic_series(t, docs, *Taxonomy::builtin(), EngineConfig{}));
    std::reverse(docs.begin(), docs.end());
    const auto b = series_values(build_topic_series(t, docs, *Taxonomy::builtin(), EngineConfig{}));
    EXPECT_EQ(a, b);
}
