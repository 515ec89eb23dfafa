#include <gtest/gtest.h>

#include <algorithm>

#include "insights/InsightsGenerator.hpp"

using namespace insights;

static Topic make_topic(const std::string& id, const std::string& rep, double wf, double conf = 0.8,
                        double diff = 0.5, double succ = 0.5) {
    Topic t;
    t.id = id;
    t.representative_term = rep;
    t.member_terms = {rep};
    t.category = Category::Algorithms;
    t.weighted_frequency = wf;
    t.confidence_score = conf;
    t.difficulty_score = diff;
    t.success_correlation = succ;
    t.priority_level = classify_priority(wf, conf, PriorityConfig{});
    return t;
}

static TrendResult significant(const std::string& id, TrendDirection dir, double strength) {
    TrendResult r;
    r.topic_id = id;
    r.direction = dir;
    r.strength = strength;
    r.significant = true;
    r.p_value = 0.01;
    return r;
}

// ==========================================
// Scores
// ==========================================

TEST(InsightsGeneratorTest, TrendSignal) {
    EXPECT_DOUBLE_EQ(trend_signal(nullptr), 0.5);

    TrendResult weak = significant("x", TrendDirection::Rising, 0.9);
    weak.significant = false;
    EXPECT_DOUBLE_EQ(trend_signal(&weak), 0.5);

    const TrendResult up = significant("x", TrendDirection::Rising, 1.0);
    const TrendResult down = significant("x", TrendDirection::Falling, 0.6);
    EXPECT_DOUBLE_EQ(trend_signal(&up), 1.0);
    EXPECT_DOUBLE_EQ(trend_signal(&down), 0.2);
}

TEST(InsightsGeneratorTest, PriorityScoreWeights) {
    const Topic t = make_topic("a", "alpha", 100.0, 1.0, 1.0, 1.0);
    const TrendResult up = significant("a", TrendDirection::Rising, 1.0);
    EXPECT_NEAR(priority_score(t, nullptr, PriorityConfig{}), 0.95, 1e-12);
    EXPECT_NEAR(priority_score(t, &up, PriorityConfig{}), 1.0, 1e-12);

    const Topic zero = make_topic("b", "beta", 0.0, 0.0, 0.0, 0.0);
    EXPECT_NEAR(priority_score(zero, nullptr, PriorityConfig{}), 0.05, 1e-12);
}

TEST(InsightsGeneratorTest, EstimateHours) {
    HoursCurve curve;
    EXPECT_DOUBLE_EQ(estimate_hours(make_topic("a", "alpha", 50.0, 0.5, 0.0), curve), 6.0);
    EXPECT_DOUBLE_EQ(estimate_hours(make_topic("a", "alpha", 50.0, 0.5, 1.0), curve), 22.0);

    Topic broad = make_topic("a", "alpha", 50.0, 0.5, 0.5);
    broad.member_terms = {"alpha", "beta", "gamma"};
    EXPECT_DOUBLE_EQ(estimate_hours(broad, curve), 14.0);
}

// ==========================================
// Strategies
// ==========================================

TEST(InsightsGeneratorTest, StrategiesForHardHighPriorityTopic) {
    Topic t = make_topic("algorithms.dynamic_programming", "dynamic programming", 80.0, 0.9, 0.7);
    t.member_terms = {"dp", "dynamic programming", "memoization"};
    ASSERT_EQ(t.priority_level, PriorityLevel::High);

    const TrendResult up = significant(t.id, TrendDirection::Rising, 0.8);
    const auto s = build_strategies(t, &up);

    ASSERT_GE(s.size(), 4u);
    EXPECT_EQ(s.front(), "High priority: dynamic programming appears in 80.0% of weighted reports. Schedule it first.");
    EXPECT_NE(std::find(s.begin(), s.end(), "Trending up in recent interviews (tau 0.80)."), s.end());
    EXPECT_NE(std::find(s.begin(), s.end(), "Reported as hard: budget extra practice and aim for optimal solutions."),
              s.end());
    EXPECT_EQ(s.back(), "Cover related terms: dp, memoization.");
}

TEST(InsightsGeneratorTest, ThinEvidenceNoted) {
    const Topic t = make_topic("a", "alpha", 20.0, 0.1, 0.5);
    const auto s = build_strategies(t, nullptr);
    EXPECT_EQ(s.front().rfind("Low priority: alpha", 0), 0u);
    EXPECT_EQ(s.back(), "Evidence is thin (confidence 0.10); confirm with more recent reports.");
}

// ==========================================
// Recommendations
// ==========================================

TEST(InsightsGeneratorTest, EmptyTopicsGiveNoRecommendations) {
    EXPECT_TRUE(generate_recommendations({}, {}).empty());
}

TEST(InsightsGeneratorTest, SortedByPriorityWithDuplicateTermsDropped) {
    const std::vector<Topic> topics = {
        make_topic("data_structures.heap", "heap", 30.0),
        make_topic("other.dynamic", "dynamic programming", 10.0),
        make_topic("algorithms.dynamic_programming", "dynamic programming", 90.0),
    };
    const auto recs = generate_recommendations(topics, {});

    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].topic.id, "algorithms.dynamic_programming");
    EXPECT_EQ(recs[1].topic.id, "data_structures.heap");
    EXPECT_GT(recs[0].priority_score, recs[1].priority_score);
    EXPECT_FALSE(recs[0].strategies.empty());
    EXPECT_GT(recs[0].estimated_hours, 0.0);
}

TEST(InsightsGeneratorTest, TiesBrokenByConfidenceThenTerm) {
    const std::vector<Topic> topics = {
        make_topic("t1", "gamma", 50.0, 0.4),
        make_topic("t2", "beta", 50.0, 0.9),
        make_topic("t3", "alpha", 50.0, 0.4),
    };
    const auto recs = generate_recommendations(topics, {});

    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].topic.representative_term, "beta");
    EXPECT_EQ(recs[1].topic.representative_term, "alpha");
    EXPECT_EQ(recs[2].topic.representative_term, "gamma");
}

TEST(InsightsGeneratorTest, SignificantTrendRaisesPriority) {
    const std::vector<Topic> topics = {
        make_topic("a", "alpha", 50.0),
        make_topic("b", "beta", 50.0),
    };
    const std::vector<TrendResult> trends = {significant("b", TrendDirection::Rising, 1.0)};
    const auto recs = generate_recommendations(topics, trends);

    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].topic.id, "b");
}
