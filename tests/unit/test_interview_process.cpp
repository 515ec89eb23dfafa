#include <gtest/gtest.h>

#include "TestDocs.hpp"
#include "insights/InterviewProcess.hpp"

using namespace insights;
using testdocs::doc;

// ==========================================
// Per-report classification
// ==========================================

TEST(InterviewProcessTest, ClassifySystemDesignRound) {
    const auto rounds = classify_rounds(textutil::normalize_text("System design round on scalability and architecture"));
    ASSERT_EQ(rounds.size(), 1u);
    EXPECT_EQ(rounds[0].type, RoundType::SystemDesign);
    EXPECT_EQ(rounds[0].score, 4);
    EXPECT_DOUBLE_EQ(rounds[0].confidence, 1.0);
}

TEST(InterviewProcessTest, ClassifyMatchesStemmedPhrases) {
    const auto coding = classify_rounds(textutil::normalize_text("Two coding problems: graph algorithms and a leetcode medium"));
    ASSERT_EQ(coding.size(), 1u);
    EXPECT_EQ(coding[0].type, RoundType::Coding);
    EXPECT_EQ(coding[0].score, 3);

    const auto discussion = classify_rounds(textutil::normalize_text("A deep dive into past projects"));
    ASSERT_EQ(discussion.size(), 1u);
    EXPECT_EQ(discussion[0].type, RoundType::TechnicalDiscussion);
    EXPECT_EQ(discussion[0].score, 2);
    EXPECT_NEAR(discussion[0].confidence, 2.0 / 3.0, 1e-12);
}

TEST(InterviewProcessTest, ClassifyReportsSeveralRoundsInEnumOrder) {
    const auto rounds =
        classify_rounds(textutil::normalize_text("Behavioral round on leadership, then coding with data structures"));
    ASSERT_EQ(rounds.size(), 2u);
    EXPECT_EQ(rounds[0].type, RoundType::Coding);
    EXPECT_EQ(rounds[0].score, 2);
    EXPECT_EQ(rounds[1].type, RoundType::Behavioral);
    EXPECT_EQ(rounds[1].score, 2);
}

TEST(InterviewProcessTest, NoKeywordsNoRounds) {
    EXPECT_TRUE(classify_rounds(textutil::normalize_text("Heap and trie questions")).empty());
    EXPECT_TRUE(classify_rounds({}).empty());
}

// ==========================================
// Summary
// ==========================================

TEST(InterviewProcessTest, CommonRoundsAboveThirtyPercent) {
    const std::vector<NormalizedDocument> docs = {
        doc("1", "coding round with algorithms and a leetcode problem"),
        doc("2", "system design of a url shortener, scalability and architecture"),
        doc("3", "coding and data structures, then one algorithm question"),
        doc("4", "behavioral chat"),
    };
    const InterviewProcess p = summarize_interview_process(docs);

    ASSERT_EQ(p.documents.size(), 4u);
    EXPECT_EQ(p.documents[3].record_id, "4");
    ASSERT_EQ(p.documents[3].rounds.size(), 1u);
    EXPECT_EQ(p.documents[3].rounds[0].score, 1);

    // a single behavioral hit is not confident enough to count
    ASSERT_EQ(p.distribution.size(), 2u);
    EXPECT_EQ(p.distribution[0].type, RoundType::Coding);
    EXPECT_EQ(p.distribution[0].count, 2);
    EXPECT_DOUBLE_EQ(p.distribution[0].percent, 50.0);
    EXPECT_EQ(p.distribution[1].type, RoundType::SystemDesign);
    EXPECT_DOUBLE_EQ(p.distribution[1].percent, 25.0);

    ASSERT_EQ(p.common_rounds.size(), 1u);
    EXPECT_EQ(p.common_rounds[0].type, RoundType::Coding);
    EXPECT_EQ(p.insight, "Most interviews include 1 common round types.");
}

TEST(InterviewProcessTest, CommonRoundsMostFrequentFirst) {
    const std::vector<NormalizedDocument> docs = {
        doc("1", "system design and architecture"),
        doc("2", "system design and architecture"),
        doc("3", "system design plus coding algorithm"),
        doc("4", "coding and leetcode"),
    };
    const InterviewProcess p = summarize_interview_process(docs);

    ASSERT_EQ(p.common_rounds.size(), 2u);
    EXPECT_EQ(p.common_rounds[0].type, RoundType::SystemDesign);
    EXPECT_DOUBLE_EQ(p.common_rounds[0].percent, 75.0);
    EXPECT_EQ(p.common_rounds[1].type, RoundType::Coding);
    EXPECT_DOUBLE_EQ(p.common_rounds[1].percent, 50.0);
}

TEST(InterviewProcessTest, EmptyCorpusIsVaried) {
    const InterviewProcess p = summarize_interview_process({});
    EXPECT_TRUE(p.documents.empty());
    EXPECT_TRUE(p.distribution.empty());
    EXPECT_TRUE(p.common_rounds.empty());
    EXPECT_EQ(p.insight, "Varied interview processes.");
}

TEST(InterviewProcessTest, RoundTypeNames) {
    EXPECT_STREQ(round_type_name(RoundType::TechnicalDiscussion), "technical_discussion");
    EXPECT_EQ(round_type_display(RoundType::SystemDesign), "System Design");
}
