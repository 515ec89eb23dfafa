#include <gtest/gtest.h>

#include <algorithm>

#include "TestDocs.hpp"
#include "topics/TopicExtractor.hpp"

using namespace insights;
using testdocs::doc;
using testdocs::find_topic;

class TopicExtractorTest : public ::testing::Test {
protected:
    std::shared_ptr<const Taxonomy> tax = Taxonomy::builtin();
    EngineConfig cfg;

    std::vector<Topic> extract(const std::vector<NormalizedDocument>& docs) const {
        return TopicExtractor(tax, cfg).extract(docs);
    }

    static std::vector<NormalizedDocument> mixed_corpus() {
        return {
            doc("1", "System design of a chat service, then a dynamic programming problem.", "2023-01-10"),
            doc("2", "Two rounds: binary search tree and a heap question. Leetcode mediums.", "2023-05-02"),
            doc("3", "Leetcode style graph problem with BFS, then behavioral round.", "2023-09-14"),
            doc("4", "System design: load balancer, caching with redis, sharding the database.", "2024-02-20"),
            doc("5", "Recursions everywhere, plus some recursion and memoization.", "2024-06-01"),
            doc("6", "Java concurrency: threads, mutex and deadlock.", "2024-08-30"),
        };
    }
};

TEST_F(TopicExtractorTest, EmptyInputGivesNoTopics) {
    EXPECT_TRUE(extract({}).empty());
}

TEST_F(TopicExtractorTest, WeightedFrequencyOfTopWeightedCategoryIsCoverage) {
    const std::vector<NormalizedDocument> docs = {
        doc("1", "We discussed system design for a chat service."),
        doc("2", "Mostly system design, some caching."),
        doc("3", "A system design round and a coding round."),
        doc("4", "System design of a url shortener."),
        doc("5", "Mostly dynamic programming and arrays."),
    };

    const auto topics = extract(docs);
    const Topic* t = find_topic(topics, "system_design.architecture");
    ASSERT_NE(t, nullptr);
    EXPECT_DOUBLE_EQ(t->weighted_frequency, 80.0);
    EXPECT_EQ(t->document_frequency, 4);
    EXPECT_EQ(t->representative_term, "system design");
    EXPECT_EQ(t->category, Category::SystemDesign);
}

TEST_F(TopicExtractorTest, WeightedFrequencyScaledByCategoryWeight) {
    const std::vector<NormalizedDocument> docs = {
        doc("1", "heap heap"),
        doc("2", "graph problem"),
    };
    const Topic* t = find_topic(extract(docs), "data_structures.heap");
    ASSERT_NE(t, nullptr);
    // 50% coverage * 1.5 / 1.6
    EXPECT_NEAR(t->weighted_frequency, 46.875, 0.006);
}

TEST_F(TopicExtractorTest, WeightedFrequencyWithinBounds) {
    for (const auto& t : extract(mixed_corpus())) {
        EXPECT_GE(t.weighted_frequency, 0.0) << t.id;
        EXPECT_LE(t.weighted_frequency, 100.0) << t.id;
    }
}

TEST_F(TopicExtractorTest, SortedByCompositeScore) {
    const auto topics = extract(mixed_corpus());
    ASSERT_FALSE(topics.empty());
    for (size_t i = 1; i < topics.size(); ++i) {
        EXPECT_GE(topics[i - 1].composite_score, topics[i].composite_score);
    }
}

TEST_F(TopicExtractorTest, IndependentOfDocumentOrder) {
    auto docs = mixed_corpus();
    const auto a = extract(docs);
    std::reverse(docs.begin(), docs.end());
    const auto b = extract(docs);
    std::rotate(docs.begin(), docs.begin() + 2, docs.end());
    const auto c = extract(docs);

    ASSERT_EQ(a.size(), b.size());
    ASSERT_EQ(a.size(), c.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id, b[i].id);
        EXPECT_EQ(a[i].id, c[i].id);
        EXPECT_EQ(a[i].member_terms, b[i].member_terms);
        EXPECT_DOUBLE_EQ(a[i].composite_score, b[i].composite_score);
        EXPECT_DOUBLE_EQ(a[i].weighted_frequency, c[i].weighted_frequency);
    }
}

TEST_F(TopicExtractorTest, IndependentOfBatchSize) {
    const auto docs = mixed_corpus();
    cfg.extractor.batch_size = 1;
    const auto small = extract(docs);
    cfg.extractor.batch_size = 1000;
    const auto large = extract(docs);

    ASSERT_EQ(small.size(), large.size());
    for (size_t i = 0; i < small.size(); ++i) {
        EXPECT_EQ(small[i].id, large[i].id);
        EXPECT_DOUBLE_EQ(small[i].composite_score, large[i].composite_score);
    }
}

TEST_F(TopicExtractorTest, SurfaceVariantJoinsTaxonomyConcept) {
    const auto topics = extract(mixed_corpus());
    const Topic* t = find_topic(topics, "algorithms.recursion");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->member_terms.count("recursions"), 1u);
    EXPECT_EQ(t->member_terms.count("recursion"), 1u);
}

TEST_F(TopicExtractorTest, RecurringUnknownTermBecomesOtherTopic) {
    const auto topics = extract(mixed_corpus());
    const Topic* t = find_topic(topics, "other.leetcode");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->category, Category::Other);
    EXPECT_EQ(t->document_frequency, 2);

    // seen in a single report only
    EXPECT_EQ(find_topic(topics, "other.chat"), nullptr);
}

TEST_F(TopicExtractorTest, OtherTermsCanBeDisabled) {
    cfg.extractor.include_other_terms = false;
    for (const auto& t : extract(mixed_corpus())) {
        EXPECT_NE(t.category, Category::Other) << t.id;
    }
}

TEST_F(TopicExtractorTest, CooccurringUnknownTermsMerge) {
    const std::vector<NormalizedDocument> docs = {
        doc("1", "zookeeper paxos leader election heap"),
        doc("2", "zookeeper paxos consensus heap"),
        doc("3", "zookeeper paxos quorum"),
        doc("4", "binary tree traversal"),
        doc("5", "graph coloring"),
    };
    const auto topics = extract(docs);
    const Topic* t = find_topic(topics, "other.paxos");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->member_terms, (std::set<std::string>{"paxos", "zookeeper"}));
    EXPECT_EQ(find_topic(topics, "other.zookeeper"), nullptr);
}

TEST_F(TopicExtractorTest, OtherTopicsCapped) {
    cfg.extractor.max_other_topics = 1;
    size_t others = 0;
    for (const auto& t : extract(mixed_corpus())) {
        if (t.category == Category::Other) ++others;
    }
    EXPECT_LE(others, 1u);
}

TEST_F(TopicExtractorTest, OverlongTokensIgnored) {
    cfg.extractor.max_token_length = 4;
    const std::vector<NormalizedDocument> docs = {doc("1", "heap recursion"), doc("2", "graph")};
    const auto topics = extract(docs);
    EXPECT_NE(find_topic(topics, "data_structures.heap"), nullptr);
    EXPECT_EQ(find_topic(topics, "algorithms.recursion"), nullptr);
}
