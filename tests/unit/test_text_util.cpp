#include <gtest/gtest.h>

#include <algorithm>

#include "text/TextUtil.hpp"

using namespace textutil;

using Tokens = std::vector<std::string>;

// ==========================================
// Normalization
// ==========================================

TEST(TextUtilTest, NormalizeLowercasesAndKeepsLanguageSymbols) {
    EXPECT_EQ(normalize("Hello, C++ and C# World!"), "hello c++ and c# world");
}

TEST(TextUtilTest, NormalizeCollapsesSeparators) {
    EXPECT_EQ(normalize("  a -- b\t\n c  "), "a b c");
    EXPECT_EQ(normalize(""), "");
}

TEST(TextUtilTest, NormalizeFoldsLatin1Accents) {
    EXPECT_EQ(normalize("Caf\xC3\xA9 na\xC3\xAFve"), "cafe naive");
}

TEST(TextUtilTest, NormalizeTreatsOtherUnicodeAsSeparator) {
    // U+2014 em dash between two words
    EXPECT_EQ(normalize("graph\xE2\x80\x94tree"), "graph tree");
}

TEST(TextUtilTest, StripMarkupRemovesTagsUrlsAndEntities) {
    const std::string s = strip_markup("<p>Heap &amp; stack</p> see https://example.com/x?a=1 now");
    EXPECT_EQ(normalize(s), "heap stack see now");
}

TEST(TextUtilTest, StripMarkupKeepsComparisonsAndArrows) {
    const Tokens t = normalize_text("loop while i<n then use a heap and return node->next");
    EXPECT_NE(std::find(t.begin(), t.end(), "heap"), t.end());
    EXPECT_NE(std::find(t.begin(), t.end(), "loop"), t.end());
    EXPECT_NE(std::find(t.begin(), t.end(), "next"), t.end());

    EXPECT_EQ(normalize(strip_markup("if a<b and c>d swap")), "if a b and c d swap");
    EXPECT_EQ(normalize(strip_markup("vector<int> sorted")), "vector int sorted");
}

TEST(TextUtilTest, StripMarkupHandlesAttributesAndComments) {
    EXPECT_EQ(normalize(strip_markup("<a href=\"https://x.y\" class=link>trie</a><br/>graph")), "trie graph");
    EXPECT_EQ(normalize(strip_markup("<!-- note --> heap <!DOCTYPE html>")), "heap");
    EXPECT_EQ(normalize(strip_markup("<P>Stack</P>")), "stack");
}

// ==========================================
// Tokens
// ==========================================

TEST(TextUtilTest, TokenizeDropsJunkButKeepsDigitsAndC) {
    EXPECT_EQ(tokenize("a c++ c # x 3 ++"), (Tokens{"c++", "c", "3"}));
}

TEST(TextUtilTest, NormalizeTokensFoldsSynonymsAndMergesCompounds) {
    EXPECT_EQ(normalize_tokens({"back", "end", "db", "hash", "map", "k8s"}),
              (Tokens{"backend", "database", "hashmap", "kubernetes"}));
}

TEST(TextUtilTest, StopwordsKeepInterviewVocabulary) {
    EXPECT_TRUE(is_stopword("the"));
    EXPECT_TRUE(is_stopword("interviewer"));
    EXPECT_FALSE(is_stopword("design"));
    EXPECT_FALSE(is_stopword("round"));
    EXPECT_FALSE(is_stopword("third"));
}

TEST(TextUtilTest, NormalizeTextFullPipeline) {
    EXPECT_EQ(normalize_text("<b>I was asked about System Design &amp; caching</b>"),
              (Tokens{"system", "design", "caching"}));
}

TEST(TextUtilTest, NormalizeTextEmptyAndMarkupOnly) {
    EXPECT_TRUE(normalize_text("").empty());
    EXPECT_TRUE(normalize_text("<div></div> https://example.com").empty());
}

// ==========================================
// Stemming and token checks
// ==========================================

TEST(TextUtilTest, LightStem) {
    EXPECT_EQ(light_stem("queries"), "query");
    EXPECT_EQ(light_stem("classes"), "class");
    EXPECT_EQ(light_stem("strings"), "string");
    EXPECT_EQ(light_stem("string"), "string");
    EXPECT_EQ(light_stem("hashing"), "hash");
    EXPECT_EQ(light_stem("sorted"), "sort");
    EXPECT_EQ(light_stem("trees"), "tree");
    EXPECT_EQ(light_stem("status"), "status");
    EXPECT_EQ(light_stem("bfs"), "bfs");
}

TEST(TextUtilTest, WellFormedToken) {
    EXPECT_TRUE(is_well_formed_token("graph", 64));
    EXPECT_FALSE(is_well_formed_token("", 64));
    EXPECT_FALSE(is_well_formed_token(std::string(65, 'a'), 64));
    EXPECT_FALSE(is_well_formed_token(std::string("a\x01"), 64));
}

TEST(TextUtilTest, NormalizeRecordCopiesFields) {
    insights::ExperienceRecord r;
    r.id = "r1";
    r.company = "Acme";
    r.date = 19000;
    r.outcome = insights::Outcome::Success;
    r.raw_text = "Two rounds of dynamic programming";

    const auto d = normalize_record(r);
    EXPECT_EQ(d.record_id, "r1");
    EXPECT_EQ(d.company, "Acme");
    EXPECT_EQ(d.date, 19000);
    EXPECT_EQ(d.outcome, insights::Outcome::Success);
    EXPECT_EQ(d.tokens, (Tokens{"two", "rounds", "dynamic", "programming"}));
}
