#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace insights {

enum class Outcome {
    Success,
    Fail,
    Unknown
};

// Supplied by the collection layer; never modified here.
struct ExperienceRecord {
    std::string id;
    std::string company;
    std::string role;
    std::optional<std::int64_t> date;   // days since 1970-01-01 (UTC)
    std::string raw_text;
    Outcome outcome = Outcome::Unknown;
    std::string source_platform;
    std::string source_url;
};

struct NormalizedDocument {
    std::string record_id;
    std::string company;
    std::int64_t date = 0;              // days since 1970-01-01 (UTC)
    Outcome outcome = Outcome::Unknown;
    std::vector<std::string> tokens;    // ordered, normalized
};

enum class Category {
    DataStructures,
    Algorithms,
    SystemDesign,
    ProgrammingConcepts,
    Technologies,
    Behavioral,
    Other
};

constexpr std::size_t kCategoryCount = 7;

enum class PriorityLevel {
    High,
    Medium,
    Low
};

enum class TrendDirection {
    Rising,
    Falling,
    Stable
};

struct Topic {
    std::string id;                       // "<category>.<concept>" or "other.<term>"
    std::string representative_term;
    std::set<std::string> member_terms;
    Category category = Category::Other;

    double weighted_frequency = 0.0;      // [0,100]
    PriorityLevel priority_level = PriorityLevel::Low;
    double confidence_score = 0.0;        // [0,1]
    double difficulty_score = 0.0;        // [0,1]
    double time_weighted_relevance = 0.0; // decay-weighted coverage, percent
    double success_correlation = 0.5;     // [0,1], 0.5 = no signal

    double composite_score = 0.0;         // tf-idf x category weight, summed over members
    int document_frequency = 0;           // documents referencing any member
    int sample_size = 0;                  // contributing documents seen by the scorer
};

struct TrendResult {
    std::string topic_id;
    TrendDirection direction = TrendDirection::Stable;
    double strength = 0.0;                // |Kendall tau|
    double p_value = 1.0;
    bool significant = false;

    double statistic = 0.0;               // Mann-Kendall S
    double slope = 0.0;                   // Sen's slope, per bucket
    int bucket_count = 0;
};

struct Recommendation {
    Topic topic;
    double priority_score = 0.0;          // [0,1]
    double estimated_hours = 0.0;
    std::vector<std::string> strategies;
};

const char* outcome_name(Outcome o);
const char* category_name(Category c);
const char* priority_name(PriorityLevel p);
const char* direction_name(TrendDirection d);

std::optional<Category> category_from_name(const std::string& name);
std::size_t category_index(Category c);

}  // namespace insights
