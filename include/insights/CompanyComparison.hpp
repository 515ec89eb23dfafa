#pragma once
#include <string>
#include <vector>

#include "insights/CompanyAnalysis.hpp"

namespace insights {

struct CompanyTopicStat {
    std::string company;
    double weighted_frequency = 0.0;
    PriorityLevel priority_level = PriorityLevel::Low;
};

struct SharedTopic {
    std::string topic_id;
    std::string representative_term;   // as seen in the first company that has it
    Category category = Category::Other;
    double average_weighted_frequency = 0.0;
    std::vector<CompanyTopicStat> companies;
};

struct UniqueTopics {
    std::string company;
    std::vector<std::string> topic_ids;   // weighted frequency desc, then id
};

struct CompanyComparison {
    std::vector<std::string> companies;
    std::vector<SharedTopic> shared_topics;   // average weighted frequency desc, then id
    std::vector<UniqueTopics> unique_topics;  // input order
};

// Fewer than two results -> empty comparison.
CompanyComparison compare_companies(const std::vector<CompanyInsights>& results);

}  // namespace insights
