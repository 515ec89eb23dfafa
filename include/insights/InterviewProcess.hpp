#pragma once
#include <string>
#include <vector>

#include "core/Models.hpp"

namespace insights {

enum class RoundType {
    Coding,
    SystemDesign,
    Behavioral,
    TechnicalDiscussion
};

const char* round_type_name(RoundType r);       // "coding", "system_design", ...
std::string round_type_display(RoundType r);    // "Coding", "System Design", ...

struct RoundClassification {
    RoundType type = RoundType::Coding;
    int score = 0;              // keyword hits in the report
    double confidence = 0.0;    // min(score / 3, 1)
};

struct DocumentRounds {
    std::string record_id;
    std::vector<RoundClassification> rounds;    // only types with at least one hit, enum order
};

struct RoundFrequency {
    RoundType type = RoundType::Coding;
    int count = 0;              // reports where the round was detected with confidence > 0.5
    double percent = 0.0;       // of all analyzed reports, one decimal
};

struct InterviewProcess {
    std::vector<DocumentRounds> documents;
    std::vector<RoundFrequency> distribution;   // every detected type, enum order
    std::vector<RoundFrequency> common_rounds;  // detected in more than 30% of reports, most frequent first
    std::string insight;
};

// Keyword hits per round type over normalized tokens (light-stemmed, phrase aware).
std::vector<RoundClassification> classify_rounds(const std::vector<std::string>& tokens);

InterviewProcess summarize_interview_process(const std::vector<NormalizedDocument>& docs);

}  // namespace insights
