#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Models.hpp"
#include "insights/InterviewProcess.hpp"
#include "topics/Taxonomy.hpp"

namespace insights {

struct SkippedRecord {
    std::string record_id;
    std::string reason;
};

struct RunMetadata {
    std::string company;
    int records_received = 0;       // records attributed to this run, valid or not
    int documents_analyzed = 0;
    int malformed_skipped = 0;
    std::vector<SkippedRecord> skipped;
    int empty_documents = 0;        // valid records whose text normalized to nothing
    int batches = 0;
    std::optional<std::int64_t> reference_date;
};

enum class SampleAdequacy {
    Insufficient,
    Minimal,
    Adequate,
    Good,
    Excellent
};

struct DataQuality {
    double quality_score = 0.0;     // [0,1]
    SampleAdequacy adequacy = SampleAdequacy::Insufficient;
    double avg_tokens_per_document = 0.0;
    double avg_topics_per_document = 0.0;
    double mean_confidence = 0.0;
    std::vector<std::string> issues;
};

enum class DifficultyLevel {
    Easy,
    Medium,
    Hard,
    Unknown
};

struct PreparationStrategy {
    DifficultyLevel focus = DifficultyLevel::Unknown;
    int classified_documents = 0;
    int timeline_weeks_min = 4;
    int timeline_weeks_max = 6;
    bool has_practice_mix = false;
    int easy_percent = 0;
    int medium_percent = 0;
    int hard_percent = 0;
    std::vector<std::string> key_recommendations;
};

struct CompanyInsights {
    std::string company;
    std::vector<Topic> topics;
    std::vector<TrendResult> trends;
    std::vector<Recommendation> recommendations;
    RunMetadata metadata;
    DataQuality quality;
    PreparationStrategy strategy;
    InterviewProcess process;
};

struct PreparedDocuments {
    std::vector<NormalizedDocument> documents;
    RunMetadata metadata;
};

const char* adequacy_name(SampleAdequacy a);
const char* difficulty_level_name(DifficultyLevel d);

SampleAdequacy sample_adequacy(std::size_t documents);

// Throws MalformedRecordError when company, date or text is missing.
void validate_record(const ExperienceRecord& record);

// Lowercased, whitespace-trimmed key used to match companies.
std::string company_key(const std::string& company);

// Valid records of `company`, normalized. Malformed records are skipped and tallied;
// a record without a company cannot be attributed and is tallied in every run.
PreparedDocuments prepare_documents(const std::vector<ExperienceRecord>& records,
                                    const std::string& company,
                                    const EngineConfig& cfg);

DataQuality assess_data_quality(const std::vector<NormalizedDocument>& docs,
                                const std::vector<Topic>& topics,
                                const RunMetadata& meta,
                                const Taxonomy& taxonomy,
                                const EngineConfig& cfg);

PreparationStrategy preparation_strategy(const std::vector<NormalizedDocument>& docs,
                                         const std::vector<Recommendation>& recommendations);

// Full pipeline for one company. Throws ConfigurationError on an invalid config.
CompanyInsights analyze_company(const std::vector<ExperienceRecord>& records,
                                const std::string& company,
                                std::shared_ptr<const Taxonomy> taxonomy,
                                const EngineConfig& cfg);

// Companies are spread over at most hardware_concurrency() workers, the calling thread
// included; results come back in input order.
std::vector<CompanyInsights> analyze_companies(const std::vector<ExperienceRecord>& records,
                                               const std::vector<std::string>& companies,
                                               std::shared_ptr<const Taxonomy> taxonomy,
                                               const EngineConfig& cfg);

// Distinct companies in first-seen order (display spelling of the first occurrence).
std::vector<std::string> list_companies(const std::vector<ExperienceRecord>& records);

}  // namespace insights
