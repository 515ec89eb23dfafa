#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "core/Models.hpp"

namespace insights {

// Hard floors: confidence is 0 below three samples, trends need four buckets.
constexpr int kMinConfidenceSamples = 3;
constexpr std::size_t kMinTrendBuckets = 4;

struct DecayConfig {
    // weight = exp(-lambda * days), lambda = ln 2 / half_life_days
    double half_life_days = 730.0;
    double min_weight = 0.01;

    double lambda() const;
};

struct ConfidenceConfig {
    double alpha = 0.05;          // two-sided, so t_critical is the 97.5% quantile
    int min_sample_size = kMinConfidenceSamples;  // below this confidence is forced to 0

    // per-document contribution saturates at this many mentions
    double tf_saturation = 4.0;
};

struct DifficultyConfig {
    double keyword_weight = 0.40;
    double rounds_weight = 0.25;
    double depth_weight = 0.25;
    double outcome_weight = 0.10;

    double round_saturation = 5.0;   // rounds at which the proxy reaches 1
    double depth_saturation = 8.0;   // distinct concepts at which the proxy reaches 1
};

struct PriorityConfig {
    double frequency_weight = 0.4;
    double difficulty_weight = 0.3;
    double success_weight = 0.2;
    double trend_weight = 0.1;

    // level basis = wf/100 * (1 - influence + influence * confidence)
    double high_threshold = 0.66;
    double medium_threshold = 0.33;
    double confidence_influence = 0.5;
};

// hours = base + difficulty_hours * difficulty^difficulty_exponent + breadth_hours * ln(1 + members)
struct HoursCurve {
    double base_hours = 4.0;
    double difficulty_hours = 16.0;
    double difficulty_exponent = 1.5;
    double breadth_hours = 3.0;
    double rounding_step = 0.5;
};

struct ExtractorConfig {
    std::size_t batch_size = 50;
    std::size_t max_token_length = 64;

    bool include_other_terms = true;
    int min_other_document_frequency = 2;
    std::size_t max_other_topics = 10;

    // non-taxonomy clusters merge when their document sets overlap this much
    double cooccurrence_jaccard = 0.9;
    int min_cooccurrence_docs = 3;
};

struct TrendConfig {
    int bucket_months = 3;
    std::size_t min_buckets = kMinTrendBuckets;
    double alpha = 0.05;
};

struct EngineConfig {
    DecayConfig decay;
    ConfidenceConfig confidence;
    DifficultyConfig difficulty;
    PriorityConfig priority;
    HoursCurve hours;
    ExtractorConfig extractor;
    TrendConfig trend;

    // Reference date for time decay (days since epoch). Unset: latest document date of the run.
    std::optional<std::int64_t> as_of;
};

// Throws ConfigurationError when a value is out of range.
void validate_config(const EngineConfig& cfg);

PriorityLevel classify_priority(double weighted_frequency, double confidence, const PriorityConfig& cfg);

}  // namespace insights
