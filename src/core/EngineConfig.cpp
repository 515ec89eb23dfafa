#include "core/EngineConfig.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/Errors.hpp"

namespace insights {

double DecayConfig::lambda() const {
    return std::log(2.0) / half_life_days;
}

static void require_positive(double v, const char* name) {
    if (!std::isfinite(v) || v <= 0.0) {
        throw ConfigurationError(std::string(name) + " must be a positive number");
    }
}

static void require_unit(double v, const char* name) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigurationError(std::string(name) + " must be within [0,1]");
    }
}

static void require_weights_sum_to_one(double a, double b, double c, double d, const char* group) {
    const double sum = a + b + c + d;
    if (std::abs(sum - 1.0) > 1e-6) {
        throw ConfigurationError(std::string(group) + " weights must sum to 1");
    }
}

void validate_config(const EngineConfig& cfg) {
    require_positive(cfg.decay.half_life_days, "decay.half_life_days");
    require_unit(cfg.decay.min_weight, "decay.min_weight");

    if (!(cfg.confidence.alpha > 0.0 && cfg.confidence.alpha < 1.0)) {
        throw ConfigurationError("confidence.alpha must be within (0,1)");
    }
    if (cfg.confidence.min_sample_size < kMinConfidenceSamples) {
        throw ConfigurationError("confidence.min_sample_size must be at least " +
                                 std::to_string(kMinConfidenceSamples));
    }
    if (!(cfg.confidence.tf_saturation >= 1.0)) {
        throw ConfigurationError("confidence.tf_saturation must be at least 1");
    }

    const auto& d = cfg.difficulty;
    require_unit(d.keyword_weight, "difficulty.keyword_weight");
    require_unit(d.rounds_weight, "difficulty.rounds_weight");
    require_unit(d.depth_weight, "difficulty.depth_weight");
    require_unit(d.outcome_weight, "difficulty.outcome_weight");
    require_weights_sum_to_one(d.keyword_weight, d.rounds_weight, d.depth_weight, d.outcome_weight, "difficulty");
    require_positive(d.round_saturation, "difficulty.round_saturation");
    require_positive(d.depth_saturation, "difficulty.depth_saturation");

    const auto& p = cfg.priority;
    require_unit(p.frequency_weight, "priority.frequency_weight");
    require_unit(p.difficulty_weight, "priority.difficulty_weight");
    require_unit(p.success_weight, "priority.success_weight");
    require_unit(p.trend_weight, "priority.trend_weight");
    require_weights_sum_to_one(p.frequency_weight, p.difficulty_weight, p.success_weight, p.trend_weight, "priority");
    require_unit(p.high_threshold, "priority.high_threshold");
    require_unit(p.medium_threshold, "priority.medium_threshold");
    require_unit(p.confidence_influence, "priority.confidence_influence");
    if (p.medium_threshold > p.high_threshold) {
        throw ConfigurationError("priority.medium_threshold must not exceed priority.high_threshold");
    }

    const auto& h = cfg.hours;
    if (!(h.base_hours >= 0.0) || !(h.difficulty_hours >= 0.0) || !(h.breadth_hours >= 0.0)) {
        throw ConfigurationError("hours curve coefficients must be non-negative");
    }
    require_positive(h.difficulty_exponent, "hours.difficulty_exponent");
    require_positive(h.rounding_step, "hours.rounding_step");

    const auto& e = cfg.extractor;
    if (e.batch_size == 0) throw ConfigurationError("extractor.batch_size must be at least 1");
    if (e.max_token_length == 0) throw ConfigurationError("extractor.max_token_length must be at least 1");
    if (e.min_other_document_frequency < 1) {
        throw ConfigurationError("extractor.min_other_document_frequency must be at least 1");
    }
    require_unit(e.cooccurrence_jaccard, "extractor.cooccurrence_jaccard");

    if (cfg.trend.bucket_months < 1 || cfg.trend.bucket_months > 12) {
        throw ConfigurationError("trend.bucket_months must be within [1,12]");
    }
    if (cfg.trend.min_buckets < kMinTrendBuckets) {
        throw ConfigurationError("trend.min_buckets must be at least " + std::to_string(kMinTrendBuckets));
    }
    if (!(cfg.trend.alpha > 0.0 && cfg.trend.alpha < 1.0)) {
        throw ConfigurationError("trend.alpha must be within (0,1)");
    }
}

PriorityLevel classify_priority(double weighted_frequency, double confidence, const PriorityConfig& cfg) {
    const double wf = std::min(std::max(weighted_frequency / 100.0, 0.0), 1.0);
    const double conf = std::min(std::max(confidence, 0.0), 1.0);
    const double basis = wf * (1.0 - cfg.confidence_influence + cfg.confidence_influence * conf);

    if (basis >= cfg.high_threshold) return PriorityLevel::High;
    if (basis >= cfg.medium_threshold) return PriorityLevel::Medium;
    return PriorityLevel::Low;
}

}  // namespace insights
