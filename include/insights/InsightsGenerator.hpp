#pragma once
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Models.hpp"

namespace insights {

// 0.5 without a trend or with a non-significant one; 0.5 +/- 0.5 * strength otherwise.
double trend_signal(const TrendResult* trend);

double priority_score(const Topic& topic, const TrendResult* trend, const PriorityConfig& cfg);

// base + difficulty_hours * difficulty^exponent + breadth_hours * ln(1 + members), rounded to the step
double estimate_hours(const Topic& topic, const HoursCurve& curve);

std::vector<std::string> build_strategies(const Topic& topic, const TrendResult* trend);

// Sorted by priority desc, confidence desc, representative term asc.
// Later topics with an already used representative term are dropped.
std::vector<Recommendation> generate_recommendations(const std::vector<Topic>& topics,
                                                     const std::vector<TrendResult>& trends,
                                                     const EngineConfig& cfg = {});

}  // namespace insights
