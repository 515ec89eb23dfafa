#pragma once
#include <cstdint>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Models.hpp"
#include "topics/Taxonomy.hpp"

namespace insights {

struct SeriesPoint {
    std::int64_t bucket = 0;        // month window index
    std::int64_t start_date = 0;    // first day of the window (days since epoch)
    int documents = 0;
    int referencing = 0;
    double value = 0.0;             // percent of the window's documents referencing the topic
};

// One point per non-empty window, chronological.
std::vector<SeriesPoint> build_topic_series(const Topic& topic,
                                            const std::vector<NormalizedDocument>& docs,
                                            const Taxonomy& taxonomy,
                                            const EngineConfig& cfg);

std::vector<double> series_values(const std::vector<SeriesPoint>& series);

// Mann-Kendall with tie-corrected variance and continuity correction; Sen's slope.
// Fewer than max(cfg.min_buckets, kMinTrendBuckets) points: STABLE, p = 1, strength 0.
TrendResult analyze_trend(const Topic& topic, const std::vector<double>& series, const TrendConfig& cfg);

double sens_slope(const std::vector<double>& series);

}  // namespace insights
