#include "stats/TrendAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "core/DateUtil.hpp"
#include "stats/StatsUtil.hpp"
#include "topics/TopicExtractor.hpp"

namespace insights {

std::vector<SeriesPoint> build_topic_series(const Topic& topic,
                                            const std::vector<NormalizedDocument>& docs,
                                            const Taxonomy& taxonomy,
                                            const EngineConfig& cfg) {
    std::map<std::int64_t, SeriesPoint> buckets;

    for (const auto& doc : docs) {
        const std::int64_t b = dateutil::month_bucket(doc.date, cfg.trend.bucket_months);
        auto& p = buckets[b];
        p.bucket = b;
        p.documents += 1;
        if (references_topic(topic, document_terms(doc, taxonomy, cfg.extractor.max_token_length))) {
            p.referencing += 1;
        }
    }

    std::vector<SeriesPoint> out;
    out.reserve(buckets.size());
    for (auto& kv : buckets) {
        SeriesPoint p = kv.second;
        p.start_date = dateutil::bucket_start(p.bucket, cfg.trend.bucket_months);
        p.value = 100.0 * static_cast<double>(p.referencing) / static_cast<double>(p.documents);
        out.push_back(p);
    }
    return out;
}

std::vector<double> series_values(const std::vector<SeriesPoint>& series) {
    std::vector<double> v;
    v.reserve(series.size());
    for (const auto& p : series) v.push_back(p.value);
    return v;
}

static int sign(double v) {
    if (v > 0.0) return 1;
    if (v < 0.0) return -1;
    return 0;
}

double sens_slope(const std::vector<double>& x) {
    std::vector<double> slopes;
    for (std::size_t i = 0; i < x.size(); ++i) {
        for (std::size_t j = i + 1; j < x.size(); ++j) {
            slopes.push_back((x[j] - x[i]) / static_cast<double>(j - i));
        }
    }
    if (slopes.empty()) return 0.0;

    std::sort(slopes.begin(), slopes.end());
    const std::size_t m = slopes.size();
    if (m % 2 == 1) return slopes[m / 2];
    return 0.5 * (slopes[m / 2 - 1] + slopes[m / 2]);
}

TrendResult analyze_trend(const Topic& topic, const std::vector<double>& x, const TrendConfig& cfg) {
    TrendResult r;
    r.topic_id = topic.id;
    r.bucket_count = static_cast<int>(x.size());

    // insufficient data: not an error, just no trend
    if (x.size() < std::max(cfg.min_buckets, kMinTrendBuckets)) return r;

    const std::size_t n = x.size();
    long long s = 0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) s += sign(x[j] - x[i]);
    }

    // tie groups
    std::map<double, int> groups;
    for (double v : x) groups[v] += 1;
    double tie_term = 0.0;
    for (const auto& kv : groups) {
        const double t = kv.second;
        tie_term += t * (t - 1.0) * (2.0 * t + 5.0);
    }

    const double nd = static_cast<double>(n);
    const double var = (nd * (nd - 1.0) * (2.0 * nd + 5.0) - tie_term) / 18.0;

    double z = 0.0;
    if (var > 0.0) {
        if (s > 0) z = (static_cast<double>(s) - 1.0) / std::sqrt(var);
        else if (s < 0) z = (static_cast<double>(s) + 1.0) / std::sqrt(var);
    }

    r.statistic = static_cast<double>(s);
    r.p_value = stats::normal_two_tailed_p(z);
    r.significant = r.p_value < cfg.alpha;
    r.strength = stats::clamp01(std::abs(static_cast<double>(s)) / (nd * (nd - 1.0) / 2.0));
    r.slope = sens_slope(x);

    if (s > 0) r.direction = TrendDirection::Rising;
    else if (s < 0) r.direction = TrendDirection::Falling;
    else r.direction = TrendDirection::Stable;

    return r;
}

}  // namespace insights
