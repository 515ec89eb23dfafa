#include "insights/InsightsGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_map>

#include "stats/StatsUtil.hpp"

namespace insights {

static std::string format_fixed(double v, int digits) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << v;
    return os.str();
}

double trend_signal(const TrendResult* trend) {
    if (!trend || !trend->significant) return 0.5;
    switch (trend->direction) {
        case TrendDirection::Rising: return stats::clamp01(0.5 + 0.5 * trend->strength);
        case TrendDirection::Falling: return stats::clamp01(0.5 - 0.5 * trend->strength);
        case TrendDirection::Stable: return 0.5;
    }
    return 0.5;
}

double priority_score(const Topic& topic, const TrendResult* trend, const PriorityConfig& cfg) {
    const double wf = stats::clamp01(topic.weighted_frequency / 100.0);
    const double s = cfg.frequency_weight * wf +
                     cfg.difficulty_weight * stats::clamp01(topic.difficulty_score) +
                     cfg.success_weight * stats::clamp01(topic.success_correlation) +
                     cfg.trend_weight * trend_signal(trend);
    return stats::clamp01(s);
}

double estimate_hours(const Topic& topic, const HoursCurve& curve) {
    const double diff = stats::clamp01(topic.difficulty_score);
    const double members = static_cast<double>(topic.member_terms.size());
    const double hours = curve.base_hours +
                         curve.difficulty_hours * std::pow(diff, curve.difficulty_exponent) +
                         curve.breadth_hours * std::log(1.0 + members);
    return stats::round_to(hours, curve.rounding_step);
}

static std::string category_advice(const Topic& t) {
    const std::string& term = t.representative_term;
    switch (t.category) {
        case Category::DataStructures:
            return "Implement " + term + " operations from scratch and know their time and space costs.";
        case Category::Algorithms:
            return "Solve timed practice problems built on " + term + " and explain the complexity of each solution.";
        case Category::SystemDesign:
            return "Practice whole-system designs that involve " + term + " and be ready to argue the trade-offs.";
        case Category::ProgrammingConcepts:
            return "Review the fundamentals of " + term + " and prepare short code examples.";
        case Category::Technologies:
            return "Refresh hands-on experience with " + term + " and prepare a project example that uses it.";
        case Category::Behavioral:
            return "Prepare STAR-format stories around " + term + ".";
        case Category::Other:
            return "Check how " + term + " comes up in recent reports and prepare a short summary.";
    }
    return {};
}

std::vector<std::string> build_strategies(const Topic& t, const TrendResult* trend) {
    std::vector<std::string> out;
    const std::string pct = format_fixed(t.weighted_frequency, 1) + "%";

    switch (t.priority_level) {
        case PriorityLevel::High:
            out.push_back("High priority: " + t.representative_term + " appears in " + pct +
                          " of weighted reports. Schedule it first.");
            break;
        case PriorityLevel::Medium:
            out.push_back("Medium priority: " + t.representative_term + " appears in " + pct +
                          " of weighted reports. Cover it after the high-priority topics.");
            break;
        case PriorityLevel::Low:
            out.push_back("Low priority: " + t.representative_term + " appears in " + pct +
                          " of weighted reports. Review it once the core topics are solid.");
            break;
    }

    out.push_back(category_advice(t));

    if (t.difficulty_score >= 0.66) {
        out.push_back("Reported as hard: budget extra practice and aim for optimal solutions.");
    } else if (t.difficulty_score <= 0.33) {
        out.push_back("Usually asked at an introductory level: focus on fundamentals.");
    }

    if (trend && trend->significant) {
        switch (trend->direction) {
            case TrendDirection::Rising:
                out.push_back("Trending up in recent interviews (tau " + format_fixed(trend->strength, 2) + ").");
                break;
            case TrendDirection::Falling:
                out.push_back("Trending down in recent interviews (tau " + format_fixed(trend->strength, 2) +
                              "); keep it lower on the list.");
                break;
            case TrendDirection::Stable:
                break;
        }
    }

    if (t.confidence_score < 0.5) {
        out.push_back("Evidence is thin (confidence " + format_fixed(t.confidence_score, 2) +
                      "); confirm with more recent reports.");
    }

    if (t.member_terms.size() > 1) {
        std::string related;
        int listed = 0;
        for (const auto& m : t.member_terms) {
            if (m == t.representative_term) continue;
            if (listed == 5) break;
            if (listed > 0) related += ", ";
            related += m;
            ++listed;
        }
        out.push_back("Cover related terms: " + related + ".");
    }

    return out;
}

std::vector<Recommendation> generate_recommendations(const std::vector<Topic>& topics,
                                                     const std::vector<TrendResult>& trends,
                                                     const EngineConfig& cfg) {
    std::unordered_map<std::string, const TrendResult*> by_topic;
    for (const auto& tr : trends) by_topic.emplace(tr.topic_id, &tr);

    std::vector<Recommendation> recs;
    recs.reserve(topics.size());

    for (const auto& t : topics) {
        auto it = by_topic.find(t.id);
        const TrendResult* trend = it == by_topic.end() ? nullptr : it->second;

        Recommendation r;
        r.topic = t;
        r.priority_score = priority_score(t, trend, cfg.priority);
        r.estimated_hours = estimate_hours(t, cfg.hours);
        r.strategies = build_strategies(t, trend);
        recs.push_back(std::move(r));
    }

    std::sort(recs.begin(), recs.end(), [](const Recommendation& a, const Recommendation& b) {
        if (a.priority_score != b.priority_score) return a.priority_score > b.priority_score;
        if (a.topic.confidence_score != b.topic.confidence_score) {
            return a.topic.confidence_score > b.topic.confidence_score;
        }
        if (a.topic.representative_term != b.topic.representative_term) {
            return a.topic.representative_term < b.topic.representative_term;
        }
        return a.topic.id < b.topic.id;
    });

    std::vector<Recommendation> out;
    out.reserve(recs.size());
    std::set<std::string> seen;
    for (auto& r : recs) {
        if (!seen.insert(r.topic.representative_term).second) continue;
        out.push_back(std::move(r));
    }
    return out;
}

}  // namespace insights
