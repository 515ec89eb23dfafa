#include "stats/StatisticalScorer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "stats/StatsUtil.hpp"
#include "topics/TopicExtractor.hpp"

namespace insights {

DifficultyIndicators count_difficulty_indicators(const std::vector<std::string>& tokens) {
    static const std::unordered_set<std::string> easy = {
        "easy", "simple", "basic", "straightforward", "trivial", "beginner", "junior"
    };
    static const std::unordered_set<std::string> medium = {
        "medium", "moderate", "intermediate", "standard", "manageable", "doable"
    };
    static const std::unordered_set<std::string> hard = {
        "hard", "difficult", "challenging", "tough", "complex", "advanced", "struggled",
        "difficulty", "trouble", "senior", "expert", "tricky"
    };

    DifficultyIndicators ind;
    for (const auto& t : tokens) {
        if (easy.count(t)) ++ind.easy;
        else if (medium.count(t)) ++ind.medium;
        else if (hard.count(t)) ++ind.hard;
    }
    return ind;
}

double keyword_difficulty(const DifficultyIndicators& ind) {
    const int total = ind.total();
    if (total == 0) return 0.5;
    return (0.5 * ind.medium + 1.0 * ind.hard) / static_cast<double>(total);
}

static int small_number(const std::string& t) {
    static const std::unordered_map<std::string, int> words = {
        {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5}, {"six", 6}, {"seven", 7},
        {"eight", 8}, {"nine", 9}, {"ten", 10},
        {"first", 1}, {"second", 2}, {"third", 3}, {"fourth", 4}, {"fifth", 5}, {"sixth", 6},
        {"seventh", 7}, {"eighth", 8}, {"ninth", 9}, {"tenth", 10},
        {"1st", 1}, {"2nd", 2}, {"3rd", 3}, {"4th", 4}, {"5th", 5}, {"6th", 6},
        {"7th", 7}, {"8th", 8}, {"9th", 9}, {"10th", 10}
    };
    auto it = words.find(t);
    if (it != words.end()) return it->second;

    if (!t.empty() && t.size() <= 2 &&
        std::all_of(t.begin(), t.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        const int v = std::stoi(t);
        return (v >= 1 && v <= 20) ? v : 0;
    }
    return 0;
}

int round_count_proxy(const std::vector<std::string>& tokens) {
    int best = 0;
    int mentions = 0;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];
        if (t != "round" && t != "rounds") continue;
        if (i + 1 < tokens.size() && tokens[i + 1] == "robin") continue;

        ++mentions;
        if (i > 0) best = std::max(best, small_number(tokens[i - 1]));            // "3 rounds", "third round"
        if (i + 1 < tokens.size()) best = std::max(best, small_number(tokens[i + 1]));  // "round 3"
    }
    return std::max(best, mentions);
}

double success_correlation(int ref_success, int ref_fail, int other_success, int other_fail) {
    const double a = ref_success, b = ref_fail, c = other_success, d = other_fail;
    const double denom = (a + b) * (c + d) * (a + c) * (b + d);
    if (!(denom > 0.0)) return 0.5;

    const double phi = (a * d - b * c) / std::sqrt(denom);
    return stats::clamp01((phi + 1.0) / 2.0);
}

StatisticalScorer::StatisticalScorer(std::shared_ptr<const Taxonomy> taxonomy, EngineConfig cfg)
    : m_taxonomy(std::move(taxonomy)), m_cfg(std::move(cfg)) {}

std::int64_t StatisticalScorer::reference_date(const std::vector<NormalizedDocument>& docs) const {
    if (m_cfg.as_of) return *m_cfg.as_of;
    if (docs.empty()) return 0;
    std::int64_t latest = docs.front().date;
    for (const auto& d : docs) latest = std::max(latest, d.date);
    return latest;
}

double StatisticalScorer::decay_weight(std::int64_t doc_date, std::int64_t reference) const {
    const double days = static_cast<double>(std::max<std::int64_t>(0, reference - doc_date));
    const double w = std::exp(-m_cfg.decay.lambda() * days);
    return std::max(w, m_cfg.decay.min_weight);
}

Topic StatisticalScorer::score(const Topic& topic, const std::vector<NormalizedDocument>& docs) const {
    Topic out = topic;
    const auto& dcfg = m_cfg.difficulty;
    const auto& ccfg = m_cfg.confidence;
    const std::int64_t ref = reference_date(docs);
    const double saturation = 1.0 + std::log(ccfg.tf_saturation);

    std::vector<double> all_weights;
    std::vector<double> topic_weights;
    std::vector<double> samples;
    std::vector<double> keyword_scores;
    std::vector<double> round_scores;
    std::vector<double> depth_scores;
    int ref_success = 0, ref_fail = 0, other_success = 0, other_fail = 0;

    all_weights.reserve(docs.size());

    for (const auto& doc : docs) {
        const auto terms = document_terms(doc, *m_taxonomy, m_cfg.extractor.max_token_length);
        const int tf = topic_term_frequency(topic, terms);
        const double w = decay_weight(doc.date, ref);
        all_weights.push_back(w);

        if (doc.outcome != Outcome::Unknown) {
            const bool success = doc.outcome == Outcome::Success;
            if (tf > 0) (success ? ref_success : ref_fail) += 1;
            else (success ? other_success : other_fail) += 1;
        }

        if (tf == 0) continue;

        topic_weights.push_back(w);
        samples.push_back(w * std::min(1.0, (1.0 + std::log(static_cast<double>(tf))) / saturation));

        keyword_scores.push_back(keyword_difficulty(count_difficulty_indicators(doc.tokens)));
        round_scores.push_back(std::min(1.0, round_count_proxy(doc.tokens) / dcfg.round_saturation));
        depth_scores.push_back(
            std::min(1.0, static_cast<double>(m_taxonomy->concepts_in(terms).size()) / dcfg.depth_saturation));
    }

    const std::size_t n = samples.size();
    out.sample_size = static_cast<int>(n);
    out.success_correlation = success_correlation(ref_success, ref_fail, other_success, other_fail);

    const double total_w = stats::sorted_sum(std::move(all_weights));
    const double topic_w = stats::sorted_sum(std::move(topic_weights));
    out.time_weighted_relevance = total_w > 0.0 ? std::min(100.0, 100.0 * topic_w / total_w) : 0.0;

    if (n == 0) {
        out.difficulty_score = 0.0;
        out.confidence_score = 0.0;
        out.priority_level = classify_priority(out.weighted_frequency, 0.0, m_cfg.priority);
        return out;
    }

    const double nd = static_cast<double>(n);
    const double keyword = stats::sorted_sum(std::move(keyword_scores)) / nd;
    const double rounds = stats::sorted_sum(std::move(round_scores)) / nd;
    const double depth = stats::sorted_sum(std::move(depth_scores)) / nd;

    out.difficulty_score = stats::clamp01(dcfg.keyword_weight * keyword + dcfg.rounds_weight * rounds +
                                          dcfg.depth_weight * depth +
                                          dcfg.outcome_weight * (1.0 - out.success_correlation));

    if (static_cast<int>(n) < std::max(ccfg.min_sample_size, kMinConfidenceSamples)) {
        out.confidence_score = 0.0;
    } else {
        const stats::Summary s = stats::summarize(std::move(samples));
        const double se = std::sqrt(s.variance / nd);
        const double t = stats::t_critical(ccfg.alpha, n - 1);
        out.confidence_score = stats::clamp01(1.0 - t * se);
    }

    out.priority_level = classify_priority(out.weighted_frequency, out.confidence_score, m_cfg.priority);
    return out;
}

}  // namespace insights
