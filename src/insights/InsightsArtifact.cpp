#include "insights/InsightsArtifact.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

#include "core/DateUtil.hpp"

namespace insights {

nlohmann::json topic_to_json(const Topic& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["representative_term"] = t.representative_term;
    j["member_terms"] = t.member_terms;
    j["category"] = category_name(t.category);
    j["weighted_frequency"] = t.weighted_frequency;
    j["priority_level"] = priority_name(t.priority_level);
    j["confidence_score"] = t.confidence_score;
    j["difficulty_score"] = t.difficulty_score;
    j["time_weighted_relevance"] = t.time_weighted_relevance;
    j["success_correlation"] = t.success_correlation;
    j["composite_score"] = t.composite_score;
    j["document_frequency"] = t.document_frequency;
    j["sample_size"] = t.sample_size;
    return j;
}

nlohmann::json trend_to_json(const TrendResult& t) {
    return {
        {"topic_id", t.topic_id},
        {"direction", direction_name(t.direction)},
        {"strength", t.strength},
        {"p_value", t.p_value},
        {"significant", t.significant},
        {"statistic", t.statistic},
        {"slope", t.slope},
        {"bucket_count", t.bucket_count},
    };
}

nlohmann::json recommendation_to_json(const Recommendation& r) {
    nlohmann::json j;
    j["topic"] = topic_to_json(r.topic);
    j["priority_score"] = r.priority_score;
    j["estimated_hours"] = r.estimated_hours;
    j["strategies"] = r.strategies;
    return j;
}

static nlohmann::json metadata_to_json(const RunMetadata& m) {
    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& s : m.skipped) {
        skipped.push_back({{"record_id", s.record_id}, {"reason", s.reason}});
    }

    nlohmann::json j;
    j["company"] = m.company;
    j["records_received"] = m.records_received;
    j["documents_analyzed"] = m.documents_analyzed;
    j["malformed_skipped"] = m.malformed_skipped;
    j["skipped"] = skipped;
    j["empty_documents"] = m.empty_documents;
    j["batches"] = m.batches;
    if (m.reference_date) j["reference_date"] = dateutil::format_date(*m.reference_date);
    else j["reference_date"] = nullptr;
    return j;
}

static nlohmann::json quality_to_json(const DataQuality& q) {
    return {
        {"quality_score", q.quality_score},
        {"sample_adequacy", adequacy_name(q.adequacy)},
        {"avg_tokens_per_document", q.avg_tokens_per_document},
        {"avg_topics_per_document", q.avg_topics_per_document},
        {"mean_confidence", q.mean_confidence},
        {"issues", q.issues},
    };
}

static nlohmann::json strategy_to_json(const PreparationStrategy& s) {
    nlohmann::json j;
    j["difficulty_focus"] = difficulty_level_name(s.focus);
    j["classified_documents"] = s.classified_documents;
    j["timeline_weeks"] = {{"min", s.timeline_weeks_min}, {"max", s.timeline_weeks_max}};
    if (s.has_practice_mix) {
        j["practice_mix"] = {{"easy", s.easy_percent}, {"medium", s.medium_percent}, {"hard", s.hard_percent}};
    } else {
        j["practice_mix"] = nullptr;
    }
    j["key_recommendations"] = s.key_recommendations;
    return j;
}

static nlohmann::json round_frequencies_to_json(const std::vector<RoundFrequency>& rounds) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : rounds) {
        arr.push_back({
            {"round_type", round_type_name(f.type)},
            {"display_name", round_type_display(f.type)},
            {"count", f.count},
            {"frequency_percent", f.percent},
        });
    }
    return arr;
}

nlohmann::json process_to_json(const InterviewProcess& p) {
    nlohmann::json docs = nlohmann::json::array();
    for (const auto& d : p.documents) {
        nlohmann::json rounds = nlohmann::json::object();
        for (const auto& c : d.rounds) {
            rounds[round_type_name(c.type)] = {{"score", c.score}, {"confidence", c.confidence}};
        }
        docs.push_back({{"record_id", d.record_id}, {"rounds", rounds}});
    }

    nlohmann::json j;
    j["common_rounds"] = round_frequencies_to_json(p.common_rounds);
    j["round_distribution"] = round_frequencies_to_json(p.distribution);
    j["total_round_types"] = p.distribution.size();
    j["process_insight"] = p.insight;
    j["documents"] = docs;
    return j;
}

nlohmann::json InsightsArtifact::to_json() const {
    nlohmann::json j;
    j["company"] = insights.company;
    j["records_path"] = records_path;
    j["taxonomy"] = taxonomy_source;
    j["as_of"] = as_of.empty() ? nlohmann::json(nullptr) : nlohmann::json(as_of);
    j["metadata"] = metadata_to_json(insights.metadata);
    j["data_quality"] = quality_to_json(insights.quality);
    j["preparation_strategy"] = strategy_to_json(insights.strategy);
    j["interview_process"] = process_to_json(insights.process);

    nlohmann::json topics = nlohmann::json::array();
    for (const auto& t : insights.topics) topics.push_back(topic_to_json(t));
    j["topics"] = topics;

    nlohmann::json trends = nlohmann::json::array();
    for (const auto& t : insights.trends) trends.push_back(trend_to_json(t));
    j["trends"] = trends;

    nlohmann::json recs = nlohmann::json::array();
    const size_t limit = topk > 0 ? static_cast<size_t>(topk) : insights.recommendations.size();
    for (size_t i = 0; i < insights.recommendations.size() && i < limit; ++i) {
        recs.push_back(recommendation_to_json(insights.recommendations[i]));
    }
    j["recommendations"] = recs;

    return j;
}

static void write_json(const nlohmann::json& j, const std::filesystem::path& out_path) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

void InsightsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(to_json(), out_path);
}

nlohmann::json ComparisonArtifact::to_json() const {
    nlohmann::json shared = nlohmann::json::array();
    for (const auto& st : comparison.shared_topics) {
        nlohmann::json per = nlohmann::json::array();
        for (const auto& c : st.companies) {
            per.push_back({
                {"company", c.company},
                {"weighted_frequency", c.weighted_frequency},
                {"priority_level", priority_name(c.priority_level)},
            });
        }
        shared.push_back({
            {"topic_id", st.topic_id},
            {"representative_term", st.representative_term},
            {"category", category_name(st.category)},
            {"average_weighted_frequency", st.average_weighted_frequency},
            {"companies", per},
        });
    }

    nlohmann::json unique = nlohmann::json::object();
    for (const auto& u : comparison.unique_topics) unique[u.company] = u.topic_ids;

    nlohmann::json j;
    j["records_path"] = records_path;
    j["companies"] = comparison.companies;
    j["shared_topics"] = shared;
    j["unique_topics"] = unique;
    return j;
}

void ComparisonArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(to_json(), out_path);
}

std::filesystem::path insights_output_path(const std::filesystem::path& outdir, const std::string& company) {
    std::string safe;
    for (unsigned char c : company) {
        if (std::isalnum(c) || c == '-' || c == '_') safe.push_back(static_cast<char>(std::tolower(c)));
        else if (!safe.empty() && safe.back() != '_') safe.push_back('_');
    }
    while (!safe.empty() && safe.back() == '_') safe.pop_back();
    if (safe.empty()) safe = "company";
    return outdir / (safe + "_insights.json");
}

}  // namespace insights
