#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "insights/CompanyAnalysis.hpp"
#include "insights/CompanyComparison.hpp"

namespace insights {

nlohmann::json topic_to_json(const Topic& t);
nlohmann::json trend_to_json(const TrendResult& t);
nlohmann::json recommendation_to_json(const Recommendation& r);
nlohmann::json process_to_json(const InterviewProcess& p);

struct InsightsArtifact {
    std::string records_path;
    std::string taxonomy_source;    // file path or "builtin"
    std::string as_of;              // empty when the latest document date was used
    int topk = 0;                   // recommendations kept; 0 = all

    CompanyInsights insights;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

struct ComparisonArtifact {
    std::string records_path;
    CompanyComparison comparison;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// "<outdir>/<company>_insights.json" with the company name made filesystem safe
std::filesystem::path insights_output_path(const std::filesystem::path& outdir, const std::string& company);

}  // namespace insights
