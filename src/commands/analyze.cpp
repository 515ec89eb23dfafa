#include "commands/analyze.hpp"
#include "commands/CliUtil.hpp"

#include "core/DateUtil.hpp"
#include "insights/CompanyAnalysis.hpp"
#include "insights/InsightsArtifact.hpp"
#include "io/JsonIO.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cli::Printer;

static const insights::TrendResult* find_trend(const insights::CompanyInsights& ci, const std::string& topic_id) {
    for (const auto& t : ci.trends) {
        if (t.topic_id == topic_id) return &t;
    }
    return nullptr;
}

static void print_report(Printer& pr, const insights::CompanyInsights& ci, size_t topk) {
    const auto& m = ci.metadata;

    pr << "\nCOMPANY: " << ci.company << "\n";
    pr << "RECORDS: " << m.records_received << "  DOCUMENTS: " << m.documents_analyzed
       << "  SKIPPED: " << m.malformed_skipped << "  BATCHES: " << m.batches << "\n";
    if (m.reference_date) pr << "REFERENCE_DATE: " << dateutil::format_date(*m.reference_date) << "\n";
    pr << "QUALITY: " << std::fixed << std::setprecision(2) << ci.quality.quality_score
       << " (" << insights::adequacy_name(ci.quality.adequacy) << ")\n";
    pr << "TOPICS: " << ci.topics.size() << "\n";

    pr << "\nRECOMMENDATIONS (top " << std::min(topk, ci.recommendations.size()) << ")\n";
    for (size_t i = 0; i < ci.recommendations.size() && i < topk; ++i) {
        const auto& r = ci.recommendations[i];
        const auto& t = r.topic;
        const insights::TrendResult* tr = find_trend(ci, t.id);

        pr << std::setw(2) << (i + 1) << ". " << t.representative_term
           << "  [" << insights::category_name(t.category) << "]"
           << "  prio=" << std::setprecision(3) << r.priority_score
           << " " << insights::priority_name(t.priority_level)
           << "  wf=" << std::setprecision(2) << t.weighted_frequency
           << "  conf=" << t.confidence_score
           << "  diff=" << t.difficulty_score
           << "  hours=" << std::setprecision(1) << r.estimated_hours;
        if (tr) {
            pr << "  trend=" << insights::direction_name(tr->direction);
            if (tr->significant) pr << "*";
        }
        pr << "\n";
        if (!r.strategies.empty()) pr << "      " << r.strategies.front() << "\n";
    }

    const auto& s = ci.strategy;
    pr << "\nPREPARATION: focus=" << insights::difficulty_level_name(s.focus)
       << "  timeline=" << s.timeline_weeks_min << "-" << s.timeline_weeks_max << " weeks";
    if (s.has_practice_mix) {
        pr << "  mix(easy/medium/hard)=" << s.easy_percent << "/" << s.medium_percent << "/" << s.hard_percent;
    }
    pr << "\n";
    for (const auto& k : s.key_recommendations) pr << "  - " << k << "\n";

    const auto& proc = ci.process;
    pr << "\nINTERVIEW PROCESS: " << proc.insight << "\n";
    for (const auto& f : proc.common_rounds) {
        pr << "  - " << insights::round_type_display(f.type) << ": " << std::setprecision(1) << f.percent
           << "% (" << f.count << " reports)\n";
    }
}

int cmd_analyze(int argc, char** argv) {
    std::string records_path = cli::get_arg(argc, argv, "--records", "data/sample_records.json");
    std::string company      = cli::get_arg(argc, argv, "--company", "");
    std::string topk_s       = cli::get_arg(argc, argv, "--topk", "10");
    std::string outdir_s     = cli::get_arg(argc, argv, "--outdir", "out");
    std::string out_path     = cli::get_arg(argc, argv, "--out", "");
    bool no_write            = cli::has_flag(argc, argv, "--no_write");

    size_t topk = 0;
    try { topk = (size_t)std::stoul(topk_s); }
    catch (const std::exception&) {
        std::cerr << "error: invalid --topk\n";
        return 1;
    }
    if (topk == 0) topk = 1;

    cli::EngineInputs inputs;
    if (!cli::load_engine_inputs(argc, argv, inputs)) return 1;

    std::vector<insights::ExperienceRecord> records;
    try {
        records = insights::load_records(records_path);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to load records: " << e.what() << "\n";
        return 1;
    }

    std::vector<std::string> companies;
    if (!company.empty()) companies.push_back(company);
    else companies = insights::list_companies(records);

    if (companies.empty()) {
        std::cerr << "error: no companies found in " << records_path << "\n";
        return 1;
    }

    std::ofstream out;
    bool write_out = false;
    if (!out_path.empty()) {
        write_out = cli::open_out(out, out_path);
        if (!write_out) {
            std::cerr << "error: failed to open --out path: " << out_path << "\n";
            return 1;
        }
    }

    Printer pr;
    pr.a = &std::cout;
    pr.b = write_out ? (std::ostream*)&out : nullptr;

    pr << "RECORDS_FILE: " << records_path << "\n";
    pr << "RECORDS: " << records.size() << "\n";
    pr << "TAXONOMY: " << inputs.taxonomy_source << " (" << inputs.taxonomy->concepts().size() << " concepts)\n";
    pr << "COMPANIES: " << companies.size() << "\n";

    std::vector<insights::CompanyInsights> results;
    try {
        results = insights::analyze_companies(records, companies, inputs.taxonomy, inputs.cfg);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    for (const auto& ci : results) {
        for (const auto& s : ci.metadata.skipped) {
            std::cerr << "[warn] " << ci.company << ": skipped record " << s.record_id << ": " << s.reason << "\n";
        }
        for (const auto& issue : ci.quality.issues) {
            std::cerr << "[warn] " << ci.company << ": " << issue << "\n";
        }

        print_report(pr, ci, topk);

        if (no_write) continue;

        insights::InsightsArtifact art;
        art.records_path = records_path;
        art.taxonomy_source = inputs.taxonomy_source;
        art.as_of = inputs.as_of;
        art.topk = (int)topk;
        art.insights = ci;

        const fs::path p = insights::insights_output_path(fs::path(outdir_s), ci.company);
        try {
            art.write_to(p);
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 1;
        }
        pr << "WROTE: " << p.string() << "\n";
    }

    return 0;
}
