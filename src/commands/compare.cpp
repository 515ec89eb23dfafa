#include "commands/compare.hpp"
#include "commands/CliUtil.hpp"

#include "insights/CompanyAnalysis.hpp"
#include "insights/CompanyComparison.hpp"
#include "insights/InsightsArtifact.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cli::Printer;

static std::vector<std::string> split_companies(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!insights::company_key(item).empty()) out.push_back(item);
    }
    return out;
}

int cmd_compare(int argc, char** argv) {
    std::string records_path = cli::get_arg(argc, argv, "--records", "data/sample_records.json");
    std::string companies_s  = cli::get_arg(argc, argv, "--companies", "");
    std::string outdir_s     = cli::get_arg(argc, argv, "--outdir", "out");
    std::string out_path     = cli::get_arg(argc, argv, "--out", "");
    std::string topn_s       = cli::get_arg(argc, argv, "--topn", "10");

    size_t topn = 0;
    try { topn = (size_t)std::stoul(topn_s); }
    catch (const std::exception&) {
        std::cerr << "error: invalid --topn\n";
        return 1;
    }

    cli::EngineInputs inputs;
    if (!cli::load_engine_inputs(argc, argv, inputs)) return 1;

    std::vector<insights::ExperienceRecord> records;
    try {
        records = insights::load_records(records_path);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to load records: " << e.what() << "\n";
        return 1;
    }

    std::vector<std::string> companies =
        companies_s.empty() ? insights::list_companies(records) : split_companies(companies_s);
    if (companies.size() < 2) {
        std::cerr << "error: compare needs at least two companies\n";
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

    std::vector<insights::CompanyInsights> results;
    try {
        results = insights::analyze_companies(records, companies, inputs.taxonomy, inputs.cfg);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    insights::ComparisonArtifact art;
    art.records_path = records_path;
    art.comparison = insights::compare_companies(results);
    const auto& cmp = art.comparison;

    pr << "COMPANIES:";
    for (const auto& ci : results) pr << " " << ci.company << "(" << ci.metadata.documents_analyzed << ")";
    pr << "\n";

    pr << "\nSHARED TOPICS: " << cmp.shared_topics.size() << "\n";
    for (size_t i = 0; i < cmp.shared_topics.size() && i < topn; ++i) {
        const auto& st = cmp.shared_topics[i];
        pr << std::setw(2) << (i + 1) << ". " << st.representative_term << "  [" << st.topic_id << "]"
           << "  avg_wf=" << std::fixed << std::setprecision(2) << st.average_weighted_frequency << "\n";
        for (const auto& c : st.companies) {
            pr << "      " << c.company << ": wf=" << c.weighted_frequency
               << " " << insights::priority_name(c.priority_level) << "\n";
        }
    }

    pr << "\nUNIQUE TOPICS\n";
    for (const auto& u : cmp.unique_topics) {
        pr << "  " << u.company << ":";
        for (size_t i = 0; i < u.topic_ids.size() && i < topn; ++i) pr << " " << u.topic_ids[i];
        if (u.topic_ids.empty()) pr << " (none)";
        pr << "\n";
    }

    const fs::path p = fs::path(outdir_s) / "comparison.json";
    try {
        art.write_to(p);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    pr << "WROTE: " << p.string() << "\n";
    return 0;
}
