#include "insights/CompanyAnalysis.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <iomanip>
#include <set>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include "core/Errors.hpp"
#include "insights/InsightsGenerator.hpp"
#include "stats/StatisticalScorer.hpp"
#include "stats/StatsUtil.hpp"
#include "stats/TrendAnalyzer.hpp"
#include "text/TextUtil.hpp"
#include "topics/TopicExtractor.hpp"

namespace insights {

const char* adequacy_name(SampleAdequacy a) {
    switch (a) {
        case SampleAdequacy::Insufficient: return "insufficient";
        case SampleAdequacy::Minimal: return "minimal";
        case SampleAdequacy::Adequate: return "adequate";
        case SampleAdequacy::Good: return "good";
        case SampleAdequacy::Excellent: return "excellent";
    }
    return "insufficient";
}

const char* difficulty_level_name(DifficultyLevel d) {
    switch (d) {
        case DifficultyLevel::Easy: return "easy";
        case DifficultyLevel::Medium: return "medium";
        case DifficultyLevel::Hard: return "hard";
        case DifficultyLevel::Unknown: return "unknown";
    }
    return "unknown";
}

SampleAdequacy sample_adequacy(std::size_t documents) {
    if (documents >= 15) return SampleAdequacy::Excellent;
    if (documents >= 8) return SampleAdequacy::Good;
    if (documents >= 5) return SampleAdequacy::Adequate;
    if (documents >= 3) return SampleAdequacy::Minimal;
    return SampleAdequacy::Insufficient;
}

static std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string company_key(const std::string& company) {
    std::string k = trim(company);
    for (auto& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return k;
}

void validate_record(const ExperienceRecord& record) {
    const std::string id = record.id.empty() ? "(no id)" : record.id;
    if (trim(record.company).empty()) throw MalformedRecordError(id, "missing company");
    if (!record.date) throw MalformedRecordError(id, "missing or invalid date");
    if (trim(record.raw_text).empty()) throw MalformedRecordError(id, "empty text");
}

PreparedDocuments prepare_documents(const std::vector<ExperienceRecord>& records,
                                    const std::string& company,
                                    const EngineConfig& cfg) {
    PreparedDocuments out;
    out.metadata.company = trim(company);
    const std::string key = company_key(company);

    for (const auto& r : records) {
        const std::string rk = company_key(r.company);
        if (!rk.empty() && rk != key) continue;

        out.metadata.records_received += 1;
        try {
            validate_record(r);
        } catch (const MalformedRecordError& e) {
            out.metadata.malformed_skipped += 1;
            out.metadata.skipped.push_back({e.record_id(), e.reason()});
            continue;
        }

        NormalizedDocument doc = textutil::normalize_record(r);
        if (doc.tokens.empty()) out.metadata.empty_documents += 1;
        out.documents.push_back(std::move(doc));
    }

    const std::size_t n = out.documents.size();
    const std::size_t batch = std::max<std::size_t>(1, cfg.extractor.batch_size);
    out.metadata.documents_analyzed = static_cast<int>(n);
    out.metadata.batches = static_cast<int>((n + batch - 1) / batch);
    return out;
}

static std::string format2(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    return os.str();
}

DataQuality assess_data_quality(const std::vector<NormalizedDocument>& docs,
                                const std::vector<Topic>& topics,
                                const RunMetadata& meta,
                                const Taxonomy& taxonomy,
                                const EngineConfig& cfg) {
    DataQuality q;
    const std::size_t n = docs.size();
    q.adequacy = sample_adequacy(n);

    if (n > 0) {
        std::size_t tokens = 0;
        std::size_t topic_refs = 0;
        for (const auto& d : docs) {
            tokens += d.tokens.size();
            const auto terms = document_terms(d, taxonomy, cfg.extractor.max_token_length);
            for (const auto& t : topics) {
                if (references_topic(t, terms)) ++topic_refs;
            }
        }
        q.avg_tokens_per_document = static_cast<double>(tokens) / static_cast<double>(n);
        q.avg_topics_per_document = static_cast<double>(topic_refs) / static_cast<double>(n);
    }

    if (!topics.empty()) {
        std::vector<double> conf;
        conf.reserve(topics.size());
        for (const auto& t : topics) conf.push_back(t.confidence_score);
        q.mean_confidence = stats::summarize(std::move(conf)).mean;
    }

    const double components[] = {
        std::min(q.avg_tokens_per_document / 80.0, 1.0),
        q.mean_confidence,
        std::min(q.avg_topics_per_document / 5.0, 1.0),
        std::min(static_cast<double>(n) / 15.0, 1.0),
    };
    double sum = 0.0;
    for (double c : components) sum += c;
    q.quality_score = stats::round2(stats::clamp01(sum / 4.0));

    if (n == 0) {
        q.issues.push_back("No usable reports for " + meta.company + ".");
    } else {
        if (n < 5) {
            q.issues.push_back("Only " + std::to_string(n) + " reports analyzed; treat the results as indicative.");
        }
        if (q.avg_tokens_per_document < 30.0) {
            q.issues.push_back("Reports are short (avg " + format2(q.avg_tokens_per_document) +
                               " tokens); topic detection is less reliable.");
        }
        if (q.mean_confidence < 0.5) {
            q.issues.push_back("Low average topic confidence (" + format2(q.mean_confidence) + ").");
        }
        if (q.avg_topics_per_document < 2.0) {
            q.issues.push_back("Few topics per report (avg " + format2(q.avg_topics_per_document) + ").");
        }
    }
    if (meta.malformed_skipped > 0) {
        q.issues.push_back(std::to_string(meta.malformed_skipped) + " malformed records skipped.");
    }
    return q;
}

// Level with the most votes; ties go to the earlier of easy, medium, hard.
static DifficultyLevel dominant(int easy, int medium, int hard) {
    if (easy + medium + hard == 0) return DifficultyLevel::Unknown;
    if (easy >= medium && easy >= hard) return DifficultyLevel::Easy;
    if (medium >= hard) return DifficultyLevel::Medium;
    return DifficultyLevel::Hard;
}

PreparationStrategy preparation_strategy(const std::vector<NormalizedDocument>& docs,
                                         const std::vector<Recommendation>& recommendations) {
    int votes[3] = {0, 0, 0};
    int classified = 0;
    for (const auto& d : docs) {
        const DifficultyIndicators ind = count_difficulty_indicators(d.tokens);
        switch (dominant(ind.easy, ind.medium, ind.hard)) {
            case DifficultyLevel::Easy: ++votes[0]; ++classified; break;
            case DifficultyLevel::Medium: ++votes[1]; ++classified; break;
            case DifficultyLevel::Hard: ++votes[2]; ++classified; break;
            case DifficultyLevel::Unknown: break;
        }
    }

    PreparationStrategy s;
    s.classified_documents = classified;
    s.focus = dominant(votes[0], votes[1], votes[2]);

    switch (s.focus) {
        case DifficultyLevel::Hard:
            s.timeline_weeks_min = 6;
            s.timeline_weeks_max = 8;
            s.has_practice_mix = true;
            s.easy_percent = 15;
            s.medium_percent = 35;
            s.hard_percent = 50;
            s.key_recommendations = {
                "Focus on advanced algorithms and system design.",
                "Practice complex problem-solving patterns.",
                "Prepare for several rounds of technical interviews."
            };
            break;
        case DifficultyLevel::Medium:
            s.timeline_weeks_min = 4;
            s.timeline_weeks_max = 6;
            s.has_practice_mix = true;
            s.easy_percent = 15;
            s.medium_percent = 60;
            s.hard_percent = 25;
            s.key_recommendations = {
                "Balance breadth and depth in technical preparation.",
                "Focus on common algorithm patterns.",
                "Practice coding under time pressure."
            };
            break;
        case DifficultyLevel::Easy:
            s.timeline_weeks_min = 3;
            s.timeline_weeks_max = 4;
            s.has_practice_mix = true;
            s.easy_percent = 40;
            s.medium_percent = 50;
            s.hard_percent = 10;
            s.key_recommendations = {
                "Focus on fundamentals and clean code.",
                "Practice explaining your thought process.",
                "Review basic data structures and algorithms."
            };
            break;
        case DifficultyLevel::Unknown:
            s.key_recommendations = {"Difficulty reports are mixed; prepare for a range of problem levels."};
            break;
    }

    if (!recommendations.empty()) {
        std::string top;
        const std::size_t k = std::min<std::size_t>(3, recommendations.size());
        for (std::size_t i = 0; i < k; ++i) {
            if (i > 0) top += ", ";
            top += recommendations[i].topic.representative_term;
        }
        s.key_recommendations.push_back("Start with: " + top + ".");
    }
    return s;
}

CompanyInsights analyze_company(const std::vector<ExperienceRecord>& records,
                                const std::string& company,
                                std::shared_ptr<const Taxonomy> taxonomy,
                                const EngineConfig& cfg) {
    if (!taxonomy) throw ConfigurationError("no taxonomy loaded");
    validate_config(cfg);

    PreparedDocuments prepared = prepare_documents(records, company, cfg);
    const auto& docs = prepared.documents;

    TopicExtractor extractor(taxonomy, cfg);
    StatisticalScorer scorer(taxonomy, cfg);

    CompanyInsights out;
    out.company = prepared.metadata.company;

    for (const auto& t : extractor.extract(docs)) out.topics.push_back(scorer.score(t, docs));

    for (const auto& t : out.topics) {
        const auto series = build_topic_series(t, docs, *taxonomy, cfg);
        out.trends.push_back(analyze_trend(t, series_values(series), cfg.trend));
    }

    out.recommendations = generate_recommendations(out.topics, out.trends, cfg);

    out.metadata = std::move(prepared.metadata);
    if (!docs.empty()) out.metadata.reference_date = scorer.reference_date(docs);

    out.quality = assess_data_quality(docs, out.topics, out.metadata, *taxonomy, cfg);
    out.strategy = preparation_strategy(docs, out.recommendations);
    out.process = summarize_interview_process(docs);
    return out;
}

std::vector<CompanyInsights> analyze_companies(const std::vector<ExperienceRecord>& records,
                                               const std::vector<std::string>& companies,
                                               std::shared_ptr<const Taxonomy> taxonomy,
                                               const EngineConfig& cfg) {
    if (!taxonomy) throw ConfigurationError("no taxonomy loaded");
    validate_config(cfg);

    std::vector<CompanyInsights> out(companies.size());
    std::atomic<std::size_t> next{0};

    // each worker pulls the next company index until none are left
    auto worker = [&]() {
        for (std::size_t i = next++; i < companies.size(); i = next++) {
            out[i] = analyze_company(records, companies[i], taxonomy, cfg);
        }
    };

    const std::size_t workers =
        std::min<std::size_t>(std::max(1u, std::thread::hardware_concurrency()), companies.size());

    // tasks is destroyed before out and next, so helpers finish even if worker() throws
    std::vector<std::future<void>> tasks;
    for (std::size_t k = 1; k < workers; ++k) {
        try {
            tasks.push_back(std::async(std::launch::async, worker));
        } catch (const std::system_error&) {
            // no more threads available; the calling thread drains the rest
            break;
        }
    }

    worker();
    for (auto& f : tasks) f.get();
    return out;
}

std::vector<std::string> list_companies(const std::vector<ExperienceRecord>& records) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& r : records) {
        const std::string k = company_key(r.company);
        if (k.empty() || !seen.insert(k).second) continue;
        out.push_back(trim(r.company));
    }
    return out;
}

}  // namespace insights
