#include "insights/InterviewProcess.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <utility>

#include "text/TextUtil.hpp"

namespace insights {

namespace {

constexpr double kDetectedConfidence = 0.5;
constexpr double kCommonPercent = 30.0;

struct RoundKeywords {
    RoundType type;
    std::vector<std::vector<std::string>> phrases;   // light-stemmed tokens
};

std::vector<std::string> stem_phrase(const std::string& phrase) {
    std::vector<std::string> out;
    std::istringstream is(phrase);
    std::string w;
    while (is >> w) out.push_back(textutil::light_stem(w));
    return out;
}

const std::vector<RoundKeywords>& round_keywords() {
    static const std::vector<RoundKeywords> table = [] {
        const std::vector<std::pair<RoundType, std::vector<const char*>>> raw = {
            {RoundType::Coding, {"coding", "algorithm", "data structure", "leetcode", "hackerrank"}},
            {RoundType::SystemDesign, {"system design", "architecture", "scalability", "design"}},
            {RoundType::Behavioral, {"behavioral", "culture fit", "leadership", "teamwork", "conflict"}},
            // "experience" is a stopword, so past work is caught through projects and resume
            {RoundType::TechnicalDiscussion, {"technical discussion", "past project", "resume", "deep dive"}},
        };
        std::vector<RoundKeywords> t;
        for (const auto& [type, phrases] : raw) {
            RoundKeywords rk{type, {}};
            for (const char* p : phrases) rk.phrases.push_back(stem_phrase(p));
            t.push_back(std::move(rk));
        }
        return t;
    }();
    return table;
}

int count_phrase(const std::vector<std::string>& stems, const std::vector<std::string>& phrase) {
    if (phrase.empty() || stems.size() < phrase.size()) return 0;
    int hits = 0;
    for (size_t i = 0; i + phrase.size() <= stems.size(); ++i) {
        if (std::equal(phrase.begin(), phrase.end(), stems.begin() + static_cast<std::ptrdiff_t>(i))) ++hits;
    }
    return hits;
}

double round1(double v) {
    return std::round(v * 10.0) / 10.0;
}

}  // namespace

const char* round_type_name(RoundType r) {
    switch (r) {
        case RoundType::Coding: return "coding";
        case RoundType::SystemDesign: return "system_design";
        case RoundType::Behavioral: return "behavioral";
        case RoundType::TechnicalDiscussion: return "technical_discussion";
    }
    return "coding";
}

std::string round_type_display(RoundType r) {
    switch (r) {
        case RoundType::Coding: return "Coding";
        case RoundType::SystemDesign: return "System Design";
        case RoundType::Behavioral: return "Behavioral";
        case RoundType::TechnicalDiscussion: return "Technical Discussion";
    }
    return "Coding";
}

std::vector<RoundClassification> classify_rounds(const std::vector<std::string>& tokens) {
    std::vector<std::string> stems;
    stems.reserve(tokens.size());
    for (const auto& t : tokens) stems.push_back(textutil::light_stem(t));

    std::vector<RoundClassification> out;
    for (const auto& rk : round_keywords()) {
        int score = 0;
        for (const auto& phrase : rk.phrases) score += count_phrase(stems, phrase);
        if (score == 0) continue;

        RoundClassification c;
        c.type = rk.type;
        c.score = score;
        c.confidence = std::min(static_cast<double>(score) / 3.0, 1.0);
        out.push_back(c);
    }
    return out;
}

InterviewProcess summarize_interview_process(const std::vector<NormalizedDocument>& docs) {
    InterviewProcess p;
    int counts[4] = {0, 0, 0, 0};

    for (const auto& d : docs) {
        DocumentRounds dr;
        dr.record_id = d.record_id;
        dr.rounds = classify_rounds(d.tokens);
        for (const auto& c : dr.rounds) {
            if (c.confidence > kDetectedConfidence) counts[static_cast<int>(c.type)] += 1;
        }
        p.documents.push_back(std::move(dr));
    }

    const double n = static_cast<double>(docs.size());
    for (int i = 0; i < 4; ++i) {
        if (counts[i] == 0) continue;
        RoundFrequency f;
        f.type = static_cast<RoundType>(i);
        f.count = counts[i];
        const double pct = 100.0 * counts[i] / n;
        f.percent = round1(pct);
        p.distribution.push_back(f);
        if (pct > kCommonPercent) p.common_rounds.push_back(f);
    }

    std::stable_sort(p.common_rounds.begin(), p.common_rounds.end(),
                     [](const RoundFrequency& a, const RoundFrequency& b) { return a.count > b.count; });

    if (p.common_rounds.empty()) {
        p.insight = "Varied interview processes.";
    } else {
        p.insight = "Most interviews include " + std::to_string(p.common_rounds.size()) + " common round types.";
    }
    return p;
}

}  // namespace insights
