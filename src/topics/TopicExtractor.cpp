#include "topics/TopicExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <utility>

#include "stats/StatsUtil.hpp"
#include "text/TextUtil.hpp"

namespace insights {

namespace {

// Per-term accumulator. Integer histogram of per-document counts plus the documents seen.
// Merging is plain addition / union, so batches can be combined in any order.
struct TermStats {
    std::map<int, int> tf_histogram;   // tf -> number of documents with that tf
    std::set<std::size_t> docs;

    void merge(const TermStats& o) {
        for (const auto& kv : o.tf_histogram) tf_histogram[kv.first] += kv.second;
        docs.insert(o.docs.begin(), o.docs.end());
    }
};

using TermTable = std::map<std::string, TermStats>;

struct Cluster {
    std::set<std::string> members;
    Category category = Category::Other;
    double multiplier = 1.0;
    std::string concept_id;            // empty for non-taxonomy clusters
};

bool has_letter(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
}

bool qualifies_as_word(const std::string& term) {
    return term.size() >= 3 && has_letter(term);
}

// sum over documents of (1 + ln tf) * idf
double tfidf_mass(const TermStats& st, double idf) {
    double s = 0.0;
    for (const auto& kv : st.tf_histogram) {
        s += static_cast<double>(kv.second) * (1.0 + std::log(static_cast<double>(kv.first))) * idf;
    }
    return s;
}

std::set<std::size_t> cluster_docs(const Cluster& c, const TermTable& terms) {
    std::set<std::size_t> out;
    for (const auto& m : c.members) {
        const auto& d = terms.at(m).docs;
        out.insert(d.begin(), d.end());
    }
    return out;
}

double jaccard(const std::set<std::size_t>& a, const std::set<std::size_t>& b) {
    std::size_t inter = 0;
    auto i = a.begin();
    auto j = b.begin();
    while (i != a.end() && j != b.end()) {
        if (*i == *j) { ++inter; ++i; ++j; }
        else if (*i < *j) ++i;
        else ++j;
    }
    const std::size_t uni = a.size() + b.size() - inter;
    return uni == 0 ? 0.0 : static_cast<double>(inter) / static_cast<double>(uni);
}

std::size_t find_root(std::vector<std::size_t>& parent, std::size_t x) {
    while (parent[x] != x) {
        parent[x] = parent[parent[x]];
        x = parent[x];
    }
    return x;
}

}  // namespace

std::vector<std::string> document_terms(const NormalizedDocument& doc,
                                        const Taxonomy& taxonomy,
                                        std::size_t max_token_length) {
    std::vector<std::string> clean;
    clean.reserve(doc.tokens.size());
    for (const auto& t : doc.tokens) {
        if (textutil::is_well_formed_token(t, max_token_length)) clean.push_back(t);
    }
    return taxonomy.resolve_phrases(clean);
}

int topic_term_frequency(const Topic& topic, const std::vector<std::string>& terms) {
    int tf = 0;
    for (const auto& t : terms) {
        if (topic.member_terms.count(t)) ++tf;
    }
    return tf;
}

bool references_topic(const Topic& topic, const std::vector<std::string>& terms) {
    for (const auto& t : terms) {
        if (topic.member_terms.count(t)) return true;
    }
    return false;
}

TopicExtractor::TopicExtractor(std::shared_ptr<const Taxonomy> taxonomy, EngineConfig cfg)
    : m_taxonomy(std::move(taxonomy)), m_cfg(std::move(cfg)) {}

std::vector<Topic> TopicExtractor::extract(const std::vector<NormalizedDocument>& docs) const {
    std::vector<Topic> out;
    if (docs.empty()) return out;

    const auto& ecfg = m_cfg.extractor;
    const Taxonomy& tax = *m_taxonomy;
    const double N = static_cast<double>(docs.size());

    // Pass 1: per-batch term histograms, merged into the corpus table
    TermTable terms;
    const std::size_t batch = std::max<std::size_t>(1, ecfg.batch_size);
    for (std::size_t start = 0; start < docs.size(); start += batch) {
        const std::size_t end = std::min(docs.size(), start + batch);
        TermTable local;

        for (std::size_t d = start; d < end; ++d) {
            std::map<std::string, int> tf;
            for (const auto& t : document_terms(docs[d], tax, ecfg.max_token_length)) tf[t] += 1;

            for (const auto& kv : tf) {
                auto& st = local[kv.first];
                st.tf_histogram[kv.second] += 1;
                st.docs.insert(d);
            }
        }
        for (const auto& kv : local) terms[kv.first].merge(kv.second);
    }

    // Pass 2: assign terms to clusters
    std::map<std::size_t, Cluster> concept_clusters;     // by taxonomy concept index
    std::map<std::string, Cluster> other_clusters;       // by light stem
    std::map<std::string, double> term_mass;             // tfidf mass per term

    for (const auto& kv : terms) {
        const std::string& term = kv.first;
        const TermStats& st = kv.second;
        const double idf = std::log(N / static_cast<double>(st.docs.size()));
        const double mass = tfidf_mass(st, idf);

        const TermInfo* info = tax.lookup(term);
        if (!info && qualifies_as_word(term)) info = tax.lookup_stem(textutil::light_stem(term));

        if (info) {
            auto& c = concept_clusters[info->concept_index];
            if (c.members.empty()) {
                const auto& ce = tax.concept_at(info->concept_index);
                c.category = ce.category;
                c.multiplier = tax.weight(ce.category);
                c.concept_id = ce.id;
            }
            c.members.insert(term);
            term_mass[term] = mass;
            continue;
        }

        if (!ecfg.include_other_terms) continue;
        if (!qualifies_as_word(term)) continue;
        if (static_cast<int>(st.docs.size()) < ecfg.min_other_document_frequency) continue;
        if (!(mass > 0.0)) continue;

        auto& c = other_clusters[textutil::light_stem(term)];
        c.category = Category::Other;
        c.multiplier = tax.weight(Category::Other);
        c.members.insert(term);
        term_mass[term] = mass;
    }

    // Pass 3: merge strongly co-occurring non-taxonomy clusters (connected components)
    std::vector<Cluster> others;
    others.reserve(other_clusters.size());
    for (auto& kv : other_clusters) others.push_back(std::move(kv.second));

    std::vector<std::set<std::size_t>> other_docs;
    other_docs.reserve(others.size());
    for (const auto& c : others) other_docs.push_back(cluster_docs(c, terms));

    std::vector<std::size_t> parent(others.size());
    std::iota(parent.begin(), parent.end(), 0);

    std::vector<std::size_t> eligible;
    for (std::size_t i = 0; i < others.size(); ++i) {
        if (static_cast<int>(other_docs[i].size()) >= ecfg.min_cooccurrence_docs) eligible.push_back(i);
    }
    std::sort(eligible.begin(), eligible.end(), [&](std::size_t a, std::size_t b) {
        if (other_docs[a].size() != other_docs[b].size()) return other_docs[a].size() < other_docs[b].size();
        return a < b;
    });

    for (std::size_t x = 0; x < eligible.size(); ++x) {
        const auto& a = other_docs[eligible[x]];
        for (std::size_t y = x + 1; y < eligible.size(); ++y) {
            const auto& b = other_docs[eligible[y]];
            // |a|/|b| bounds the jaccard from above; sizes only grow from here
            if (static_cast<double>(a.size()) < ecfg.cooccurrence_jaccard * static_cast<double>(b.size())) break;
            if (jaccard(a, b) >= ecfg.cooccurrence_jaccard) {
                const std::size_t ra = find_root(parent, eligible[x]);
                const std::size_t rb = find_root(parent, eligible[y]);
                if (ra != rb) parent[std::max(ra, rb)] = std::min(ra, rb);
            }
        }
    }

    std::map<std::size_t, Cluster> merged_others;
    for (std::size_t i = 0; i < others.size(); ++i) {
        auto& dst = merged_others[find_root(parent, i)];
        dst.category = others[i].category;
        dst.multiplier = others[i].multiplier;
        dst.members.insert(others[i].members.begin(), others[i].members.end());
    }

    // Pass 4: clusters -> topics
    auto make_topic = [&](const Cluster& c) {
        Topic t;
        t.member_terms = c.members;
        t.category = c.category;

        double mass = 0.0;
        double best_score = -1.0;
        std::size_t best_df = 0;
        for (const auto& m : c.members) {
            const double score = c.multiplier * term_mass.at(m);
            const std::size_t df = terms.at(m).docs.size();
            mass += term_mass.at(m);
            // members are visited alphabetically, so strict comparison keeps the first name on ties
            if (score > best_score || (score == best_score && df > best_df)) {
                best_score = score;
                best_df = df;
                t.representative_term = m;
            }
        }
        t.composite_score = c.multiplier * mass;

        const std::size_t df = cluster_docs(c, terms).size();
        t.document_frequency = static_cast<int>(df);
        t.sample_size = t.document_frequency;

        const double coverage = 100.0 * static_cast<double>(df) / N;
        const double wf = coverage * (c.multiplier / tax.max_weight());
        t.weighted_frequency = stats::round2(std::min(std::max(wf, 0.0), 100.0));

        t.id = c.concept_id.empty() ? "other." + t.representative_term : c.concept_id;
        t.priority_level = classify_priority(t.weighted_frequency, t.confidence_score, m_cfg.priority);
        return t;
    };

    for (const auto& kv : concept_clusters) out.push_back(make_topic(kv.second));

    std::vector<Topic> other_topics;
    for (const auto& kv : merged_others) other_topics.push_back(make_topic(kv.second));

    auto by_composite = [](const Topic& a, const Topic& b) {
        if (a.composite_score != b.composite_score) return a.composite_score > b.composite_score;
        return a.id < b.id;
    };

    std::sort(other_topics.begin(), other_topics.end(), by_composite);
    if (other_topics.size() > ecfg.max_other_topics) other_topics.resize(ecfg.max_other_topics);
    for (auto& t : other_topics) out.push_back(std::move(t));

    std::sort(out.begin(), out.end(), by_composite);
    return out;
}

}  // namespace insights
