#include "insights/CompanyComparison.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "stats/StatsUtil.hpp"

namespace insights {

CompanyComparison compare_companies(const std::vector<CompanyInsights>& results) {
    CompanyComparison cmp;
    if (results.size() < 2) return cmp;

    std::map<std::string, SharedTopic> by_id;
    for (const auto& r : results) {
        cmp.companies.push_back(r.company);
        for (const auto& t : r.topics) {
            auto& st = by_id[t.id];
            if (st.companies.empty()) {
                st.topic_id = t.id;
                st.representative_term = t.representative_term;
                st.category = t.category;
            }
            st.companies.push_back({r.company, t.weighted_frequency, t.priority_level});
        }
    }

    for (auto& kv : by_id) {
        SharedTopic& st = kv.second;
        if (st.companies.size() < 2) continue;

        std::vector<double> wfs;
        for (const auto& c : st.companies) wfs.push_back(c.weighted_frequency);
        st.average_weighted_frequency = stats::round2(stats::summarize(std::move(wfs)).mean);
        cmp.shared_topics.push_back(st);
    }

    std::sort(cmp.shared_topics.begin(), cmp.shared_topics.end(), [](const SharedTopic& a, const SharedTopic& b) {
        if (a.average_weighted_frequency != b.average_weighted_frequency) {
            return a.average_weighted_frequency > b.average_weighted_frequency;
        }
        return a.topic_id < b.topic_id;
    });

    for (const auto& r : results) {
        std::vector<const Topic*> own;
        for (const auto& t : r.topics) {
            if (by_id.at(t.id).companies.size() == 1) own.push_back(&t);
        }
        std::sort(own.begin(), own.end(), [](const Topic* a, const Topic* b) {
            if (a->weighted_frequency != b->weighted_frequency) return a->weighted_frequency > b->weighted_frequency;
            return a->id < b->id;
        });

        UniqueTopics u;
        u.company = r.company;
        for (const Topic* t : own) u.topic_ids.push_back(t->id);
        cmp.unique_topics.push_back(std::move(u));
    }

    return cmp;
}

}  // namespace insights
