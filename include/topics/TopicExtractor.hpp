#pragma once
#include <memory>
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Models.hpp"
#include "topics/Taxonomy.hpp"

namespace insights {

// Well-formed tokens of a document with taxonomy phrases resolved (greedy longest match).
std::vector<std::string> document_terms(const NormalizedDocument& doc,
                                        const Taxonomy& taxonomy,
                                        std::size_t max_token_length);

// Occurrences of any member term among resolved terms.
int topic_term_frequency(const Topic& topic, const std::vector<std::string>& terms);
bool references_topic(const Topic& topic, const std::vector<std::string>& terms);

class TopicExtractor {
public:
    TopicExtractor(std::shared_ptr<const Taxonomy> taxonomy, EngineConfig cfg);

    // Deterministic and independent of document order.
    // Sorted by composite score desc, then id asc. Empty input -> empty output.
    std::vector<Topic> extract(const std::vector<NormalizedDocument>& docs) const;

    const Taxonomy& taxonomy() const { return *m_taxonomy; }

private:
    std::shared_ptr<const Taxonomy> m_taxonomy;
    EngineConfig m_cfg;
};

}  // namespace insights
