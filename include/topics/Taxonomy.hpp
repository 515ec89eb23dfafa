#pragma once
#include <array>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/Models.hpp"

namespace insights {

// One subject area, e.g. "algorithms.dynamic_programming".
struct ConceptEntry {
    std::string id;                   // "<category>.<concept>"
    std::string name;                 // "<concept>"
    Category category = Category::Other;
    std::string canonical;            // first usable term
    std::vector<std::string> terms;   // normalized, tokens joined by single spaces
};

struct TermInfo {
    std::size_t concept_index = 0;
    Category category = Category::Other;
    double multiplier = 1.0;
};

// Raw (unnormalized) description of one category, as read from configuration.
struct CategorySpec {
    Category category = Category::Other;
    double weight = 1.0;
    std::vector<std::pair<std::string, std::vector<std::string>>> concepts;
};

// Immutable term -> concept table. Built once and shared read-only between runs.
class Taxonomy {
public:
    // Throws ConfigurationError on an empty table, a bad weight, the reserved "other"
    // category, duplicate categories/concepts or a concept with no usable terms.
    static std::shared_ptr<const Taxonomy> build(const std::vector<CategorySpec>& specs);

    static std::shared_ptr<const Taxonomy> builtin();
    static std::vector<CategorySpec> builtin_specs();

    const TermInfo* lookup(const std::string& term) const;
    const TermInfo* lookup_stem(const std::string& stem) const;

    double weight(Category c) const { return m_weights[category_index(c)]; }
    double max_weight() const { return m_max_weight; }
    std::size_t max_phrase_tokens() const { return m_max_phrase_tokens; }

    const std::vector<ConceptEntry>& concepts() const { return m_concepts; }
    const ConceptEntry& concept_at(std::size_t i) const { return m_concepts.at(i); }

    // Greedy longest match of known phrases; unmatched tokens pass through unchanged.
    std::vector<std::string> resolve_phrases(const std::vector<std::string>& tokens) const;

    // Distinct concept indices referenced by already resolved terms.
    std::vector<std::size_t> concepts_in(const std::vector<std::string>& resolved_terms) const;

private:
    Taxonomy() = default;

    std::vector<ConceptEntry> m_concepts;
    std::unordered_map<std::string, TermInfo> m_terms;
    std::unordered_map<std::string, TermInfo> m_stems;
    std::array<double, kCategoryCount> m_weights{};
    double m_max_weight = 1.0;
    std::size_t m_max_phrase_tokens = 1;
};

}  // namespace insights
