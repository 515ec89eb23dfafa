#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/Models.hpp"
#include "topics/Taxonomy.hpp"

namespace insights {

struct DifficultyIndicators {
    int easy = 0;
    int medium = 0;
    int hard = 0;

    int total() const { return easy + medium + hard; }
};

DifficultyIndicators count_difficulty_indicators(const std::vector<std::string>& tokens);

// (0*easy + 0.5*medium + 1*hard) / total, or 0.5 when nothing matched
double keyword_difficulty(const DifficultyIndicators& ind);

// Highest round number or count mentioned ("round 3", "4 rounds", "third round"),
// or the number of round mentions when that is larger. 0 when rounds are never mentioned.
int round_count_proxy(const std::vector<std::string>& tokens);

// Phi coefficient between referencing the topic and a successful outcome, mapped to [0,1].
// Counts are over documents with a known outcome. 0.5 when undefined.
double success_correlation(int ref_success, int ref_fail, int other_success, int other_fail);

class StatisticalScorer {
public:
    StatisticalScorer(std::shared_ptr<const Taxonomy> taxonomy, EngineConfig cfg);

    // Fills difficulty, relevance, success correlation, confidence and priority level.
    // Contributing documents are those referencing any member term. Order independent.
    Topic score(const Topic& topic, const std::vector<NormalizedDocument>& docs) const;

    // Configured as_of, else the latest document date (0 for an empty set).
    std::int64_t reference_date(const std::vector<NormalizedDocument>& docs) const;

    // exp(-lambda * days), floored at min_weight. Documents dated after the reference weigh 1.
    double decay_weight(std::int64_t doc_date, std::int64_t reference) const;

private:
    std::shared_ptr<const Taxonomy> m_taxonomy;
    EngineConfig m_cfg;
};

}  // namespace insights
