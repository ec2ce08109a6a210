/**
 * @file TrialAnalysis.hpp
 * @brief Aggregate result of analysing one protocol.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Comparison.hpp"
#include "domain/NarrativeFinding.hpp"
#include "domain/RiskAssessment.hpp"
#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

struct TrialAnalysis {
    RiskScore riskScore;
    std::vector<ScoredCandidate> similarTrials;     ///< Ranked, most similar first.
    std::vector<ComparisonTable> comparisons;       ///< Against the leading similar trials.
    std::vector<NarrativeFinding> findings;
    std::vector<Recommendation> recommendations;    ///< Ordered by priority.
    std::vector<std::string> warnings;              ///< Degraded inputs met during this analysis.
};

} // namespace trialguard::domain
