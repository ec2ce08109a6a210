/**
 * @file ResultJsonWriter.hpp
 * @brief Serializes analysis results to the snake_case JSON shape used by the corpus and request files.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/Comparison.hpp"
#include "domain/NarrativeFinding.hpp"
#include "domain/RiskAssessment.hpp"
#include "domain/TrialAnalysis.hpp"
#include "domain/TrialRecord.hpp"
#include "domain/ValidationReport.hpp"

namespace trialguard::infrastructure {

class ResultJsonWriter {
public:
    static nlohmann::json ToJson(const domain::TrialRecord& trial);
    static nlohmann::json ToJson(const domain::ScoredCandidate& candidate);
    static nlohmann::json ToJson(const domain::CategoryScore& score);
    static nlohmann::json ToJson(const domain::RiskScore& score);
    static nlohmann::json ToJson(const domain::ComparisonTable& table);
    static nlohmann::json ToJson(const domain::NarrativeFinding& finding);
    static nlohmann::json ToJson(const domain::Recommendation& recommendation);
    static nlohmann::json ToJson(const domain::ValidationReport& report);

    /**
     * @brief Full analysis document: risk_score, similar_trials, comparisons, findings, recommendations.
     */
    static nlohmann::json ToJson(const domain::TrialAnalysis& analysis);
};

} // namespace trialguard::infrastructure
