/**
 * @file NarrativeFinding.hpp
 * @brief Domain entity for a structured finding produced by an upstream analysis collaborator.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/RiskAssessment.hpp"

namespace trialguard::domain {

/**
 * @struct NarrativeFinding
 * @brief An already-structured risk finding. The engine consumes these; it never generates them.
 */
struct NarrativeFinding {
    std::string title;
    RiskCategory category = RiskCategory::DesignCompleteness;
    RiskLevel severity = RiskLevel::Medium;
    std::string description;
    std::vector<std::string> evidence;
    std::vector<std::string> historicalTrialReferences;
    std::optional<std::string> quantifiedImpact;  ///< E.g. "Increases failure risk by 35%".
    std::string recommendation;
    std::optional<std::string> estimatedCostToFix;
    std::optional<Difficulty> implementationDifficulty;
};

} // namespace trialguard::domain
