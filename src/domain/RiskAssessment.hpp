/**
 * @file RiskAssessment.hpp
 * @brief Value objects describing risk levels, category scores and the aggregated risk score.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/TextMatching.hpp"

namespace trialguard::domain {

/**
 * @enum RiskLevel
 * @brief Severity band. Aggregated scores only use Low/Medium/High; Critical is
 * reserved for narrative finding severities.
 */
enum class RiskLevel {
    Low,
    Medium,
    High,
    Critical
};

inline std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        case RiskLevel::Critical: return "critical";
    }
    return "medium";
}

inline std::optional<RiskLevel> ParseRiskLevel(const std::string& label) {
    const std::string norm = Normalize(label);
    if (norm == "low") return RiskLevel::Low;
    if (norm == "medium") return RiskLevel::Medium;
    if (norm == "high") return RiskLevel::High;
    if (norm == "critical") return RiskLevel::Critical;
    return std::nullopt;
}

/**
 * @enum RiskCategory
 * @brief The three signals feeding the overall score.
 */
enum class RiskCategory {
    HistoricalPrecedent,
    SafetyAlignment,
    DesignCompleteness
};

inline std::string CategoryToString(RiskCategory category) {
    switch (category) {
        case RiskCategory::HistoricalPrecedent: return "historical_precedent";
        case RiskCategory::SafetyAlignment: return "safety_alignment";
        case RiskCategory::DesignCompleteness: return "design_completeness";
    }
    return "design_completeness";
}

inline std::optional<RiskCategory> ParseCategory(const std::string& label) {
    const std::string norm = Normalize(label);
    if (norm == "historical_precedent") return RiskCategory::HistoricalPrecedent;
    if (norm == "safety_alignment") return RiskCategory::SafetyAlignment;
    if (norm == "design_completeness") return RiskCategory::DesignCompleteness;
    return std::nullopt;
}

/**
 * @enum Difficulty
 * @brief Implementation effort of a mitigation.
 */
enum class Difficulty {
    Easy,
    Medium,
    Hard
};

inline std::string DifficultyToString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard: return "hard";
    }
    return "medium";
}

inline std::optional<Difficulty> ParseDifficulty(const std::string& label) {
    const std::string norm = Normalize(label);
    if (norm == "easy") return Difficulty::Easy;
    if (norm == "medium") return Difficulty::Medium;
    if (norm == "hard") return Difficulty::Hard;
    return std::nullopt;
}

/**
 * @struct CategoryScore
 * @brief Score of one risk category (0-100, higher is riskier).
 */
struct CategoryScore {
    RiskCategory category = RiskCategory::DesignCompleteness;
    double score = 0.0;
    int findingsCount = 0;
    std::vector<std::string> keyConcerns; ///< At most three.
};

/**
 * @struct RiskScore
 * @brief Terminal output of one analysis.
 *
 * `confidence` is a data-availability heuristic (how many matched trials and
 * narrative findings backed the score), not a statistical confidence interval.
 */
struct RiskScore {
    double overallScore = 0.0;
    RiskLevel riskLevel = RiskLevel::Low;
    double confidence = 0.0;
    std::vector<CategoryScore> categoryScores; ///< historical, safety, design, in that order.
};

/**
 * @struct Recommendation
 * @brief Ranked mitigation derived from a narrative finding.
 */
struct Recommendation {
    int priority = 0; ///< 1 = highest.
    std::string title;
    std::string description;
    double expectedRiskReduction = 0.0;
    std::optional<std::string> estimatedCost;
    std::string implementationTime;
    Difficulty difficulty = Difficulty::Medium;
    RiskCategory impactCategory = RiskCategory::DesignCompleteness;
};

} // namespace trialguard::domain
