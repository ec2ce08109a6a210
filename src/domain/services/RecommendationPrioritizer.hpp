/**
 * @file RecommendationPrioritizer.hpp
 * @brief Domain service ranking finding mitigations by impact and feasibility.
 */

#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "domain/NarrativeFinding.hpp"
#include "domain/RiskAssessment.hpp"

namespace trialguard::domain {

class RecommendationPrioritizer {
public:
    /**
     * @brief Ranks findings by (risk reduction^2 * feasibility) / 10000, highest first.
     *
     * Ties keep input order. Priorities are assigned 1..N after sorting.
     */
    static std::vector<Recommendation> prioritize(const std::vector<NarrativeFinding>& findings) {
        std::vector<std::pair<double, Recommendation>> ranked;
        ranked.reserve(findings.size());

        for (const auto& finding : findings) {
            const double reduction = RiskReductionFor(finding.severity);
            const Difficulty difficulty = finding.implementationDifficulty.value_or(Difficulty::Medium);
            const double priorityScore = (reduction * reduction * FeasibilityFor(difficulty)) / 10000.0;

            Recommendation rec;
            rec.title = finding.title.empty() ? std::string("Untitled recommendation") : finding.title;
            rec.description = finding.recommendation;
            rec.expectedRiskReduction = reduction;
            rec.estimatedCost = finding.estimatedCostToFix;
            rec.implementationTime = ImplementationTimeFor(difficulty);
            rec.difficulty = difficulty;
            rec.impactCategory = finding.category;
            ranked.emplace_back(priorityScore, std::move(rec));
        }

        std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            return a.first > b.first;
        });

        std::vector<Recommendation> result;
        result.reserve(ranked.size());
        for (auto& entry : ranked) {
            entry.second.priority = static_cast<int>(result.size()) + 1;
            result.push_back(std::move(entry.second));
        }
        return result;
    }

    static double RiskReductionFor(RiskLevel severity) {
        switch (severity) {
            case RiskLevel::Critical: return 25.0;
            case RiskLevel::High: return 18.0;
            case RiskLevel::Medium: return 10.0;
            case RiskLevel::Low: return 5.0;
        }
        return 5.0;
    }

    static double FeasibilityFor(Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::Easy: return 100.0;
            case Difficulty::Medium: return 70.0;
            case Difficulty::Hard: return 40.0;
        }
        return 70.0;
    }

    static std::string ImplementationTimeFor(Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::Easy: return "1-2 weeks";
            case Difficulty::Medium: return "1-2 months";
            case Difficulty::Hard: return "3-6 months";
        }
        return "2-4 weeks";
    }
};

} // namespace trialguard::domain
