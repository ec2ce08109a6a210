/**
 * @file RiskScoringEngine.cpp
 * @brief Implementation of RiskScoringEngine.
 */

#include "domain/services/RiskScoringEngine.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "domain/TextMatching.hpp"

namespace trialguard::domain {

namespace {

constexpr size_t kMaxConcerns = 3;
constexpr size_t kMinSafetyPlanLength = 50;
constexpr int kMinEfficacyEnrollment = 50;

double RoundTo(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

void Truncate(std::vector<std::string>& concerns) {
    if (concerns.size() > kMaxConcerns) concerns.resize(kMaxConcerns);
}

void AddUnique(std::vector<std::string>& concerns, const std::string& concern) {
    if (std::find(concerns.begin(), concerns.end(), concern) == concerns.end()) {
        concerns.push_back(concern);
    }
}

bool HasText(const std::optional<std::string>& text) {
    return text && !text->empty();
}

} // namespace

RiskScore RiskScoringEngine::score(const Protocol& protocol,
                                   const std::vector<ScoredCandidate>& matchedTrials,
                                   const std::vector<NarrativeFinding>& findings) const {
    CategoryScore historical = scoreHistoricalPrecedent(matchedTrials);
    CategoryScore safety = scoreSafetyAlignment(protocol);
    CategoryScore design = scoreDesignCompleteness(protocol);

    const double overall = kHistoricalWeight * historical.score +
                           kSafetyWeight * safety.score +
                           kDesignWeight * design.score;

    const double clamped = std::clamp(overall, 0.0, 100.0);
    RiskScore result;
    result.overallScore = RoundTo(clamped, 1);
    result.riskLevel = LevelForScore(clamped);
    result.confidence = RoundTo(computeConfidence(matchedTrials.size(), findings.size()), 2);
    result.categoryScores = {std::move(historical), std::move(safety), std::move(design)};
    return result;
}

CategoryScore RiskScoringEngine::scoreHistoricalPrecedent(const std::vector<ScoredCandidate>& matchedTrials) const {
    CategoryScore result;
    result.category = RiskCategory::HistoricalPrecedent;

    if (matchedTrials.empty()) {
        result.score = kNeutralScore;
        result.keyConcerns = {"Limited historical data available"};
        return result;
    }

    int failedCount = 0;
    double similaritySum = 0.0;
    double severityMultiplier = 1.0;
    std::vector<std::string> concerns;

    for (const auto& candidate : matchedTrials) {
        similaritySum += candidate.similarityScore;
        if (candidate.trial.outcome != TrialOutcome::Failed) continue;
        ++failedCount;

        // Multipliers cap at the strongest family; they never compound.
        for (const auto& reason : candidate.trial.failureReasons) {
            const std::string lowered = ToLower(reason);
            if (lowered.find("placebo") != std::string::npos) {
                severityMultiplier = std::max(severityMultiplier, 1.2);
                AddUnique(concerns, "High placebo response in similar trials");
            }
            if (ContainsAny(lowered, {"biomarker", "enrichment"})) {
                severityMultiplier = std::max(severityMultiplier, 1.3);
                AddUnique(concerns, "Biomarker selection issues in similar trials");
            }
            if (ContainsAny(lowered, {"power", "sample size"})) {
                severityMultiplier = std::max(severityMultiplier, 1.15);
                AddUnique(concerns, "Statistical power issues in similar trials");
            }
        }
    }

    const double total = static_cast<double>(matchedTrials.size());
    const double baseScore = (failedCount / total) * 100.0;
    const double avgSimilarity = similaritySum / total;
    const double finalScore = std::min(baseScore * avgSimilarity * severityMultiplier, 100.0);

    Truncate(concerns);
    if (concerns.empty()) {
        concerns.push_back(std::to_string(failedCount) + "/" + std::to_string(matchedTrials.size()) +
                           " similar trials failed");
    }

    result.score = RoundTo(std::clamp(finalScore, 0.0, 100.0), 1);
    result.findingsCount = failedCount;
    result.keyConcerns = std::move(concerns);
    return result;
}

CategoryScore RiskScoringEngine::scoreSafetyAlignment(const Protocol& protocol) const {
    CategoryScore result;
    result.category = RiskCategory::SafetyAlignment;
    double score = 0.0;
    std::vector<std::string> concerns;

    const auto& drug = protocol.drugProfile;
    const auto& population = protocol.patientPopulation;

    int unmitigated = 0;
    for (const auto& contraindication : drug.knownContraindications) {
        const bool excluded = std::any_of(population.exclusionCriteria.begin(), population.exclusionCriteria.end(),
                                          [&](const std::string& exclusion) {
                                              return ContainsIgnoreCase(exclusion, contraindication);
                                          });
        if (!excluded) {
            ++unmitigated;
            score += 20.0;
        }
    }
    if (unmitigated > 0) {
        concerns.push_back(std::to_string(unmitigated) + " contraindications not in exclusion criteria");
    }

    const auto& plan = protocol.safetyMonitoringPlan;
    if (!plan || CodePointCount(*plan) < kMinSafetyPlanLength) {
        score += 15.0;
        concerns.push_back("Incomplete safety monitoring plan");
    }

    if (!drug.pharmacogenomicMarkers.empty() && population.biomarkerRequirements.empty()) {
        score += 25.0;
        concerns.push_back("Known pharmacogenomic markers not used for patient selection");
    }

    result.score = RoundTo(std::clamp(score, 0.0, 100.0), 1);
    result.findingsCount = static_cast<int>(concerns.size());
    Truncate(concerns);
    result.keyConcerns = std::move(concerns);
    return result;
}

CategoryScore RiskScoringEngine::scoreDesignCompleteness(const Protocol& protocol) const {
    CategoryScore result;
    result.category = RiskCategory::DesignCompleteness;
    double score = 0.0;
    std::vector<std::string> concerns;

    const auto& design = protocol.studyDesign;
    const auto& stats = protocol.statisticalPlan;
    const bool isEfficacyTrial = protocol.metadata.phase && IsEfficacyPhase(*protocol.metadata.phase);

    if (isEfficacyTrial && !design.placeboControlled) {
        score += 30.0;
        concerns.push_back("No placebo control in efficacy trial");
    }

    if (!stats.powerCalculationProvided) {
        score += 25.0;
        concerns.push_back("No statistical power calculation provided");
    }

    if (protocol.primaryEndpoints.empty()) {
        score += 20.0;
        concerns.push_back("No primary endpoint defined");
    } else if (protocol.primaryEndpoints.size() > 1) {
        score += 10.0;
        concerns.push_back("Multiple primary endpoints may dilute power");
    }

    if (!HasText(protocol.safetyMonitoringPlan)) {
        score += 15.0;
        concerns.push_back("No safety monitoring plan");
    }

    if (isEfficacyTrial && Normalize(design.blinding) == "open-label") {
        score += 20.0;
        concerns.push_back("Open-label design in efficacy trial");
    }

    if (isEfficacyTrial && stats.plannedEnrollment < kMinEfficacyEnrollment) {
        score += 15.0;
        concerns.push_back("Small sample size (" + std::to_string(stats.plannedEnrollment) + ") for efficacy trial");
    }

    result.score = RoundTo(std::clamp(score, 0.0, 100.0), 1);
    result.findingsCount = static_cast<int>(concerns.size());
    Truncate(concerns);
    result.keyConcerns = std::move(concerns);
    return result;
}

double RiskScoringEngine::computeConfidence(size_t matchedTrialCount, size_t findingsCount) const {
    double confidence = 0.5;

    if (matchedTrialCount >= 5) {
        confidence += 0.3;
    } else if (matchedTrialCount >= 3) {
        confidence += 0.2;
    } else if (matchedTrialCount >= 1) {
        confidence += 0.1;
    }

    if (findingsCount >= 3) {
        confidence += 0.2;
    }

    return std::min(confidence, 1.0);
}

RiskLevel RiskScoringEngine::LevelForScore(double overallScore) {
    if (overallScore < kLowThreshold) return RiskLevel::Low;
    if (overallScore < kHighThreshold) return RiskLevel::Medium;
    return RiskLevel::High;
}

} // namespace trialguard::domain
