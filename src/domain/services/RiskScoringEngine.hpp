/**
 * @file RiskScoringEngine.hpp
 * @brief Weighted aggregation of historical, safety and design risk signals.
 */

#pragma once

#include <vector>

#include "domain/NarrativeFinding.hpp"
#include "domain/Protocol.hpp"
#include "domain/RiskAssessment.hpp"
#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

/**
 * @class RiskScoringEngine
 * @brief Converts a protocol, its matched historical trials and upstream findings into a RiskScore.
 *
 * Overall = 0.40 * historical precedent + 0.35 * safety alignment + 0.25 * design completeness.
 * Every category score is on a 0-100 scale where higher means riskier.
 * The engine is stateless; one instance may be shared across threads.
 */
class RiskScoringEngine {
public:
    static constexpr double kHistoricalWeight = 0.40;
    static constexpr double kSafetyWeight = 0.35;
    static constexpr double kDesignWeight = 0.25;

    static constexpr double kLowThreshold = 30.0;
    static constexpr double kHighThreshold = 60.0;

    /** @brief Score returned for historical precedent when nothing matched. */
    static constexpr double kNeutralScore = 50.0;

    /**
     * @brief Computes the full risk score.
     * @param protocol Candidate protocol.
     * @param matchedTrials Ranked output of the similarity search (may be empty).
     * @param findings Upstream narrative findings (may be empty).
     */
    RiskScore score(const Protocol& protocol,
                    const std::vector<ScoredCandidate>& matchedTrials,
                    const std::vector<NarrativeFinding>& findings) const;

    CategoryScore scoreHistoricalPrecedent(const std::vector<ScoredCandidate>& matchedTrials) const;
    CategoryScore scoreSafetyAlignment(const Protocol& protocol) const;
    CategoryScore scoreDesignCompleteness(const Protocol& protocol) const;

    /**
     * @brief Evidence-availability heuristic in [0, 1]; not a statistical interval.
     */
    double computeConfidence(size_t matchedTrialCount, size_t findingsCount) const;

    /** @brief <30 low, <60 medium, otherwise high. */
    static RiskLevel LevelForScore(double overallScore);
};

} // namespace trialguard::domain
