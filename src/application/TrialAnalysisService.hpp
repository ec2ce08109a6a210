/**
 * @file TrialAnalysisService.hpp
 * @brief Orchestrates search, upstream findings, scoring, comparison and prioritization for one protocol.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/HistoricalTrialService.hpp"
#include "domain/NarrativeFindingsProvider.hpp"
#include "domain/Protocol.hpp"
#include "domain/TrialAnalysis.hpp"
#include "domain/services/RiskScoringEngine.hpp"
#include "domain/services/SimilaritySearch.hpp"

namespace trialguard::application {

/**
 * @class TrialAnalysisService
 * @brief Produces a TrialAnalysis from a protocol.
 *
 * The findings provider is optional. When it is absent or fails, the analysis
 * continues with no narrative findings.
 */
class TrialAnalysisService {
public:
    /**
     * @param trials Corpus service; must outlive this object.
     * @param findingsProvider Upstream collaborator, may be null.
     * @param topK Number of similar trials to retrieve.
     * @param comparisonCount Number of leading matches to build comparison tables for.
     */
    TrialAnalysisService(const HistoricalTrialService& trials,
                         std::shared_ptr<domain::NarrativeFindingsProvider> findingsProvider,
                         size_t topK = 5,
                         size_t comparisonCount = 1);

    domain::TrialAnalysis analyze(const domain::Protocol& protocol) const;

    /** @brief Search attributes taken from the protocol; blank optionals are left unset. */
    static domain::SimilarityQuery BuildQuery(const domain::Protocol& protocol, size_t topK);

private:
    std::vector<domain::NarrativeFinding> collectFindings(const domain::Protocol& protocol,
                                                          const std::vector<domain::ScoredCandidate>& similar,
                                                          std::vector<std::string>& warnings) const;

    const HistoricalTrialService& m_trials;
    std::shared_ptr<domain::NarrativeFindingsProvider> m_findingsProvider;
    domain::RiskScoringEngine m_engine;
    size_t m_topK;
    size_t m_comparisonCount;
};

} // namespace trialguard::application
