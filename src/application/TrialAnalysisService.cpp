/**
 * @file TrialAnalysisService.cpp
 * @brief Implementation of TrialAnalysisService.
 */

#include "application/TrialAnalysisService.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "domain/TextMatching.hpp"
#include "domain/services/ComparisonTableBuilder.hpp"
#include "domain/services/RecommendationPrioritizer.hpp"

namespace trialguard::application {

using namespace trialguard::domain;

TrialAnalysisService::TrialAnalysisService(const HistoricalTrialService& trials,
                                           std::shared_ptr<NarrativeFindingsProvider> findingsProvider,
                                           size_t topK,
                                           size_t comparisonCount)
    : m_trials(trials),
      m_findingsProvider(std::move(findingsProvider)),
      m_topK(topK),
      m_comparisonCount(comparisonCount) {}

SimilarityQuery TrialAnalysisService::BuildQuery(const Protocol& protocol, size_t topK) {
    SimilarityQuery query;
    query.drugClass = protocol.drugProfile.drugClass;
    if (!Normalize(protocol.patientPopulation.therapeuticArea).empty()) {
        query.therapeuticArea = protocol.patientPopulation.therapeuticArea;
    }
    query.phase = protocol.metadata.phase;
    if (!Normalize(protocol.patientPopulation.ageRange).empty()) {
        query.populationAge = protocol.patientPopulation.ageRange;
    }
    query.topK = topK;
    return query;
}

std::vector<NarrativeFinding> TrialAnalysisService::collectFindings(const Protocol& protocol,
                                                                    const std::vector<ScoredCandidate>& similar,
                                                                    std::vector<std::string>& warnings) const {
    if (!m_findingsProvider) {
        return {};
    }

    try {
        auto findings = m_findingsProvider->findingsFor(protocol, similar);
        if (findings) {
            return std::move(*findings);
        }
        warnings.push_back("Findings provider returned no result; scoring without narrative findings.");
    } catch (const std::exception& e) {
        warnings.push_back(std::string("Findings provider failed: ") + e.what());
    }
    return {};
}

TrialAnalysis TrialAnalysisService::analyze(const Protocol& protocol) const {
    TrialAnalysis analysis;

    // One snapshot for the whole analysis so a concurrent reload cannot mix corpora.
    auto snapshot = m_trials.snapshot();
    analysis.similarTrials = SimilaritySearch::Search(snapshot->index, BuildQuery(protocol, m_topK));

    analysis.findings = collectFindings(protocol, analysis.similarTrials, analysis.warnings);
    analysis.riskScore = m_engine.score(protocol, analysis.similarTrials, analysis.findings);

    const size_t comparisons = std::min(m_comparisonCount, analysis.similarTrials.size());
    for (size_t i = 0; i < comparisons; ++i) {
        analysis.comparisons.push_back(ComparisonTableBuilder::Build(protocol, analysis.similarTrials[i].trial));
    }

    analysis.recommendations = RecommendationPrioritizer::prioritize(analysis.findings);

    for (const auto& warning : analysis.warnings) {
        std::cerr << "[TrialAnalysisService] " << warning << std::endl;
    }
    return analysis;
}

} // namespace trialguard::application
