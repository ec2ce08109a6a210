/**
 * @file SimilaritySearch.cpp
 * @brief Implementation of SimilaritySearch.
 */

#include "domain/services/SimilaritySearch.hpp"

#include <algorithm>
#include <iterator>
#include <regex>
#include <set>
#include <stdexcept>

#include "domain/TextMatching.hpp"

namespace trialguard::domain {

namespace {

bool HasValue(const std::optional<std::string>& value) {
    return value && !value->empty();
}

// 1.0 on equality, 0.5 on containment either way, else 0.
// A blank trial value is contained in any non-blank query value.
double TextCredit(const std::string& normalizedQuery, const std::string& trialValue) {
    if (normalizedQuery.empty()) return 0.0;
    const std::string normalizedTrial = Normalize(trialValue);
    if (normalizedTrial == normalizedQuery) return 1.0;
    if (normalizedTrial.empty() || ContainsEitherWay(normalizedQuery, normalizedTrial)) return 0.5;
    return 0.0;
}

} // namespace

std::string SimilaritySearch::EffectiveDrugClass(const SimilarityQuery& query) {
    std::string drugClass = Normalize(query.drugClass);
    return drugClass.empty() ? std::string("unknown") : drugClass;
}

std::vector<size_t> SimilaritySearch::GenerateCandidates(const CorpusIndex& index, const SimilarityQuery& query) {
    const std::string drugClass = EffectiveDrugClass(query);

    // Exact bucket plus every bucket related by containment.
    std::set<size_t> byDrugClass;
    const auto& exact = index.byDrugClass(drugClass);
    byDrugClass.insert(exact.begin(), exact.end());
    for (const auto& [indexedClass, positions] : index.drugClassBuckets()) {
        if (ContainsEitherWay(drugClass, indexedClass)) {
            byDrugClass.insert(positions.begin(), positions.end());
        }
    }

    if (HasValue(query.therapeuticArea)) {
        const auto& areaPositions = index.byTherapeuticArea(*query.therapeuticArea);
        std::set<size_t> inArea(areaPositions.begin(), areaPositions.end());

        std::vector<size_t> intersection;
        std::set_intersection(byDrugClass.begin(), byDrugClass.end(),
                              inArea.begin(), inArea.end(),
                              std::back_inserter(intersection));

        // Too few survivors: keep the drug-class candidates instead.
        if (!intersection.empty() && intersection.size() >= query.topK) {
            return intersection;
        }
    }

    return std::vector<size_t>(byDrugClass.begin(), byDrugClass.end());
}

std::vector<ScoredCandidate> SimilaritySearch::Search(const CorpusIndex& index, const SimilarityQuery& query) {
    std::vector<ScoredCandidate> scored;
    if (index.empty() || query.topK == 0) return scored;

    const auto candidates = GenerateCandidates(index, query);
    scored.reserve(candidates.size());
    for (size_t position : candidates) {
        const auto& trial = index.at(position);
        scored.push_back({trial, Score(trial, query)});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        return a.similarityScore > b.similarityScore;
    });

    if (scored.size() > query.topK) {
        scored.resize(query.topK);
    }
    return scored;
}

double SimilaritySearch::Score(const TrialRecord& trial, const SimilarityQuery& query) {
    double score = 0.0;
    double maxScore = kDrugClassWeight;

    score += kDrugClassWeight * TextCredit(EffectiveDrugClass(query), trial.drugClass);

    if (HasValue(query.therapeuticArea)) {
        maxScore += kTherapeuticAreaWeight;
        score += kTherapeuticAreaWeight * TextCredit(Normalize(*query.therapeuticArea), trial.therapeuticArea);
    }

    if (query.phase) {
        maxScore += kPhaseWeight;
        if (trial.phase && *trial.phase == *query.phase) {
            score += kPhaseWeight;
        } else if (trial.phase && PhasesAdjacent(*trial.phase, *query.phase)) {
            score += kPhaseWeight * 0.5;
        }
    }

    if (HasValue(query.populationAge)) {
        maxScore += kPopulationAgeWeight;
        if (AgeRangesOverlap(trial.populationAge, *query.populationAge)) {
            score += kPopulationAgeWeight;
        }
    }

    return std::clamp(score / maxScore, 0.0, 1.0);
}

std::optional<std::pair<int, int>> SimilaritySearch::ParseAgeRange(const std::string& ageRange) {
    static const std::regex kRangePattern(R"((\d+)-(\d+))");
    std::smatch match;
    if (!std::regex_search(ageRange, match, kRangePattern)) {
        return std::nullopt;
    }
    try {
        return std::make_pair(std::stoi(match[1].str()), std::stoi(match[2].str()));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool SimilaritySearch::AgeRangesOverlap(const std::string& a, const std::string& b) {
    const auto first = ParseAgeRange(a);
    const auto second = ParseAgeRange(b);
    if (!first || !second) return false;
    return !(first->second < second->first || second->second < first->first);
}

} // namespace trialguard::domain
