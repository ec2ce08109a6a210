/**
 * @file SimilaritySearch.hpp
 * @brief Multi-stage similarity search over the historical trial corpus.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/CorpusIndex.hpp"
#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

/**
 * @struct SimilarityQuery
 * @brief Attributes of the candidate protocol used to look up comparable trials.
 *
 * Optional attributes left unset (or empty) are excluded from scoring entirely.
 */
struct SimilarityQuery {
    std::string drugClass;                      ///< Required; empty is searched as "Unknown".
    std::optional<std::string> therapeuticArea;
    std::optional<TrialPhase> phase;
    std::optional<std::string> populationAge;   ///< E.g. "18-65".
    size_t topK = 5;
};

/**
 * @class SimilaritySearch
 * @brief Candidate generation, partial-credit scoring and stable top-K selection.
 */
class SimilaritySearch {
public:
    static constexpr double kDrugClassWeight = 0.40;
    static constexpr double kTherapeuticAreaWeight = 0.30;
    static constexpr double kPhaseWeight = 0.20;
    static constexpr double kPopulationAgeWeight = 0.10;

    /**
     * @brief Returns at most `query.topK` trials, most similar first.
     *
     * Equal scores keep corpus order. An empty corpus yields an empty list.
     */
    static std::vector<ScoredCandidate> Search(const CorpusIndex& index, const SimilarityQuery& query);

    /**
     * @brief Weighted similarity in [0, 1], normalized by the weights applicable to the query.
     */
    static double Score(const TrialRecord& trial, const SimilarityQuery& query);

    /**
     * @brief Extracts "min-max" from the first `<int>-<int>` pattern in @p ageRange.
     */
    static std::optional<std::pair<int, int>> ParseAgeRange(const std::string& ageRange);

    /** @brief True only when both ranges parse and intersect (inclusive bounds). */
    static bool AgeRangesOverlap(const std::string& a, const std::string& b);

private:
    static std::vector<size_t> GenerateCandidates(const CorpusIndex& index, const SimilarityQuery& query);
    static std::string EffectiveDrugClass(const SimilarityQuery& query);
};

} // namespace trialguard::domain
