/**
 * @file HistoricalTrialService.hpp
 * @brief Application service owning the historical trial corpus and the queries over it.
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/Comparison.hpp"
#include "domain/CorpusIndex.hpp"
#include "domain/Protocol.hpp"
#include "domain/TrialRecord.hpp"
#include "domain/services/SimilaritySearch.hpp"

namespace trialguard::application {

/**
 * @struct CorpusSnapshot
 * @brief Immutable corpus generation: the index plus the pre-computed failure patterns.
 */
struct CorpusSnapshot {
    domain::CorpusIndex index;
    nlohmann::json failurePatterns = nlohmann::json::object();
};

/**
 * @struct TrialFilter
 * @brief Plain attribute filter; unset fields do not constrain the result.
 */
struct TrialFilter {
    std::optional<std::string> drugClass;         ///< Substring match in either direction.
    std::optional<std::string> therapeuticArea;   ///< Trial area must contain it.
    std::optional<domain::TrialPhase> phase;
    std::optional<domain::TrialOutcome> outcome;  ///< nullopt means all outcomes.
    size_t limit = 5;
};

/**
 * @class HistoricalTrialService
 * @brief Loads the corpus and answers search, lookup and comparison requests.
 *
 * Every query works on a snapshot taken at its start. Reloading swaps in a new
 * snapshot and never touches one a reader already holds.
 */
class HistoricalTrialService {
public:
    explicit HistoricalTrialService(bool verbose = true);

    /**
     * @brief Loads a corpus document and publishes it.
     *
     * A missing file publishes an empty corpus. An unreadable or malformed file
     * keeps the current snapshot.
     * @return false if the file existed but could not be parsed.
     */
    bool loadFromFile(const std::string& path);

    /** @brief Publishes an in-memory corpus. */
    void replaceCorpus(const std::vector<domain::TrialRecord>& trials,
                       nlohmann::json failurePatterns = nlohmann::json::object());

    std::shared_ptr<const CorpusSnapshot> snapshot() const;
    size_t trialCount() const;

    std::vector<domain::ScoredCandidate> findSimilarTrials(const domain::SimilarityQuery& query) const;

    /** @brief Corpus-order scan, stops after `filter.limit` matches. */
    std::vector<domain::TrialRecord> searchByFilters(const TrialFilter& filter) const;

    std::vector<domain::TrialRecord> findByTag(const std::string& tag) const;
    std::optional<domain::TrialRecord> findById(const std::string& nctId) const;

    /**
     * @brief Pre-computed failure patterns keyed "area" or "area_drugclass" (lower-case).
     * @return The stored object, or an empty object.
     */
    nlohmann::json getFailurePatterns(const std::string& therapeuticArea,
                                      const std::optional<std::string>& drugClass = std::nullopt) const;

    domain::ComparisonTable compare(const domain::Protocol& protocol, const domain::TrialRecord& historical) const;

    /**
     * @brief Compares against a corpus trial by identifier.
     * @throws std::invalid_argument if no trial has @p nctId.
     */
    domain::ComparisonTable compareById(const domain::Protocol& protocol, const std::string& nctId) const;

private:
    void publish(std::shared_ptr<const CorpusSnapshot> next);

    bool m_verbose;
    mutable std::mutex m_mutex; ///< Guards m_snapshot.
    std::shared_ptr<const CorpusSnapshot> m_snapshot;
};

} // namespace trialguard::application
