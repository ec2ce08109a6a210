/**
 * @file CorpusIndex.hpp
 * @brief In-memory lookup structures over the historical trial corpus.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

/**
 * @class CorpusIndex
 * @brief Read-only, multi-field index of historical trials.
 *
 * Keys are lower-cased for drug class, therapeutic area, outcome and tags; the
 * phase dimension uses the canonical phase label. Each bucket lists record
 * positions in corpus order. Once built the index is never mutated, so it can be
 * shared between threads without locking.
 */
class CorpusIndex {
public:
    using Positions = std::vector<size_t>;
    using Buckets = std::unordered_map<std::string, Positions>;

    CorpusIndex() = default;

    /**
     * @brief Builds an index over a copy of @p records.
     *
     * Records sharing an identifier resolve to the later one in input order.
     * Empty key fields are left out of that dimension only.
     */
    static CorpusIndex Build(const std::vector<TrialRecord>& records);

    size_t size() const { return m_records.size(); }
    bool empty() const { return m_records.empty(); }

    /** @brief All indexed records in corpus order. */
    const std::vector<TrialRecord>& records() const { return m_records; }
    const TrialRecord& at(size_t position) const { return m_records.at(position); }

    /** @brief Direct identifier lookup; nullptr when absent. */
    const TrialRecord* findById(const std::string& nctId) const;

    const Positions& byDrugClass(const std::string& drugClass) const;
    const Positions& byTherapeuticArea(const std::string& area) const;
    const Positions& byPhase(TrialPhase phase) const;
    const Positions& byOutcome(TrialOutcome outcome) const;
    const Positions& byTag(const std::string& tag) const;

    /** @brief Every drug class bucket, used for partial (substring) matching. */
    const Buckets& drugClassBuckets() const { return m_drugClass; }

private:
    static const Positions& Lookup(const Buckets& buckets, const std::string& key);
    static void Append(Buckets& buckets, const std::string& key, size_t position);

    std::vector<TrialRecord> m_records;
    std::unordered_map<std::string, size_t> m_byId;
    Buckets m_drugClass;
    Buckets m_therapeuticArea;
    Buckets m_phase;
    Buckets m_outcome;
    Buckets m_tags;
};

} // namespace trialguard::domain
