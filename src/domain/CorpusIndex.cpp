/**
 * @file CorpusIndex.cpp
 * @brief Implementation of CorpusIndex.
 */

#include "domain/CorpusIndex.hpp"

#include <unordered_set>

#include "domain/TextMatching.hpp"

namespace trialguard::domain {

CorpusIndex CorpusIndex::Build(const std::vector<TrialRecord>& records) {
    CorpusIndex index;

    // Last occurrence of each identifier wins; it keeps its own position.
    std::unordered_map<std::string, size_t> lastOccurrence;
    for (size_t i = 0; i < records.size(); ++i) {
        if (!records[i].nctId.empty()) {
            lastOccurrence[records[i].nctId] = i;
        }
    }

    index.m_records.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        if (!record.nctId.empty() && lastOccurrence[record.nctId] != i) continue;
        index.m_records.push_back(record);
    }

    for (size_t pos = 0; pos < index.m_records.size(); ++pos) {
        const auto& trial = index.m_records[pos];

        if (!trial.nctId.empty()) {
            index.m_byId[trial.nctId] = pos;
        }
        Append(index.m_drugClass, Normalize(trial.drugClass), pos);
        Append(index.m_therapeuticArea, Normalize(trial.therapeuticArea), pos);
        if (trial.phase) {
            Append(index.m_phase, PhaseToString(*trial.phase), pos);
        }
        Append(index.m_outcome, OutcomeToString(trial.outcome), pos);

        std::unordered_set<std::string> seenTags;
        for (const auto& tag : trial.tags) {
            std::string key = Normalize(tag);
            if (seenTags.insert(key).second) {
                Append(index.m_tags, key, pos);
            }
        }
    }

    return index;
}

const TrialRecord* CorpusIndex::findById(const std::string& nctId) const {
    auto it = m_byId.find(nctId);
    if (it == m_byId.end()) return nullptr;
    return &m_records[it->second];
}

const CorpusIndex::Positions& CorpusIndex::byDrugClass(const std::string& drugClass) const {
    return Lookup(m_drugClass, Normalize(drugClass));
}

const CorpusIndex::Positions& CorpusIndex::byTherapeuticArea(const std::string& area) const {
    return Lookup(m_therapeuticArea, Normalize(area));
}

const CorpusIndex::Positions& CorpusIndex::byPhase(TrialPhase phase) const {
    return Lookup(m_phase, PhaseToString(phase));
}

const CorpusIndex::Positions& CorpusIndex::byOutcome(TrialOutcome outcome) const {
    return Lookup(m_outcome, OutcomeToString(outcome));
}

const CorpusIndex::Positions& CorpusIndex::byTag(const std::string& tag) const {
    return Lookup(m_tags, Normalize(tag));
}

const CorpusIndex::Positions& CorpusIndex::Lookup(const Buckets& buckets, const std::string& key) {
    static const Positions kEmpty;
    auto it = buckets.find(key);
    return it != buckets.end() ? it->second : kEmpty;
}

void CorpusIndex::Append(Buckets& buckets, const std::string& key, size_t position) {
    if (key.empty()) return;
    buckets[key].push_back(position);
}

} // namespace trialguard::domain
