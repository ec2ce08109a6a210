/**
 * @file HistoricalTrialService.cpp
 * @brief Implementation of HistoricalTrialService.
 */

#include "application/HistoricalTrialService.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "domain/TextMatching.hpp"
#include "domain/services/ComparisonTableBuilder.hpp"
#include "infrastructure/TrialCorpusLoader.hpp"

namespace fs = std::filesystem;

namespace trialguard::application {

using namespace trialguard::domain;

HistoricalTrialService::HistoricalTrialService(bool verbose)
    : m_verbose(verbose), m_snapshot(std::make_shared<CorpusSnapshot>()) {}

bool HistoricalTrialService::loadFromFile(const std::string& path) {
    if (!fs::exists(path)) {
        std::cerr << "[HistoricalTrialService] Corpus not found at " << path
                  << ", continuing with an empty corpus." << std::endl;
        replaceCorpus({});
        return true;
    }

    std::string error;
    auto document = infrastructure::TrialCorpusLoader::LoadFile(path, error);
    if (!document) {
        std::cerr << "[HistoricalTrialService] " << error << " (keeping current corpus)" << std::endl;
        return false;
    }

    for (const auto& warning : document->warnings) {
        std::cerr << "[HistoricalTrialService] " << warning << std::endl;
    }

    replaceCorpus(document->trials, std::move(document->failurePatterns));
    if (m_verbose) {
        std::clog << "[HistoricalTrialService] Loaded " << trialCount() << " trials from " << path << std::endl;
    }
    return true;
}

void HistoricalTrialService::replaceCorpus(const std::vector<TrialRecord>& trials, nlohmann::json failurePatterns) {
    auto next = std::make_shared<CorpusSnapshot>();
    next->index = CorpusIndex::Build(trials);
    if (failurePatterns.is_object()) {
        next->failurePatterns = std::move(failurePatterns);
    }
    publish(std::move(next));
}

void HistoricalTrialService::publish(std::shared_ptr<const CorpusSnapshot> next) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = std::move(next);
}

std::shared_ptr<const CorpusSnapshot> HistoricalTrialService::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

size_t HistoricalTrialService::trialCount() const {
    return snapshot()->index.size();
}

std::vector<ScoredCandidate> HistoricalTrialService::findSimilarTrials(const SimilarityQuery& query) const {
    auto current = snapshot();
    return SimilaritySearch::Search(current->index, query);
}

std::vector<TrialRecord> HistoricalTrialService::searchByFilters(const TrialFilter& filter) const {
    auto current = snapshot();
    std::vector<TrialRecord> results;
    if (filter.limit == 0) return results;

    const std::string drugClass = filter.drugClass ? Normalize(*filter.drugClass) : std::string();

    for (const auto& trial : current->index.records()) {
        if (!drugClass.empty() && !ContainsEitherWay(Normalize(trial.drugClass), drugClass)) {
            continue;
        }
        if (filter.therapeuticArea && !filter.therapeuticArea->empty() &&
            !ContainsIgnoreCase(trial.therapeuticArea, *filter.therapeuticArea)) {
            continue;
        }
        if (filter.phase && trial.phase != filter.phase) {
            continue;
        }
        if (filter.outcome && trial.outcome != *filter.outcome) {
            continue;
        }

        results.push_back(trial);
        if (results.size() >= filter.limit) break;
    }
    return results;
}

std::vector<TrialRecord> HistoricalTrialService::findByTag(const std::string& tag) const {
    auto current = snapshot();
    std::vector<TrialRecord> results;
    for (size_t position : current->index.byTag(tag)) {
        results.push_back(current->index.at(position));
    }
    return results;
}

std::optional<TrialRecord> HistoricalTrialService::findById(const std::string& nctId) const {
    auto current = snapshot();
    const TrialRecord* trial = current->index.findById(nctId);
    if (!trial) return std::nullopt;
    return *trial;
}

nlohmann::json HistoricalTrialService::getFailurePatterns(const std::string& therapeuticArea,
                                                          const std::optional<std::string>& drugClass) const {
    auto current = snapshot();
    std::string key = ToLower(therapeuticArea);
    if (drugClass && !drugClass->empty()) {
        key += "_" + ToLower(*drugClass);
    }

    auto it = current->failurePatterns.find(key);
    if (it == current->failurePatterns.end()) {
        return nlohmann::json::object();
    }
    return *it;
}

ComparisonTable HistoricalTrialService::compare(const Protocol& protocol, const TrialRecord& historical) const {
    return ComparisonTableBuilder::Build(protocol, historical);
}

ComparisonTable HistoricalTrialService::compareById(const Protocol& protocol, const std::string& nctId) const {
    auto current = snapshot();
    const TrialRecord* trial = current->index.findById(nctId);
    if (!trial) {
        throw std::invalid_argument("Unknown historical trial: " + nctId);
    }
    return ComparisonTableBuilder::Build(protocol, *trial);
}

} // namespace trialguard::application
