/**
 * @file TrialCorpusLoader.hpp
 * @brief Loads the historical trial corpus from its JSON document.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/TrialRecord.hpp"

namespace trialguard::infrastructure {

/**
 * @struct CorpusDocument
 * @brief Materialized contents of a corpus file.
 */
struct CorpusDocument {
    std::vector<domain::TrialRecord> trials;
    nlohmann::json failurePatterns = nlohmann::json::object();
    std::vector<std::string> warnings;  ///< One entry per skipped trial.
};

/**
 * @class TrialCorpusLoader
 * @brief Static utility converting `{ "trials": [...], "failure_patterns": {...} }` documents.
 */
class TrialCorpusLoader {
public:
    /**
     * @brief Reads and parses a corpus file.
     * @param path Path to the JSON document.
     * @param error Receives a description when the file cannot be read or is not valid JSON.
     * @return The document, or nullopt on error.
     */
    static std::optional<CorpusDocument> LoadFile(const std::string& path, std::string& error);

    /**
     * @brief Converts an already-parsed document. Malformed trials are skipped with a warning.
     */
    static CorpusDocument Parse(const nlohmann::json& document);

    /**
     * @brief Converts one trial object.
     * @param errors Receives one message per malformed field.
     * @return The record, or nullopt if any field was malformed.
     */
    static std::optional<domain::TrialRecord> ParseTrial(const nlohmann::json& trial,
                                                         const std::string& path,
                                                         std::vector<std::string>& errors);
};

} // namespace trialguard::infrastructure
