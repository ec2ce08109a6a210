/**
 * @file FileFindingsProvider.hpp
 * @brief Adapter serving pre-computed narrative findings from a JSON file.
 */

#pragma once

#include <string>

#include "domain/NarrativeFindingsProvider.hpp"

namespace trialguard::infrastructure {

/**
 * @class FileFindingsProvider
 * @brief Implements NarrativeFindingsProvider over a findings document produced offline.
 *
 * The file is re-read on every call. Malformed entries are skipped with a warning.
 */
class FileFindingsProvider : public domain::NarrativeFindingsProvider {
public:
    explicit FileFindingsProvider(const std::string& path);

    /** @brief Returns the file's findings; nullopt if it cannot be read or is not valid JSON. */
    std::optional<std::vector<domain::NarrativeFinding>> findingsFor(
        const domain::Protocol& protocol,
        const std::vector<domain::ScoredCandidate>& similarTrials) override;

private:
    std::string m_path; ///< Findings document location.
};

} // namespace trialguard::infrastructure
