/**
 * @file NarrativeFindingsProvider.hpp
 * @brief Interface for the upstream collaborator that produces narrative findings.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/NarrativeFinding.hpp"
#include "domain/Protocol.hpp"
#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

/**
 * @class NarrativeFindingsProvider
 * @brief Abstract source of structured findings (e.g. an AI review of the protocol).
 */
class NarrativeFindingsProvider {
public:
    virtual ~NarrativeFindingsProvider() = default;

    /**
     * @brief Produces findings for a protocol given its closest historical matches.
     * @return The findings, or nullopt if the collaborator could not produce any.
     */
    virtual std::optional<std::vector<NarrativeFinding>> findingsFor(
        const Protocol& protocol,
        const std::vector<ScoredCandidate>& similarTrials) = 0;
};

} // namespace trialguard::domain
