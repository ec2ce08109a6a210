/**
 * @file TrialRecord.hpp
 * @brief Domain entity for a historical clinical trial in the reference corpus.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/TextMatching.hpp"
#include "domain/TrialPhase.hpp"

namespace trialguard::domain {

/**
 * @enum TrialOutcome
 * @brief Final (or current) status of a historical trial.
 */
enum class TrialOutcome {
    Success,
    Failed,
    Terminated,
    Unknown     ///< Unknown or still ongoing.
};

inline std::string OutcomeToString(TrialOutcome outcome) {
    switch (outcome) {
        case TrialOutcome::Success: return "success";
        case TrialOutcome::Failed: return "failed";
        case TrialOutcome::Terminated: return "terminated";
        case TrialOutcome::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Parses an outcome label. "ongoing" and the empty string map to Unknown.
 */
inline std::optional<TrialOutcome> ParseOutcome(const std::string& label) {
    const std::string norm = Normalize(label);
    if (norm == "success") return TrialOutcome::Success;
    if (norm == "failed") return TrialOutcome::Failed;
    if (norm == "terminated") return TrialOutcome::Terminated;
    if (norm.empty() || norm == "unknown" || norm == "ongoing") return TrialOutcome::Unknown;
    return std::nullopt;
}

/**
 * @struct TrialRecord
 * @brief One historical trial. Immutable once loaded into a CorpusIndex.
 */
struct TrialRecord {
    std::string nctId;                          ///< Unique identifier (NCT-style).
    std::string trialName;
    std::optional<TrialPhase> phase;
    std::string drugClass;                      ///< Free text, matched case-insensitively.
    std::string therapeuticArea;                ///< Free text, matched case-insensitively.
    TrialOutcome outcome = TrialOutcome::Unknown;
    std::string populationAge;                  ///< E.g. "18-65".
    int plannedEnrollment = 0;
    std::optional<int> actualEnrollment;
    bool placeboRunIn = false;
    std::string studyDesign;                    ///< Descriptor, e.g. "Parallel, double-blind".
    std::vector<std::string> tags;
    std::vector<std::string> keyLearnings;
    std::vector<std::string> failureReasons;    ///< Only populated for failed/terminated trials.
    std::optional<std::string> sponsor;
    std::optional<int> year;
};

/**
 * @struct ScoredCandidate
 * @brief A corpus trial paired with its similarity to a search query.
 */
struct ScoredCandidate {
    TrialRecord trial;
    double similarityScore = 0.0; ///< In [0, 1].
};

} // namespace trialguard::domain
