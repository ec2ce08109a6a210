/**
 * @file TrialPhase.hpp
 * @brief Value Object defining the clinical development phases and their ordering.
 */

#pragma once

#include <array>
#include <cstdlib>
#include <optional>
#include <string>

#include "domain/TextMatching.hpp"

namespace trialguard::domain {

/**
 * @enum TrialPhase
 * @brief Clinical trial phase, declared in canonical development order.
 */
enum class TrialPhase {
    Phase1,     ///< First-in-human, safety and dosing.
    Phase1_2,   ///< Combined Phase 1/2.
    Phase2,     ///< Early efficacy.
    Phase2_3,   ///< Combined Phase 2/3.
    Phase3,     ///< Confirmatory efficacy.
    Phase4      ///< Post-marketing.
};

/** @brief Canonical phase labels, indexed by the enum's ordinal. */
inline constexpr std::array<const char*, 6> kPhaseLabels = {
    "Phase 1", "Phase 1/2", "Phase 2", "Phase 2/3", "Phase 3", "Phase 4"
};

/**
 * @brief Helper to convert a phase to its canonical label ("Phase 2/3").
 */
inline std::string PhaseToString(TrialPhase phase) {
    return kPhaseLabels[static_cast<size_t>(phase)];
}

/**
 * @brief Parses a phase label. Matching ignores case and surrounding whitespace.
 * @return The phase, or nullopt if the label is not one of the canonical labels.
 */
inline std::optional<TrialPhase> ParsePhase(const std::string& label) {
    const std::string norm = Normalize(label);
    for (size_t i = 0; i < kPhaseLabels.size(); ++i) {
        if (norm == Normalize(kPhaseLabels[i])) {
            return static_cast<TrialPhase>(i);
        }
    }
    return std::nullopt;
}

/**
 * @brief Checks whether two phases are equal or neighbours in the canonical ordering.
 */
inline bool PhasesAdjacent(TrialPhase a, TrialPhase b) {
    return std::abs(static_cast<int>(a) - static_cast<int>(b)) <= 1;
}

/**
 * @brief Efficacy trials are those whose label mentions Phase 2 or Phase 3.
 *
 * "Phase 1/2" does not qualify; "Phase 2/3" does.
 */
inline bool IsEfficacyPhase(TrialPhase phase) {
    const std::string label = Normalize(PhaseToString(phase));
    return label.find("phase 2") != std::string::npos || label.find("phase 3") != std::string::npos;
}

} // namespace trialguard::domain
