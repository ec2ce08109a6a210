/**
 * @file Protocol.hpp
 * @brief Domain entity for the candidate trial protocol under analysis.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/TextMatching.hpp"
#include "domain/TrialPhase.hpp"

namespace trialguard::domain {

/**
 * @enum StudyDesignType
 * @brief Allocation structure of the study.
 */
enum class StudyDesignType {
    Parallel,
    Crossover,
    Factorial,
    SingleGroup
};

inline std::string DesignTypeToString(StudyDesignType type) {
    switch (type) {
        case StudyDesignType::Parallel: return "Parallel";
        case StudyDesignType::Crossover: return "Crossover";
        case StudyDesignType::Factorial: return "Factorial";
        case StudyDesignType::SingleGroup: return "Single Group";
    }
    return "Parallel";
}

inline std::optional<StudyDesignType> ParseDesignType(const std::string& label) {
    const std::string norm = Normalize(label);
    if (norm == "parallel") return StudyDesignType::Parallel;
    if (norm == "crossover") return StudyDesignType::Crossover;
    if (norm == "factorial") return StudyDesignType::Factorial;
    if (norm == "single group") return StudyDesignType::SingleGroup;
    return std::nullopt;
}

struct ProtocolMetadata {
    std::string trialName;
    std::string sponsor;
    std::optional<TrialPhase> phase;
    std::optional<std::string> nctId;
    std::optional<int> year;
};

struct DrugProfile {
    std::string name;
    std::string drugClass;
    std::optional<std::string> mechanismOfAction;
    std::vector<std::string> knownContraindications;
    std::vector<std::string> pharmacogenomicMarkers;
};

struct PatientPopulation {
    std::string ageRange;
    std::optional<std::string> gender;
    std::string diseaseIndication;
    std::string therapeuticArea;
    std::vector<std::string> inclusionCriteria;
    std::vector<std::string> exclusionCriteria;
    std::optional<std::string> diseaseSeverity;
    std::vector<std::string> biomarkerRequirements;
};

struct Endpoint {
    std::string name;
    std::string type;   ///< primary, secondary, exploratory
    std::optional<std::string> measurementMethod;
    std::optional<std::string> timepoint;
};

struct StatisticalPlan {
    int plannedEnrollment = 0;
    std::optional<int> actualEnrollment;
    bool powerCalculationProvided = false;
    std::optional<double> expectedEffectSize;
    double alphaLevel = 0.05;
    std::optional<double> dropoutRateAssumption;
    std::optional<std::string> primaryAnalysisMethod;
};

struct StudyDesign {
    std::optional<StudyDesignType> designType;
    std::string blinding;   ///< open-label, single-blind, double-blind, triple-blind
    bool randomization = false;
    bool placeboControlled = false;
    bool placeboRunIn = false;
    bool enrichmentDesign = false;
    bool adaptiveDesign = false;
    std::optional<int> durationWeeks;
};

/**
 * @struct Protocol
 * @brief Complete clinical trial protocol. Supplied per request; never mutated by the engine.
 */
struct Protocol {
    ProtocolMetadata metadata;
    DrugProfile drugProfile;
    PatientPopulation patientPopulation;
    StudyDesign studyDesign;
    std::vector<Endpoint> primaryEndpoints;
    std::vector<Endpoint> secondaryEndpoints;
    StatisticalPlan statisticalPlan;
    std::optional<std::string> safetyMonitoringPlan;

    std::optional<double> estimatedCost;
    std::optional<int> timelineMonths;
};

} // namespace trialguard::domain
