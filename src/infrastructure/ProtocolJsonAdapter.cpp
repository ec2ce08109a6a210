/**
 * @file ProtocolJsonAdapter.cpp
 * @brief Implementation of ProtocolJsonAdapter.
 */

#include "infrastructure/ProtocolJsonAdapter.hpp"

#include <sstream>
#include <utility>

#include "infrastructure/JsonFieldReader.hpp"

namespace trialguard::infrastructure {

using json = nlohmann::json;
using namespace trialguard::domain;

namespace {

std::vector<Endpoint> ReadEndpoints(const JsonFieldReader& reader, const char* key, std::vector<std::string>& errors) {
    std::vector<Endpoint> endpoints;
    const json* items = reader.array(key);
    if (!items) return endpoints;

    size_t i = 0;
    for (const auto& item : *items) {
        std::ostringstream path;
        path << reader.path() << (reader.path().empty() ? "" : ".") << key << "[" << i++ << "]";
        if (!item.is_object()) {
            errors.push_back(path.str() + ": expected object");
            continue;
        }
        JsonFieldReader endpoint(item, path.str(), errors);
        Endpoint e;
        e.name = endpoint.string("name");
        e.type = endpoint.string("type");
        e.measurementMethod = endpoint.optionalString("measurement_method");
        e.timepoint = endpoint.optionalString("timepoint");
        endpoints.push_back(std::move(e));
    }
    return endpoints;
}

} // namespace

std::optional<Protocol> ProtocolJsonAdapter::ParseProtocol(const json& document, std::vector<std::string>& errors) {
    if (!document.is_object()) {
        errors.push_back("protocol: expected object");
        return std::nullopt;
    }

    const size_t errorsBefore = errors.size();
    JsonFieldReader root(document, "", errors);
    Protocol protocol;

    const auto metadata = root.child("metadata");
    protocol.metadata.trialName = metadata.string("trial_name");
    protocol.metadata.sponsor = metadata.string("sponsor");
    protocol.metadata.phase = metadata.enumeration<TrialPhase>("phase", ParsePhase);
    protocol.metadata.nctId = metadata.optionalString("nct_id");
    protocol.metadata.year = metadata.optionalInteger("year");

    const auto drug = root.child("drug_profile");
    protocol.drugProfile.name = drug.string("name");
    protocol.drugProfile.drugClass = drug.string("drug_class");
    protocol.drugProfile.mechanismOfAction = drug.optionalString("mechanism_of_action");
    protocol.drugProfile.knownContraindications = drug.stringList("known_contraindications");
    protocol.drugProfile.pharmacogenomicMarkers = drug.stringList("pharmacogenomic_markers");

    const auto population = root.child("patient_population");
    protocol.patientPopulation.ageRange = population.string("age_range");
    protocol.patientPopulation.gender = population.optionalString("gender");
    protocol.patientPopulation.diseaseIndication = population.string("disease_indication");
    protocol.patientPopulation.therapeuticArea = population.string("therapeutic_area");
    protocol.patientPopulation.inclusionCriteria = population.stringList("inclusion_criteria");
    protocol.patientPopulation.exclusionCriteria = population.stringList("exclusion_criteria");
    protocol.patientPopulation.diseaseSeverity = population.optionalString("disease_severity");
    protocol.patientPopulation.biomarkerRequirements = population.stringList("biomarker_requirements");

    const auto design = root.child("study_design");
    protocol.studyDesign.designType = design.enumeration<StudyDesignType>("design_type", ParseDesignType);
    protocol.studyDesign.blinding = design.string("blinding");
    protocol.studyDesign.randomization = design.boolean("randomization");
    protocol.studyDesign.placeboControlled = design.boolean("placebo_controlled");
    protocol.studyDesign.placeboRunIn = design.boolean("placebo_run_in");
    protocol.studyDesign.enrichmentDesign = design.boolean("enrichment_design");
    protocol.studyDesign.adaptiveDesign = design.boolean("adaptive_design");
    protocol.studyDesign.durationWeeks = design.optionalInteger("duration_weeks");

    const auto stats = root.child("statistical_plan");
    protocol.statisticalPlan.plannedEnrollment = stats.integer("planned_enrollment", 0);
    protocol.statisticalPlan.actualEnrollment = stats.optionalInteger("actual_enrollment");
    protocol.statisticalPlan.powerCalculationProvided = stats.boolean("power_calculation_provided");
    protocol.statisticalPlan.expectedEffectSize = stats.optionalNumber("expected_effect_size");
    protocol.statisticalPlan.alphaLevel = stats.number("alpha_level", 0.05);
    protocol.statisticalPlan.dropoutRateAssumption = stats.optionalNumber("dropout_rate_assumption");
    protocol.statisticalPlan.primaryAnalysisMethod = stats.optionalString("primary_analysis_method");

    protocol.primaryEndpoints = ReadEndpoints(root, "primary_endpoints", errors);
    protocol.secondaryEndpoints = ReadEndpoints(root, "secondary_endpoints", errors);
    protocol.safetyMonitoringPlan = root.optionalString("safety_monitoring_plan");
    protocol.estimatedCost = root.optionalNumber("estimated_cost");
    protocol.timelineMonths = root.optionalInteger("timeline_months");

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return protocol;
}

std::optional<NarrativeFinding> ProtocolJsonAdapter::ParseFinding(const json& finding,
                                                                  const std::string& path,
                                                                  std::vector<std::string>& errors) {
    if (!finding.is_object()) {
        errors.push_back(path + ": expected object");
        return std::nullopt;
    }

    const size_t errorsBefore = errors.size();
    JsonFieldReader reader(finding, path, errors);

    NarrativeFinding result;
    result.title = reader.string("title", "Finding");
    result.category = reader.enumeration<RiskCategory>("category", ParseCategory)
                          .value_or(RiskCategory::DesignCompleteness);
    result.severity = reader.enumeration<RiskLevel>("severity", ParseRiskLevel).value_or(RiskLevel::Medium);
    result.description = reader.string("description");
    result.evidence = reader.stringList("evidence");
    result.historicalTrialReferences = reader.stringList("historical_trial_references");
    result.quantifiedImpact = reader.optionalString("quantified_impact");
    result.recommendation = reader.string("recommendation", "Review and address");
    result.estimatedCostToFix = reader.optionalString("estimated_cost_to_fix");
    result.implementationDifficulty = reader.enumeration<Difficulty>("implementation_difficulty", ParseDifficulty);

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return result;
}

std::vector<NarrativeFinding> ProtocolJsonAdapter::ParseFindings(const json& document, std::vector<std::string>& errors) {
    std::vector<NarrativeFinding> findings;

    const json* items = &document;
    if (document.is_object()) {
        auto it = document.find("findings");
        if (it == document.end() || it->is_null()) return findings;
        items = &(*it);
    }
    if (!items->is_array()) {
        errors.push_back("findings: expected array");
        return findings;
    }

    size_t i = 0;
    for (const auto& item : *items) {
        std::ostringstream path;
        path << "findings[" << i++ << "]";
        auto finding = ParseFinding(item, path.str(), errors);
        if (finding) {
            findings.push_back(std::move(*finding));
        }
    }
    return findings;
}

} // namespace trialguard::infrastructure
