/**
 * @file ProtocolValidator.cpp
 * @brief Implementation of ProtocolValidator.
 */

#include "application/ProtocolValidator.hpp"

#include <algorithm>
#include <cmath>

#include "domain/TextMatching.hpp"

namespace trialguard::application {

using namespace trialguard::domain;

void ProtocolValidator::AddError(ValidationReport& report, const std::string& field, const std::string& message) const {
    report.errors.push_back({field, message});
}

void ProtocolValidator::AddWarning(ValidationReport& report, const std::string& field, const std::string& message) const {
    report.warnings.push_back({field, message});
}

void ProtocolValidator::RequireText(ValidationReport& report, const std::string& section,
                                    const std::string& field, const std::string& value) const {
    if (Normalize(value).empty()) {
        AddError(report, section + "." + field, "Missing required field: " + field);
    }
}

ValidationReport ProtocolValidator::Validate(const Protocol& protocol) const {
    ValidationReport report;

    RequireText(report, "metadata", "trial_name", protocol.metadata.trialName);
    RequireText(report, "metadata", "sponsor", protocol.metadata.sponsor);
    if (!protocol.metadata.phase) {
        AddError(report, "metadata.phase", "Missing required field: phase");
    }

    RequireText(report, "drug_profile", "name", protocol.drugProfile.name);
    RequireText(report, "drug_profile", "drug_class", protocol.drugProfile.drugClass);

    RequireText(report, "patient_population", "disease_indication", protocol.patientPopulation.diseaseIndication);
    RequireText(report, "patient_population", "therapeutic_area", protocol.patientPopulation.therapeuticArea);
    RequireText(report, "patient_population", "age_range", protocol.patientPopulation.ageRange);

    if (!protocol.studyDesign.designType) {
        AddError(report, "study_design.design_type", "Missing required field: design_type");
    }
    RequireText(report, "study_design", "blinding", protocol.studyDesign.blinding);

    if (protocol.statisticalPlan.plannedEnrollment <= 0) {
        AddError(report, "statistical_plan.planned_enrollment", "Missing required field: planned_enrollment");
    }

    // Recommended fields
    if (!protocol.safetyMonitoringPlan || Normalize(*protocol.safetyMonitoringPlan).empty()) {
        AddWarning(report, "safety_monitoring_plan", "Safety monitoring plan not provided");
    }
    if (protocol.primaryEndpoints.empty()) {
        AddWarning(report, "primary_endpoints", "No primary endpoints defined");
    }
    if (!protocol.statisticalPlan.powerCalculationProvided) {
        AddWarning(report, "statistical_plan.power_calculation_provided", "No power calculation provided");
    }

    const double filled = static_cast<double>(kTotalFields - static_cast<int>(report.errors.size()));
    double completeness = std::clamp(filled / kTotalFields, 0.0, 1.0);
    completeness -= kWarningPenalty * static_cast<double>(report.warnings.size());
    completeness = std::max(0.0, completeness);

    report.completenessScore = std::round(completeness * 100.0) / 100.0;
    report.isValid = report.errors.empty();
    return report;
}

} // namespace trialguard::application
