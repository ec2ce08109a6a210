/**
 * @file ResultJsonWriter.cpp
 * @brief Implementation of ResultJsonWriter.
 */

#include "infrastructure/ResultJsonWriter.hpp"

namespace trialguard::infrastructure {

using json = nlohmann::json;
using namespace trialguard::domain;

namespace {

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json PhaseToJson(const std::optional<TrialPhase>& phase) {
    return phase ? json(PhaseToString(*phase)) : json(nullptr);
}

json IssuesToJson(const std::vector<ValidationIssue>& issues) {
    json out = json::array();
    for (const auto& issue : issues) {
        out.push_back({{"field", issue.field}, {"message", issue.message}});
    }
    return out;
}

} // namespace

json ResultJsonWriter::ToJson(const TrialRecord& trial) {
    return {
        {"nct_id", trial.nctId},
        {"trial_name", trial.trialName},
        {"phase", PhaseToJson(trial.phase)},
        {"drug_class", trial.drugClass},
        {"therapeutic_area", trial.therapeuticArea},
        {"outcome", OutcomeToString(trial.outcome)},
        {"population_age", trial.populationAge},
        {"planned_enrollment", trial.plannedEnrollment},
        {"actual_enrollment", OptionalToJson(trial.actualEnrollment)},
        {"placebo_run_in", trial.placeboRunIn},
        {"study_design", trial.studyDesign},
        {"tags", trial.tags},
        {"key_learnings", trial.keyLearnings},
        {"failure_reasons", trial.failureReasons},
        {"sponsor", OptionalToJson(trial.sponsor)},
        {"year", OptionalToJson(trial.year)}
    };
}

json ResultJsonWriter::ToJson(const ScoredCandidate& candidate) {
    json out = ToJson(candidate.trial);
    out["similarity_score"] = candidate.similarityScore;
    return out;
}

json ResultJsonWriter::ToJson(const CategoryScore& score) {
    return {
        {"category", CategoryToString(score.category)},
        {"score", score.score},
        {"findings_count", score.findingsCount},
        {"key_concerns", score.keyConcerns}
    };
}

json ResultJsonWriter::ToJson(const RiskScore& score) {
    json categories = json::array();
    for (const auto& category : score.categoryScores) {
        categories.push_back(ToJson(category));
    }
    return {
        {"overall_score", score.overallScore},
        {"risk_level", RiskLevelToString(score.riskLevel)},
        {"confidence", score.confidence},
        {"category_scores", categories}
    };
}

json ResultJsonWriter::ToJson(const ComparisonTable& table) {
    json rows = json::array();
    for (const auto& row : table.rows) {
        rows.push_back({
            {"field", row.field},
            {"current", row.current},
            {"historical", row.historical},
            {"match_status", MatchStatusToString(row.matchStatus)},
            {"risk_level", RiskLevelToString(row.riskLevel)},
            {"explanation", OptionalToJson(row.explanation)}
        });
    }
    return {
        {"historical_trial", {
            {"nct_id", table.historicalTrial.nctId},
            {"trial_name", table.historicalTrial.trialName},
            {"outcome", OutcomeToString(table.historicalTrial.outcome)},
            {"phase", PhaseToJson(table.historicalTrial.phase)}
        }},
        {"comparison_rows", rows},
        {"overall_similarity", table.overallSimilarity},
        {"risk_assessment", table.riskAssessment}
    };
}

json ResultJsonWriter::ToJson(const NarrativeFinding& finding) {
    return {
        {"title", finding.title},
        {"category", CategoryToString(finding.category)},
        {"severity", RiskLevelToString(finding.severity)},
        {"description", finding.description},
        {"evidence", finding.evidence},
        {"historical_trial_references", finding.historicalTrialReferences},
        {"quantified_impact", OptionalToJson(finding.quantifiedImpact)},
        {"recommendation", finding.recommendation},
        {"estimated_cost_to_fix", OptionalToJson(finding.estimatedCostToFix)},
        {"implementation_difficulty", finding.implementationDifficulty
                                          ? json(DifficultyToString(*finding.implementationDifficulty))
                                          : json(nullptr)}
    };
}

json ResultJsonWriter::ToJson(const Recommendation& recommendation) {
    return {
        {"priority", recommendation.priority},
        {"title", recommendation.title},
        {"description", recommendation.description},
        {"expected_risk_reduction", recommendation.expectedRiskReduction},
        {"estimated_cost", OptionalToJson(recommendation.estimatedCost)},
        {"implementation_time", recommendation.implementationTime},
        {"difficulty", DifficultyToString(recommendation.difficulty)},
        {"impact_category", CategoryToString(recommendation.impactCategory)}
    };
}

json ResultJsonWriter::ToJson(const ValidationReport& report) {
    return {
        {"is_valid", report.isValid},
        {"errors", IssuesToJson(report.errors)},
        {"warnings", IssuesToJson(report.warnings)},
        {"completeness_score", report.completenessScore}
    };
}

json ResultJsonWriter::ToJson(const TrialAnalysis& analysis) {
    json out;
    out["risk_score"] = ToJson(analysis.riskScore);

    out["similar_trials"] = json::array();
    for (const auto& candidate : analysis.similarTrials) {
        out["similar_trials"].push_back(ToJson(candidate));
    }

    out["comparisons"] = json::array();
    for (const auto& table : analysis.comparisons) {
        out["comparisons"].push_back(ToJson(table));
    }

    out["findings"] = json::array();
    for (const auto& finding : analysis.findings) {
        out["findings"].push_back(ToJson(finding));
    }

    out["recommendations"] = json::array();
    for (const auto& recommendation : analysis.recommendations) {
        out["recommendations"].push_back(ToJson(recommendation));
    }
    return out;
}

} // namespace trialguard::infrastructure
