/**
 * @file ComparisonTableBuilder.cpp
 * @brief Implementation of ComparisonTableBuilder.
 */

#include "domain/services/ComparisonTableBuilder.hpp"

#include <algorithm>
#include <cstdlib>

#include "domain/TextMatching.hpp"

namespace trialguard::domain {

namespace {

std::string OrUnknown(const std::string& value) {
    return value.empty() ? std::string("Unknown") : value;
}

std::string YesNo(bool flag) {
    return flag ? "Yes" : "No";
}

ComparisonRow MakeTextRow(const std::string& field, const std::string& current, const std::string& historical) {
    ComparisonRow row;
    row.field = field;
    row.current = OrUnknown(current);
    row.historical = OrUnknown(historical);
    auto [status, risk] = ComparisonTableBuilder::CompareText(row.current, row.historical);
    row.matchStatus = status;
    row.riskLevel = risk;
    return row;
}

} // namespace

std::pair<MatchStatus, RiskLevel> ComparisonTableBuilder::CompareText(const std::string& current,
                                                                      const std::string& historical,
                                                                      bool isRiskFactor) {
    const std::string a = Normalize(current);
    const std::string b = Normalize(historical);
    if (a == b) {
        if (isRiskFactor) return {MatchStatus::RiskFactor, RiskLevel::High};
        return {MatchStatus::ExactMatch, RiskLevel::Low};
    }
    if (ContainsEitherWay(a, b)) {
        return {MatchStatus::Match, RiskLevel::Medium};
    }
    return {MatchStatus::Mismatch, RiskLevel::Low};
}

ComparisonTable ComparisonTableBuilder::Build(const Protocol& protocol, const TrialRecord& historical) {
    ComparisonTable table;
    table.historicalTrial = {OrUnknown(historical.nctId), OrUnknown(historical.trialName),
                             historical.outcome, historical.phase};

    table.rows.push_back(MakeTextRow("Population Age", protocol.patientPopulation.ageRange, historical.populationAge));
    table.rows.push_back(MakeTextRow("Drug Class", protocol.drugProfile.drugClass, historical.drugClass));
    const auto& designType = protocol.studyDesign.designType;
    table.rows.push_back(MakeTextRow("Study Design", designType ? DesignTypeToString(*designType) : std::string(),
                                     historical.studyDesign));

    // Both sides skipped the run-in and the historical trial failed.
    const bool currentRunIn = protocol.studyDesign.placeboRunIn;
    const bool isRisk = !currentRunIn && !historical.placeboRunIn && historical.outcome == TrialOutcome::Failed;
    ComparisonRow placebo;
    placebo.field = "Placebo Run-in";
    placebo.current = YesNo(currentRunIn);
    placebo.historical = YesNo(historical.placeboRunIn);
    auto [placeboStatus, placeboRisk] = CompareText(placebo.current, placebo.historical, isRisk);
    placebo.matchStatus = placeboStatus;
    placebo.riskLevel = placeboRisk;
    if (isRisk) {
        placebo.explanation = "Trial failed without placebo run-in";
    }
    table.rows.push_back(placebo);

    const int currentN = protocol.statisticalPlan.plannedEnrollment;
    const int historicalN = historical.plannedEnrollment;
    ComparisonRow sampleSize;
    sampleSize.field = "Sample Size";
    sampleSize.current = std::to_string(currentN);
    sampleSize.historical = std::to_string(historicalN);
    sampleSize.matchStatus = std::abs(currentN - historicalN) < kSampleSizeTolerance ? MatchStatus::Match : MatchStatus::Mismatch;
    sampleSize.riskLevel = currentN < historicalN ? RiskLevel::Medium : RiskLevel::Low;
    table.rows.push_back(sampleSize);

    const auto similar = std::count_if(table.rows.begin(), table.rows.end(), [](const ComparisonRow& row) {
        return row.matchStatus == MatchStatus::ExactMatch || row.matchStatus == MatchStatus::Match;
    });
    table.overallSimilarity = static_cast<double>(similar) / static_cast<double>(table.rows.size());
    table.riskAssessment = AssessRisk(table);
    return table;
}

std::string ComparisonTableBuilder::AssessRisk(const ComparisonTable& table) {
    const auto riskFactors = std::count_if(table.rows.begin(), table.rows.end(), [](const ComparisonRow& row) {
        return row.matchStatus == MatchStatus::RiskFactor;
    });
    if (riskFactors > 0) {
        return "High similarity to failed trial (" + std::to_string(riskFactors) + " risk factors)";
    }
    if (table.overallSimilarity > 0.7) {
        return "High similarity to historical trial";
    }
    return "Moderate similarity";
}

} // namespace trialguard::domain
