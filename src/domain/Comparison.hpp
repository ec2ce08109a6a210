/**
 * @file Comparison.hpp
 * @brief Value objects for the side-by-side protocol vs. historical trial comparison.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/RiskAssessment.hpp"
#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

enum class MatchStatus {
    ExactMatch,
    Match,
    Mismatch,
    RiskFactor  ///< Values are equal and the shared value is itself evidence of risk.
};

inline std::string MatchStatusToString(MatchStatus status) {
    switch (status) {
        case MatchStatus::ExactMatch: return "EXACT_MATCH";
        case MatchStatus::Match: return "MATCH";
        case MatchStatus::Mismatch: return "MISMATCH";
        case MatchStatus::RiskFactor: return "RISK_FACTOR";
    }
    return "MISMATCH";
}

struct ComparisonRow {
    std::string field;
    std::string current;
    std::string historical;
    MatchStatus matchStatus = MatchStatus::Mismatch;
    RiskLevel riskLevel = RiskLevel::Low;
    std::optional<std::string> explanation;
};

/**
 * @struct TrialSummary
 * @brief Identifying fields of the historical trial a table was built against.
 */
struct TrialSummary {
    std::string nctId;
    std::string trialName;
    TrialOutcome outcome = TrialOutcome::Unknown;
    std::optional<TrialPhase> phase;
};

struct ComparisonTable {
    TrialSummary historicalTrial;
    std::vector<ComparisonRow> rows;    ///< Always five rows, in fixed field order.
    double overallSimilarity = 0.0;     ///< Share of EXACT_MATCH/MATCH rows.
    std::string riskAssessment;
};

} // namespace trialguard::domain
