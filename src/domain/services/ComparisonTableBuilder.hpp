/**
 * @file ComparisonTableBuilder.hpp
 * @brief Domain service producing the field-by-field protocol vs. historical trial table.
 */

#pragma once

#include <string>
#include <utility>

#include "domain/Comparison.hpp"
#include "domain/Protocol.hpp"
#include "domain/TrialRecord.hpp"

namespace trialguard::domain {

/**
 * @class ComparisonTableBuilder
 * @brief Compares population age, drug class, study design, placebo run-in and sample size.
 */
class ComparisonTableBuilder {
public:
    /** @brief Enrollment gap below which sample sizes are considered comparable. */
    static constexpr int kSampleSizeTolerance = 50;

    /**
     * @brief Builds the five-row comparison table, rows in fixed order.
     */
    static ComparisonTable Build(const Protocol& protocol, const TrialRecord& historical);

    /**
     * @brief Generic rule for text fields.
     * @param isRiskFactor Set when equal values are themselves a documented risk.
     * @return Match status and the risk level attached to it.
     */
    static std::pair<MatchStatus, RiskLevel> CompareText(const std::string& current,
                                                         const std::string& historical,
                                                         bool isRiskFactor = false);

    /**
     * @brief Fixed three-way narrative over the finished rows.
     */
    static std::string AssessRisk(const ComparisonTable& table);
};

} // namespace trialguard::domain
