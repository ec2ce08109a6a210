/**
 * @file ValidationReport.hpp
 * @brief Outcome of a protocol completeness check.
 */

#pragma once

#include <string>
#include <vector>

namespace trialguard::domain {

struct ValidationIssue {
    std::string field;      ///< Dotted path, e.g. "drug_profile.drug_class".
    std::string message;
};

struct ValidationReport {
    bool isValid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
    double completenessScore = 1.0;     ///< 0-1, two decimals.
};

} // namespace trialguard::domain
