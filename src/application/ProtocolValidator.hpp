/**
 * @file ProtocolValidator.hpp
 * @brief Completeness gate run on a protocol before analysis.
 */

#pragma once

#include <string>

#include "domain/Protocol.hpp"
#include "domain/ValidationReport.hpp"

namespace trialguard::application {

/**
 * @class ProtocolValidator
 * @brief Flags missing required fields (errors) and missing recommended ones (warnings).
 */
class ProtocolValidator {
public:
    /** @brief Nominal count of important protocol fields the completeness score is measured against. */
    static constexpr int kTotalFields = 25;
    static constexpr double kWarningPenalty = 0.02;

    /**
     * @brief Validate a protocol.
     * @return Report; valid iff there are no errors.
     */
    domain::ValidationReport Validate(const domain::Protocol& protocol) const;

private:
    void AddError(domain::ValidationReport& report, const std::string& field, const std::string& message) const;
    void AddWarning(domain::ValidationReport& report, const std::string& field, const std::string& message) const;
    void RequireText(domain::ValidationReport& report, const std::string& section,
                     const std::string& field, const std::string& value) const;
};

} // namespace trialguard::application
