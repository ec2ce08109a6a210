/**
 * @file ProtocolJsonAdapter.hpp
 * @brief Boundary adapter from request JSON to strict Protocol and NarrativeFinding types.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "domain/NarrativeFinding.hpp"
#include "domain/Protocol.hpp"

namespace trialguard::infrastructure {

/**
 * @class ProtocolJsonAdapter
 * @brief Fills documented defaults for absent fields and rejects wrongly-typed ones.
 */
class ProtocolJsonAdapter {
public:
    /**
     * @brief Converts a nested protocol document (metadata, drug_profile, patient_population, ...).
     * @param errors Receives one message per malformed field ("statistical_plan.planned_enrollment: expected integer").
     * @return The protocol, or nullopt if any field was malformed.
     */
    static std::optional<domain::Protocol> ParseProtocol(const nlohmann::json& document,
                                                         std::vector<std::string>& errors);

    /**
     * @brief Converts one finding object.
     * @return The finding, or nullopt if any field was malformed.
     */
    static std::optional<domain::NarrativeFinding> ParseFinding(const nlohmann::json& finding,
                                                                const std::string& path,
                                                                std::vector<std::string>& errors);

    /**
     * @brief Converts a findings array, or an object with a "findings" array.
     *
     * Malformed findings are skipped; their messages land in @p errors.
     */
    static std::vector<domain::NarrativeFinding> ParseFindings(const nlohmann::json& document,
                                                               std::vector<std::string>& errors);
};

} // namespace trialguard::infrastructure
