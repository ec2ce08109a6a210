/**
 * @file FileFindingsProvider.cpp
 * @brief Implementation of FileFindingsProvider.
 */

#include "infrastructure/FileFindingsProvider.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ProtocolJsonAdapter.hpp"

using json = nlohmann::json;

namespace trialguard::infrastructure {

FileFindingsProvider::FileFindingsProvider(const std::string& path) : m_path(path) {}

std::optional<std::vector<domain::NarrativeFinding>> FileFindingsProvider::findingsFor(
    const domain::Protocol& /*protocol*/,
    const std::vector<domain::ScoredCandidate>& /*similarTrials*/) {
    std::ifstream ifs(m_path);
    if (!ifs.is_open()) {
        std::cerr << "[FileFindingsProvider] Unable to open " << m_path << std::endl;
        return std::nullopt;
    }

    json document;
    try {
        document = json::parse(ifs);
    } catch (const json::parse_error& e) {
        std::cerr << "[FileFindingsProvider] Invalid JSON in " << m_path << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    std::vector<std::string> errors;
    auto findings = ProtocolJsonAdapter::ParseFindings(document, errors);
    for (const auto& error : errors) {
        std::cerr << "[FileFindingsProvider] Skipped: " << error << std::endl;
    }
    return findings;
}

} // namespace trialguard::infrastructure
