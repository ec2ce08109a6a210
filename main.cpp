#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileFindingsProvider.hpp"
#include "infrastructure/ProtocolJsonAdapter.hpp"
#include "infrastructure/ResultJsonWriter.hpp"

using namespace trialguard;
using json = nlohmann::json;

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <settings.json>] <protocol.json> [findings.json]" << std::endl;
}

bool ReadJsonFile(const std::string& path, json& out) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        std::cerr << "[trialguard] Unable to open " << path << std::endl;
        return false;
    }
    try {
        out = json::parse(ifs);
    } catch (const json::parse_error& e) {
        std::cerr << "[trialguard] Invalid JSON in " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "settings.json";
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                PrintUsage(argv[0]);
                return 1;
            }
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            positional.emplace_back(argv[i]);
        }
    }
    if (positional.empty() || positional.size() > 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    const auto config = infrastructure::ConfigLoader::Load(configPath);

    // Composition root
    application::AppServices services;
    services.trialService = std::make_unique<application::HistoricalTrialService>(config.verbose);
    if (!services.trialService->loadFromFile(config.corpusPath)) {
        return 3;
    }

    std::shared_ptr<domain::NarrativeFindingsProvider> findings;
    if (positional.size() == 2) {
        findings = std::make_shared<infrastructure::FileFindingsProvider>(positional[1]);
    }
    services.validator = std::make_unique<application::ProtocolValidator>();
    services.analysisService = std::make_unique<application::TrialAnalysisService>(
        *services.trialService, findings, config.topK, config.comparisonCount);

    json document;
    if (!ReadJsonFile(positional[0], document)) {
        return 2;
    }

    std::vector<std::string> errors;
    auto protocol = infrastructure::ProtocolJsonAdapter::ParseProtocol(document, errors);
    if (!protocol) {
        for (const auto& error : errors) {
            std::cerr << "[trialguard] " << error << std::endl;
        }
        return 2;
    }

    const auto validation = services.validator->Validate(*protocol);
    if (config.verbose) {
        std::clog << "[trialguard] Protocol completeness " << validation.completenessScore
                  << " (" << validation.errors.size() << " errors, "
                  << validation.warnings.size() << " warnings)" << std::endl;
    }

    const auto analysis = services.analysisService->analyze(*protocol);

    json output;
    output["validation"] = infrastructure::ResultJsonWriter::ToJson(validation);
    output["analysis"] = infrastructure::ResultJsonWriter::ToJson(analysis);
    output["warnings"] = analysis.warnings;
    std::cout << output.dump(2) << std::endl;
    return 0;
}
