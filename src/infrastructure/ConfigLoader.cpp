/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace trialguard::infrastructure {

namespace {

size_t ReadCount(const nlohmann::json& j, const char* key, size_t fallback) {
    if (!j.contains(key)) return fallback;
    const auto& value = j[key];
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<long long>() >= 0)) {
        return value.get<size_t>();
    }
    std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "', expected a non-negative integer." << std::endl;
    return fallback;
}

} // namespace

EngineConfig ConfigLoader::Load(const std::string& configPath) {
    EngineConfig config;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("corpus_path") && j["corpus_path"].is_string()) {
            config.corpusPath = j["corpus_path"].get<std::string>();
        }
        config.topK = ReadCount(j, "top_k", config.topK);
        config.comparisonCount = ReadCount(j, "comparison_count", config.comparisonCount);
        if (j.contains("verbose") && j["verbose"].is_boolean()) {
            config.verbose = j["verbose"].get<bool>();
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return EngineConfig{};
    }

    return config;
}

void ConfigLoader::Save(const std::string& configPath, const EngineConfig& config) {
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["corpus_path"] = config.corpusPath;
    j["top_k"] = config.topK;
    j["comparison_count"] = config.comparisonCount;
    j["verbose"] = config.verbose;

    try {
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << ": " << e.what() << std::endl;
    }
}

} // namespace trialguard::infrastructure
