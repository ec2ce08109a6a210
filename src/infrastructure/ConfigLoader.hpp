/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading engine configuration (settings.json).
 *
 * Provides a unified way to access the corpus location and search defaults
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <string>

namespace trialguard::infrastructure {

/**
 * @struct EngineConfig
 * @brief Runtime settings. Every field has a usable default.
 */
struct EngineConfig {
    std::string corpusPath = "data/historical_trials.json";
    size_t topK = 5;                ///< Similar trials returned per analysis.
    size_t comparisonCount = 1;     ///< Comparison tables built, starting from the best match.
    bool verbose = true;            ///< Emit informational log lines.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Parsed settings; defaults for any key that is absent or invalid, or when the file is missing.
     */
    static EngineConfig Load(const std::string& configPath);

    /**
     * @brief Writes the settings back, preserving unrelated keys already in the file.
     */
    static void Save(const std::string& configPath, const EngineConfig& config);
};

} // namespace trialguard::infrastructure
