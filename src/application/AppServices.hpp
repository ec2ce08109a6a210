/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/HistoricalTrialService.hpp"
#include "application/ProtocolValidator.hpp"
#include "application/TrialAnalysisService.hpp"

namespace trialguard::application {

/**
 * @note Members are declared in construction order; analysisService holds a
 * reference to trialService and is destroyed first.
 */
struct AppServices {
    std::unique_ptr<HistoricalTrialService> trialService;
    std::unique_ptr<ProtocolValidator> validator;
    std::unique_ptr<TrialAnalysisService> analysisService;
};

} // namespace trialguard::application
