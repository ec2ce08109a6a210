/**
 * @file TrialCorpusLoader.cpp
 * @brief Implementation of TrialCorpusLoader.
 */

#include "infrastructure/TrialCorpusLoader.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "infrastructure/JsonFieldReader.hpp"

namespace trialguard::infrastructure {

using json = nlohmann::json;

std::optional<CorpusDocument> TrialCorpusLoader::LoadFile(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Unable to open corpus file: " + path;
        return std::nullopt;
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        error = "Invalid JSON in " + path + ": " + e.what();
        return std::nullopt;
    }

    if (!document.is_object()) {
        error = "Corpus document must be a JSON object: " + path;
        return std::nullopt;
    }
    return Parse(document);
}

CorpusDocument TrialCorpusLoader::Parse(const json& document) {
    CorpusDocument result;

    auto trials = document.find("trials");
    if (trials != document.end() && trials->is_array()) {
        size_t i = 0;
        for (const auto& entry : *trials) {
            std::ostringstream path;
            path << "trials[" << i++ << "]";

            std::vector<std::string> errors;
            auto record = ParseTrial(entry, path.str(), errors);
            if (record) {
                result.trials.push_back(std::move(*record));
                continue;
            }
            std::ostringstream warning;
            warning << "Skipping " << path.str() << ": ";
            for (size_t e = 0; e < errors.size(); ++e) {
                if (e > 0) warning << "; ";
                warning << errors[e];
            }
            result.warnings.push_back(warning.str());
        }
    } else if (trials != document.end() && !trials->is_null()) {
        result.warnings.push_back("'trials' is not an array; corpus is empty.");
    }

    auto patterns = document.find("failure_patterns");
    if (patterns != document.end() && patterns->is_object()) {
        result.failurePatterns = *patterns;
    }

    return result;
}

std::optional<domain::TrialRecord> TrialCorpusLoader::ParseTrial(const json& trial,
                                                                 const std::string& path,
                                                                 std::vector<std::string>& errors) {
    if (!trial.is_object()) {
        errors.push_back(path + ": expected object");
        return std::nullopt;
    }

    const size_t errorsBefore = errors.size();
    JsonFieldReader reader(trial, path, errors);

    domain::TrialRecord record;
    record.nctId = reader.string("nct_id");
    record.trialName = reader.string("trial_name");
    record.phase = reader.enumeration<domain::TrialPhase>("phase", domain::ParsePhase);
    record.drugClass = reader.string("drug_class");
    record.therapeuticArea = reader.string("therapeutic_area");
    record.outcome = reader.enumeration<domain::TrialOutcome>("outcome", domain::ParseOutcome)
                         .value_or(domain::TrialOutcome::Unknown);
    record.populationAge = reader.string("population_age");
    record.plannedEnrollment = reader.integer("planned_enrollment", 0);
    record.actualEnrollment = reader.optionalInteger("actual_enrollment");
    record.placeboRunIn = reader.boolean("placebo_run_in", false);
    record.studyDesign = reader.string("study_design");
    record.tags = reader.stringList("tags");
    record.keyLearnings = reader.stringList("key_learnings");
    record.failureReasons = reader.stringList("failure_reasons");
    record.sponsor = reader.optionalString("sponsor");
    record.year = reader.optionalInteger("year");

    if (errors.size() != errorsBefore) {
        return std::nullopt;
    }
    return record;
}

} // namespace trialguard::infrastructure
