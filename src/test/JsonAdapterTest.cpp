#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileFindingsProvider.hpp"
#include "infrastructure/ProtocolJsonAdapter.hpp"
#include "infrastructure/ResultJsonWriter.hpp"
#include "infrastructure/TrialCorpusLoader.hpp"
#include "test/TestFixtures.hpp"

using json = nlohmann::json;
using namespace trialguard::domain;
using namespace trialguard::infrastructure;
using trialguard::test::Near;

namespace {

json ProtocolDocument() {
    return json::parse(R"({
        "metadata": {"trial_name": "HOPE", "sponsor": "UMRC", "phase": "phase 3", "year": 2024},
        "drug_profile": {"name": "Sertraline", "drug_class": "SSRI",
                         "known_contraindications": ["MAOIs"], "pharmacogenomic_markers": ["CYP2C19"]},
        "patient_population": {"age_range": "13-17", "disease_indication": "MDD", "therapeutic_area": "Psychiatry",
                               "exclusion_criteria": ["Bipolar disorder"]},
        "study_design": {"design_type": "Single Group", "blinding": "open-label", "placebo_run_in": true,
                         "duration_weeks": 12.0},
        "primary_endpoints": [{"name": "CDRS-R", "type": "primary", "timepoint": "Week 12"}],
        "statistical_plan": {"planned_enrollment": 150, "power_calculation_provided": false},
        "safety_monitoring_plan": "Weekly AE review",
        "estimated_cost": 2500000
    })");
}

bool Contains(const std::vector<std::string>& errors, const std::string& message) {
    return std::find(errors.begin(), errors.end(), message) != errors.end();
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path);
    ofs << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting JsonAdapter Test..." << std::endl;

    // Well-formed protocol with documented defaults
    {
        std::vector<std::string> errors;
        auto protocol = ProtocolJsonAdapter::ParseProtocol(ProtocolDocument(), errors);
        assert(errors.empty());
        assert(protocol);
        assert(protocol->metadata.phase == TrialPhase::Phase3);
        assert(protocol->metadata.year == 2024);
        assert(protocol->drugProfile.pharmacogenomicMarkers.size() == 1);
        assert(protocol->studyDesign.designType == StudyDesignType::SingleGroup);
        assert(protocol->studyDesign.placeboRunIn);
        assert(!protocol->studyDesign.placeboControlled);
        assert(protocol->studyDesign.durationWeeks == 12);
        assert(protocol->primaryEndpoints.size() == 1);
        assert(protocol->primaryEndpoints[0].timepoint == std::string("Week 12"));
        assert(!protocol->primaryEndpoints[0].measurementMethod);
        assert(protocol->statisticalPlan.plannedEnrollment == 150);
        assert(Near(protocol->statisticalPlan.alphaLevel, 0.05));
        assert(protocol->estimatedCost && Near(*protocol->estimatedCost, 2500000.0));
        assert(!protocol->timelineMonths);
        std::cout << "[PASS] Protocol document parsed with defaults." << std::endl;
    }

    // Type errors are reported, not coerced
    {
        auto document = ProtocolDocument();
        document["statistical_plan"]["planned_enrollment"] = "150";
        document["metadata"]["phase"] = "Phase 5";
        document["study_design"]["placebo_controlled"] = "yes";
        document["primary_endpoints"] = json::array({"CDRS-R"});

        std::vector<std::string> errors;
        auto protocol = ProtocolJsonAdapter::ParseProtocol(document, errors);
        assert(!protocol);
        assert(Contains(errors, "statistical_plan.planned_enrollment: expected integer"));
        assert(Contains(errors, "metadata.phase: unrecognized value 'Phase 5'"));
        assert(Contains(errors, "study_design.placebo_controlled: expected boolean"));
        assert(Contains(errors, "primary_endpoints[0]: expected object"));

        errors.clear();
        document = ProtocolDocument();
        document["statistical_plan"]["planned_enrollment"] = 150.5;
        assert(!ProtocolJsonAdapter::ParseProtocol(document, errors));
        assert(Contains(errors, "statistical_plan.planned_enrollment: expected integer"));

        errors.clear();
        document = ProtocolDocument();
        document["study_design"].erase("design_type");
        auto withoutDesign = ProtocolJsonAdapter::ParseProtocol(document, errors);
        assert(errors.empty());
        assert(withoutDesign && !withoutDesign->studyDesign.designType);

        errors.clear();
        assert(!ProtocolJsonAdapter::ParseProtocol(json::array(), errors));
        assert(Contains(errors, "protocol: expected object"));
        std::cout << "[PASS] Malformed fields are rejected at the boundary." << std::endl;
    }

    // Findings
    {
        auto document = json::parse(R"({"findings": [
            {"title": "Run-in", "category": "historical_precedent", "severity": "critical",
             "implementation_difficulty": "easy", "evidence": ["NCT-HIST-001"]},
            {"severity": "catastrophic"},
            {}
        ]})");
        std::vector<std::string> errors;
        auto findings = ProtocolJsonAdapter::ParseFindings(document, errors);
        assert(findings.size() == 2);
        assert(findings[0].severity == RiskLevel::Critical);
        assert(findings[0].implementationDifficulty == Difficulty::Easy);
        assert(findings[1].title == "Finding");
        assert(findings[1].severity == RiskLevel::Medium);
        assert(findings[1].category == RiskCategory::DesignCompleteness);
        assert(findings[1].recommendation == "Review and address");
        assert(!findings[1].implementationDifficulty);
        assert(errors.size() == 1);
        assert(errors[0] == "findings[1].severity: unrecognized value 'catastrophic'");

        errors.clear();
        assert(ProtocolJsonAdapter::ParseFindings(json::array(), errors).empty());
        assert(ProtocolJsonAdapter::ParseFindings(json::object(), errors).empty());
        assert(errors.empty());
        std::cout << "[PASS] Findings parsed; malformed entries skipped." << std::endl;
    }

    std::filesystem::path testRoot = "test_json_adapter_root";
    std::filesystem::create_directories(testRoot);

    // Corpus documents
    {
        auto document = json::parse(R"({
            "trials": [
                {"nct_id": "NCT1", "trial_name": "A", "phase": "Phase 3", "drug_class": "SSRI",
                 "therapeutic_area": "Psychiatry", "outcome": "failed", "planned_enrollment": 120,
                 "failure_reasons": ["High placebo response"], "tags": ["adolescent"]},
                {"nct_id": "NCT2", "planned_enrollment": "many"},
                {"nct_id": "NCT3", "outcome": "ongoing"},
                "not-a-trial"
            ],
            "failure_patterns": {"psychiatry": {"failure_rate": 0.55}}
        })");
        auto corpus = TrialCorpusLoader::Parse(document);
        assert(corpus.trials.size() == 2);
        assert(corpus.trials[0].outcome == TrialOutcome::Failed);
        assert(corpus.trials[0].plannedEnrollment == 120);
        assert(!corpus.trials[0].actualEnrollment);
        assert(corpus.trials[1].outcome == TrialOutcome::Unknown);
        assert(corpus.warnings.size() == 2);
        assert(corpus.warnings[0] == "Skipping trials[1]: trials[1].planned_enrollment: expected integer");
        assert(corpus.failurePatterns.contains("psychiatry"));

        WriteFile(testRoot / "broken.json", "{ \"trials\": [ ");
        std::string error;
        assert(!TrialCorpusLoader::LoadFile((testRoot / "broken.json").string(), error));
        assert(!error.empty());

        error.clear();
        assert(!TrialCorpusLoader::LoadFile((testRoot / "missing.json").string(), error));
        assert(error.find("Unable to open") != std::string::npos);
        std::cout << "[PASS] Corpus loader skips bad trials and rejects invalid JSON." << std::endl;
    }

    // Settings
    {
        auto defaults = ConfigLoader::Load((testRoot / "absent.json").string());
        assert(defaults.corpusPath == "data/historical_trials.json");
        assert(defaults.topK == 5);
        assert(defaults.comparisonCount == 1);
        assert(defaults.verbose);

        WriteFile(testRoot / "settings.json",
                  R"({"corpus_path": "corpus.json", "top_k": 3, "comparison_count": -2, "verbose": false, "theme": "dark"})");
        auto config = ConfigLoader::Load((testRoot / "settings.json").string());
        assert(config.corpusPath == "corpus.json");
        assert(config.topK == 3);
        assert(config.comparisonCount == 1);
        assert(!config.verbose);

        config.topK = 7;
        ConfigLoader::Save((testRoot / "settings.json").string(), config);
        std::ifstream ifs(testRoot / "settings.json");
        json saved = json::parse(ifs);
        assert(saved["top_k"] == 7);
        assert(saved["theme"] == "dark");

        WriteFile(testRoot / "bad_settings.json", "not json");
        auto fallback = ConfigLoader::Load((testRoot / "bad_settings.json").string());
        assert(fallback.topK == 5);
        std::cout << "[PASS] Settings loaded with defaults and saved preserving other keys." << std::endl;
    }

    // File-backed findings provider
    {
        WriteFile(testRoot / "findings.json",
                  R"([{"title": "Power", "severity": "high", "category": "design_completeness"}])");
        FileFindingsProvider provider((testRoot / "findings.json").string());
        auto findings = provider.findingsFor(Protocol{}, {});
        assert(findings && findings->size() == 1);
        assert((*findings)[0].severity == RiskLevel::High);

        FileFindingsProvider missing((testRoot / "nope.json").string());
        assert(!missing.findingsFor(Protocol{}, {}));
        std::cout << "[PASS] Findings provider reads its document." << std::endl;
    }

    // Result serialization
    {
        RiskScore score;
        score.overallScore = 42.5;
        score.riskLevel = RiskLevel::Medium;
        score.confidence = 0.7;
        score.categoryScores.push_back({RiskCategory::SafetyAlignment, 15.0, 1, {"Incomplete safety monitoring plan"}});
        auto out = ResultJsonWriter::ToJson(score);
        assert(out["risk_level"] == "medium");
        assert(out["category_scores"][0]["category"] == "safety_alignment");
        assert(out["category_scores"][0]["key_concerns"].size() == 1);

        ComparisonTable table;
        table.historicalTrial = {"NCT1", "A", TrialOutcome::Failed, TrialPhase::Phase2_3};
        table.rows.push_back({"Placebo Run-in", "No", "No", MatchStatus::RiskFactor, RiskLevel::High,
                              std::string("Trial failed without placebo run-in")});
        out = ResultJsonWriter::ToJson(table);
        assert(out["historical_trial"]["phase"] == "Phase 2/3");
        assert(out["historical_trial"]["outcome"] == "failed");
        assert(out["comparison_rows"][0]["match_status"] == "RISK_FACTOR");

        ValidationReport report;
        report.isValid = false;
        report.errors.push_back({"metadata.sponsor", "Missing required field: sponsor"});
        out = ResultJsonWriter::ToJson(report);
        assert(out["is_valid"] == false);
        assert(out["errors"][0]["field"] == "metadata.sponsor");
        std::cout << "[PASS] Results serialize to snake_case JSON." << std::endl;
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] JsonAdapter Test." << std::endl;
    return 0;
}
