#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/TrialAnalysisService.hpp"
#include "test/TestFixtures.hpp"

using namespace trialguard::domain;
using namespace trialguard::application;
using trialguard::test::MakeProtocol;
using trialguard::test::MakeTrial;
using trialguard::test::Near;

// Mock findings provider
class MockFindingsProvider : public NarrativeFindingsProvider {
public:
    std::optional<std::vector<NarrativeFinding>> findingsFor(const Protocol&,
                                                             const std::vector<ScoredCandidate>& similarTrials) override {
        lastSimilarCount = similarTrials.size();
        NarrativeFinding low;
        low.title = "Centralize rating";
        low.severity = RiskLevel::Low;
        low.implementationDifficulty = Difficulty::Easy;

        NarrativeFinding critical;
        critical.title = "Add placebo run-in";
        critical.severity = RiskLevel::Critical;
        critical.implementationDifficulty = Difficulty::Easy;

        NarrativeFinding medium;
        medium.title = "Genotype at screening";
        medium.severity = RiskLevel::Medium;
        medium.implementationDifficulty = Difficulty::Hard;
        return std::vector<NarrativeFinding>{low, critical, medium};
    }

    size_t lastSimilarCount = 0;
};

class ThrowingFindingsProvider : public NarrativeFindingsProvider {
public:
    std::optional<std::vector<NarrativeFinding>> findingsFor(const Protocol&,
                                                             const std::vector<ScoredCandidate>&) override {
        throw std::runtime_error("upstream timeout");
    }
};

// Fails only for protocols sponsored by "Offline Sponsor".
class SelectiveFindingsProvider : public NarrativeFindingsProvider {
public:
    std::optional<std::vector<NarrativeFinding>> findingsFor(const Protocol& protocol,
                                                             const std::vector<ScoredCandidate>&) override {
        if (protocol.metadata.sponsor == "Offline Sponsor") {
            throw std::runtime_error("sponsor feed unavailable");
        }
        return std::vector<NarrativeFinding>{};
    }
};

class EmptyFindingsProvider : public NarrativeFindingsProvider {
public:
    std::optional<std::vector<NarrativeFinding>> findingsFor(const Protocol&,
                                                             const std::vector<ScoredCandidate>&) override {
        return std::nullopt;
    }
};

int main() {
    std::cout << "[Test] Starting TrialAnalysisService Test..." << std::endl;

    HistoricalTrialService trials(false);
    auto failed = MakeTrial("NCT1", "SSRI", "Psychiatry", TrialPhase::Phase3, TrialOutcome::Failed, "12-17");
    failed.failureReasons = {"High placebo response"};
    trials.replaceCorpus({
        failed,
        MakeTrial("NCT2", "SSRI", "Psychiatry", TrialPhase::Phase3, TrialOutcome::Success, "18-65"),
        MakeTrial("NCT3", "SSRI", "Psychiatry", TrialPhase::Phase2, TrialOutcome::Success, "18-65"),
        MakeTrial("NCT4", "Anticonvulsant", "Neurology", TrialPhase::Phase3, TrialOutcome::Failed),
    });

    const auto protocol = MakeProtocol();

    // Query derived from the protocol
    {
        auto query = TrialAnalysisService::BuildQuery(protocol, 4);
        assert(query.drugClass == "SSRI");
        assert(query.therapeuticArea == std::string("Psychiatry"));
        assert(query.phase == TrialPhase::Phase3);
        assert(query.populationAge == std::string("13-17"));
        assert(query.topK == 4);

        auto blank = MakeProtocol();
        blank.patientPopulation.therapeuticArea = " ";
        blank.patientPopulation.ageRange = "";
        blank.metadata.phase.reset();
        query = TrialAnalysisService::BuildQuery(blank, 5);
        assert(!query.therapeuticArea);
        assert(!query.populationAge);
        assert(!query.phase);
    }

    // Full pipeline with findings
    {
        auto provider = std::make_shared<MockFindingsProvider>();
        TrialAnalysisService service(trials, provider, 5, 2);
        auto analysis = service.analyze(protocol);

        assert(analysis.similarTrials.size() == 3);
        assert(analysis.similarTrials[0].trial.nctId == "NCT1");
        assert(provider->lastSimilarCount == 3);

        assert(analysis.comparisons.size() == 2);
        assert(analysis.comparisons[0].historicalTrial.nctId == "NCT1");
        assert(analysis.comparisons[0].rows[3].matchStatus == MatchStatus::RiskFactor);

        assert(analysis.findings.size() == 3);
        assert(analysis.recommendations.size() == 3);
        assert(analysis.recommendations[0].title == "Add placebo run-in");
        assert(analysis.recommendations[0].priority == 1);
        assert(analysis.recommendations[2].title == "Centralize rating");

        assert(analysis.riskScore.categoryScores.size() == 3);
        assert(analysis.riskScore.overallScore >= 0.0 && analysis.riskScore.overallScore <= 100.0);
        // 3 matched trials (+0.2) and 3 findings (+0.2)
        assert(Near(analysis.riskScore.confidence, 0.9));
        assert(analysis.warnings.empty());
        std::cout << "[PASS] Analysis combines search, findings, scoring and comparisons." << std::endl;
    }

    // Failing collaborators never block scoring
    {
        TrialAnalysisService throwing(trials, std::make_shared<ThrowingFindingsProvider>());
        auto analysis = throwing.analyze(protocol);
        assert(analysis.findings.empty());
        assert(analysis.recommendations.empty());
        assert(analysis.comparisons.size() == 1);
        assert(Near(analysis.riskScore.confidence, 0.7));
        assert(analysis.warnings.size() == 1);
        assert(analysis.warnings[0] == "Findings provider failed: upstream timeout");

        TrialAnalysisService empty(trials, std::make_shared<EmptyFindingsProvider>());
        analysis = empty.analyze(protocol);
        assert(analysis.findings.empty());
        assert(analysis.warnings.size() == 1);

        TrialAnalysisService none(trials, nullptr);
        analysis = none.analyze(protocol);
        assert(analysis.findings.empty());
        assert(analysis.warnings.empty());
        std::cout << "[PASS] Provider failures degrade to an empty findings list." << std::endl;
    }

    // Warnings belong to the analysis that produced them
    {
        TrialAnalysisService shared(trials, std::make_shared<SelectiveFindingsProvider>());
        auto offline = MakeProtocol();
        offline.metadata.sponsor = "Offline Sponsor";

        auto failedAnalysis = shared.analyze(offline);
        auto cleanAnalysis = shared.analyze(protocol);
        assert(failedAnalysis.warnings.size() == 1);
        assert(failedAnalysis.warnings[0] == "Findings provider failed: sponsor feed unavailable");
        assert(cleanAnalysis.warnings.empty());

        std::vector<TrialAnalysis> results(8);
        std::vector<std::thread> callers;
        for (size_t i = 0; i < results.size(); ++i) {
            callers.emplace_back([&, i]() {
                results[i] = shared.analyze(i % 2 == 0 ? offline : protocol);
            });
        }
        for (auto& t : callers) {
            if (t.joinable()) t.join();
        }
        for (size_t i = 0; i < results.size(); ++i) {
            assert(results[i].warnings.size() == (i % 2 == 0 ? 1u : 0u));
        }
        std::cout << "[PASS] Concurrent analyses keep their own warnings." << std::endl;
    }

    // Empty corpus
    {
        HistoricalTrialService emptyCorpus(false);
        TrialAnalysisService service(emptyCorpus, nullptr);
        auto analysis = service.analyze(protocol);
        assert(analysis.similarTrials.empty());
        assert(analysis.comparisons.empty());
        assert(Near(analysis.riskScore.categoryScores[0].score, 50.0));
        assert(Near(analysis.riskScore.confidence, 0.5));
        std::cout << "[PASS] Empty corpus yields neutral historical precedent." << std::endl;
    }

    std::cout << "[PASS] TrialAnalysisService Test." << std::endl;
    return 0;
}
