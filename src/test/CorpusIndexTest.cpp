#include <cassert>
#include <iostream>

#include "domain/CorpusIndex.hpp"
#include "test/TestFixtures.hpp"

using namespace trialguard::domain;
using trialguard::test::MakeTrial;

int main() {
    std::cout << "[Test] Starting CorpusIndex Test..." << std::endl;

    // Empty corpus
    {
        auto index = CorpusIndex::Build({});
        assert(index.empty());
        assert(index.byDrugClass("ssri").empty());
        assert(index.findById("NCT1") == nullptr);
    }

    std::vector<TrialRecord> records = {
        MakeTrial("NCT1", "SSRI", "Psychiatry", TrialPhase::Phase3, TrialOutcome::Failed),
        MakeTrial("NCT2", "  ssri ", "psychiatry", TrialPhase::Phase2, TrialOutcome::Success),
        MakeTrial("NCT3", "PD-L1 inhibitor", "Oncology", std::nullopt, TrialOutcome::Unknown),
        MakeTrial("NCT4", "", "", TrialPhase::Phase3, TrialOutcome::Terminated),
    };
    records[0].tags = {"Adolescent", "adolescent", "placebo_response"};
    records[2].tags = {"biomarker"};

    auto index = CorpusIndex::Build(records);
    assert(index.size() == 4);

    // Lower-cased, trimmed keys
    assert(index.byDrugClass("SSRI").size() == 2);
    assert(index.byDrugClass("ssri")[0] == 0);
    assert(index.byDrugClass("ssri")[1] == 1);
    assert(index.byTherapeuticArea("PSYCHIATRY").size() == 2);
    assert(index.byPhase(TrialPhase::Phase3).size() == 2);
    assert(index.byOutcome(TrialOutcome::Failed).size() == 1);
    assert(index.byOutcome(TrialOutcome::Unknown).size() == 1);
    std::cout << "[PASS] Keys are normalized and buckets keep corpus order." << std::endl;

    // Duplicate tags within one record index once
    assert(index.byTag("ADOLESCENT").size() == 1);
    assert(index.byTag("biomarker").size() == 1);
    assert(index.byTag("unknown-tag").empty());

    // Empty fields are skipped in that dimension only
    assert(index.byDrugClass("").empty());
    assert(index.findById("NCT4") != nullptr);
    assert(index.byOutcome(TrialOutcome::Terminated).size() == 1);
    std::cout << "[PASS] Empty key fields are left out of their dimension." << std::endl;

    // Input records are untouched
    assert(records[1].drugClass == "  ssri ");

    // Later duplicate wins and keeps its own position
    {
        std::vector<TrialRecord> dupes = {
            MakeTrial("NCT1", "SSRI", "Psychiatry", TrialPhase::Phase3, TrialOutcome::Failed),
            MakeTrial("NCT2", "SNRI", "Psychiatry", TrialPhase::Phase3, TrialOutcome::Success),
            MakeTrial("NCT1", "Lithium", "Psychiatry", TrialPhase::Phase2, TrialOutcome::Success),
        };
        auto dedup = CorpusIndex::Build(dupes);
        assert(dedup.size() == 2);
        const TrialRecord* winner = dedup.findById("NCT1");
        assert(winner != nullptr);
        assert(winner->drugClass == "Lithium");
        assert(dedup.records()[0].nctId == "NCT2");
        assert(dedup.records()[1].nctId == "NCT1");
        assert(dedup.byDrugClass("ssri").empty());
        assert(dedup.byOutcome(TrialOutcome::Failed).empty());
        std::cout << "[PASS] Duplicate identifiers resolve to the later record." << std::endl;
    }

    std::cout << "[PASS] CorpusIndex Test." << std::endl;
    return 0;
}
