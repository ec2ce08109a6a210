#include <cassert>
#include <iostream>

#include "domain/services/RecommendationPrioritizer.hpp"
#include "test/TestFixtures.hpp"

using namespace trialguard::domain;
using trialguard::test::Near;

namespace {

NarrativeFinding Finding(const std::string& title, RiskLevel severity, std::optional<Difficulty> difficulty) {
    NarrativeFinding finding;
    finding.title = title;
    finding.severity = severity;
    finding.implementationDifficulty = difficulty;
    finding.recommendation = "Fix " + title;
    finding.category = RiskCategory::DesignCompleteness;
    return finding;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RecommendationPrioritizer Test..." << std::endl;

    assert(RecommendationPrioritizer::prioritize({}).empty());

    std::vector<NarrativeFinding> findings = {
        Finding("B", RiskLevel::High, Difficulty::Medium),      // 18^2 * 70 / 1e4 = 2.268
        Finding("C", RiskLevel::Medium, Difficulty::Hard),      // 0.4
        Finding("A", RiskLevel::Critical, Difficulty::Easy),    // 6.25
        Finding("D", RiskLevel::Low, Difficulty::Easy),         // 0.25
        Finding("E", RiskLevel::Medium, std::nullopt),          // treated as medium: 0.7
        Finding("F", RiskLevel::Critical, Difficulty::Hard),    // 2.5
    };
    findings[2].estimatedCostToFix = "$50K";
    findings[2].category = RiskCategory::HistoricalPrecedent;

    auto ranked = RecommendationPrioritizer::prioritize(findings);
    assert(ranked.size() == 6);

    const char* expectedOrder[] = {"A", "F", "B", "E", "C", "D"};
    for (size_t i = 0; i < ranked.size(); ++i) {
        assert(ranked[i].title == expectedOrder[i]);
        assert(ranked[i].priority == static_cast<int>(i) + 1);
    }
    std::cout << "[PASS] Ranked by reduction^2 * feasibility with priorities 1..N." << std::endl;

    const auto& top = ranked[0];
    assert(Near(top.expectedRiskReduction, 25.0));
    assert(top.difficulty == Difficulty::Easy);
    assert(top.implementationTime == "1-2 weeks");
    assert(top.estimatedCost && *top.estimatedCost == "$50K");
    assert(top.description == "Fix A");
    assert(top.impactCategory == RiskCategory::HistoricalPrecedent);

    assert(ranked[1].implementationTime == "3-6 months");
    assert(ranked[3].difficulty == Difficulty::Medium);
    assert(ranked[3].implementationTime == "1-2 months");
    assert(Near(ranked[5].expectedRiskReduction, 5.0));
    std::cout << "[PASS] Recommendation fields derived from findings." << std::endl;

    // Ties keep input order; untitled findings get a placeholder
    {
        auto tied = RecommendationPrioritizer::prioritize({
            Finding("first", RiskLevel::Medium, Difficulty::Easy),
            Finding("", RiskLevel::Medium, Difficulty::Easy),
            Finding("third", RiskLevel::Medium, Difficulty::Easy),
        });
        assert(tied[0].title == "first");
        assert(tied[1].title == "Untitled recommendation");
        assert(tied[2].title == "third");
        std::cout << "[PASS] Ties keep input order." << std::endl;
    }

    std::cout << "[PASS] RecommendationPrioritizer Test." << std::endl;
    return 0;
}
