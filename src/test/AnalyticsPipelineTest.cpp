#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/AnalyticsPipeline.hpp"
#include "application/IdentityAnalyticsService.hpp"
#include "domain/AnalyticsErrors.hpp"
#include "test/TestEvents.hpp"

using namespace healthiq::domain;
using namespace healthiq::test;
using healthiq::application::AnalyticsPipeline;
using healthiq::application::AnalyticsResult;
using healthiq::application::AnalyticsStores;
using healthiq::application::IdentityAnalyticsService;
using healthiq::infrastructure::AlertStore;
using healthiq::infrastructure::GraphStore;
using healthiq::infrastructure::HsiHistoryStore;

namespace {

const TimePoint kNow = BaseTime() + kDay * 30;

std::shared_ptr<AnalyticsPipeline> MakePipeline(AnalyticsConfig config = {}) {
    return std::make_shared<AnalyticsPipeline>(config, std::make_shared<FixedClock>(kNow));
}

AnalyticsStores MakeStores() {
    return {std::make_shared<GraphStore>(), std::make_shared<AlertStore>(), std::make_shared<HsiHistoryStore>()};
}

/**
 * @brief A month of data: nightly poor sleep, half-missed medication in the last
 *        two weeks and a headache whose intensity climbs over the last ten days.
 */
std::vector<HealthEvent> MonthOfData() {
    std::vector<HealthEvent> events;
    for (int day = 0; day < 30; ++day) {
        events.push_back(Lifestyle("l" + std::to_string(day), At(day * 24 + 8), "poor sleep"));
        if (day >= 16) {
            events.push_back(Medication("m" + std::to_string(day), At(day * 24 + 9), "Metformin",
                                        day % 2 == 0 ? AdherenceOutcome::Taken : AdherenceOutcome::Missed));
        }
        if (day >= 20) {
            events.push_back(Symptom("s" + std::to_string(day), At(day * 24 + 14), "headache",
                                     std::to_string(day - 19)));
        }
    }
    return events;
}

bool HasRule(const std::vector<UserAlert>& alerts, AlertRuleType type) {
    return std::any_of(alerts.begin(), alerts.end(), [type](const UserAlert& a) { return a.ruleType == type; });
}

bool HasCategory(const std::vector<BehavioralSuggestion>& suggestions, const std::string& category) {
    return std::any_of(suggestions.begin(), suggestions.end(),
                       [&category](const BehavioralSuggestion& s) { return s.category == category; });
}

void testSparseInput() {
    std::cout << "[Test] Sparse input..." << std::endl;
    auto pipeline = MakePipeline();
    std::vector<HealthEvent> events = {
        Symptom("s1", At(700), "headache", "4"),
        Medication("m1", At(701), "Ibuprofen"),
        Lifestyle("l1", At(702), "slept well"),
    };

    AnalyticsResult result = pipeline->compute(events, std::nullopt);
    assert(result.eventCount == 3);
    assert(!result.hasSufficientData());
    assert(result.alerts.empty()); // cold start
    assert(result.hsi.score >= 0 && result.hsi.score <= 100);
    assert(result.graph && result.graph->nodeCount == 3);
    assert(result.risk.level == RiskLevel::Yellow); // thin lifestyle coverage keeps the score below 70
    assert(result.hsi.computedAt == kNow);

    AnalyticsResult empty = pipeline->compute({}, std::nullopt);
    assert(empty.eventCount == 0);
    assert(empty.graph && empty.graph->nodeCount == 0);
    assert(empty.alerts.empty());
    std::cout << "[PASS] Sparse input." << std::endl;
}

void testFullMonth() {
    std::cout << "[Test] Full month of data..." << std::endl;
    auto pipeline = MakePipeline();
    auto events = MonthOfData();

    AnalyticsResult result = pipeline->compute(events, std::nullopt);
    assert(result.hasSufficientData());
    assert(result.hsi.dataConfidence == DataConfidence::High);
    assert(HasRule(result.alerts, AlertRuleType::AdherenceDecline));
    assert(HasRule(result.alerts, AlertRuleType::SymptomEscalation));
    assert(!HasRule(result.alerts, AlertRuleType::HsiDrop));
    assert(!HasRule(result.alerts, AlertRuleType::LoggingGap));
    assert(result.risk.level != RiskLevel::Green);
    assert(result.risk.warningCount >= 2);
    assert(HasCategory(result.suggestions, "sleep"));
    assert(HasCategory(result.suggestions, "monitoring"));
    for (const auto& alert : result.alerts) assert(alert.triggeredAt == kNow);

    // Same inputs, same clock: identical output.
    AnalyticsResult again = pipeline->compute(events, std::nullopt);
    assert(again.hsi.score == result.hsi.score);
    assert(again.alerts.size() == result.alerts.size());
    for (size_t i = 0; i < again.alerts.size(); ++i) assert(again.alerts[i].title == result.alerts[i].title);

    HSIScore previous = result.hsi;
    previous.score = result.hsi.score + 10;
    assert(HasRule(pipeline->compute(events, previous).alerts, AlertRuleType::HsiDrop));
    previous.score = result.hsi.score + 9;
    assert(!HasRule(pipeline->compute(events, previous).alerts, AlertRuleType::HsiDrop));
    std::cout << "[PASS] Full month of data." << std::endl;
}

void testTopNAndConfiguration() {
    std::cout << "[Test] topN and configuration checks..." << std::endl;
    auto pipeline = MakePipeline();
    auto events = MonthOfData();

    assert(pipeline->compute(events, std::nullopt, 2).graph->topConcepts.size() == 2);
    assert(pipeline->compute(events, std::nullopt).graph->topConcepts.size() == 3);

    bool threw = false;
    try {
        pipeline->compute(events, std::nullopt, 0);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        AnalyticsPipeline(AnalyticsConfig{}, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    AnalyticsConfig bad;
    bad.trajectoryWeight = 0.4;
    threw = false;
    try {
        MakePipeline(bad);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    // Day windows beyond the supported range are rejected up front.
    auto rejects = [](void (*tweak)(AnalyticsConfig&)) {
        AnalyticsConfig config;
        tweak(config);
        try {
            config.validate();
        } catch (const ConfigurationError&) {
            return true;
        }
        return false;
    };
    assert(rejects([](AnalyticsConfig& c) { c.hsiWindowDays = 200000; }));
    assert(rejects([](AnalyticsConfig& c) { c.newSymptomLookbackDays = kMaxWindowDays + 1; }));
    assert(rejects([](AnalyticsConfig& c) { c.adherenceWindowDays = kMaxWindowDays + 1; }));
    assert(rejects([](AnalyticsConfig& c) { c.loggingGapDays = kMaxWindowDays + 1; }));
    assert(rejects([](AnalyticsConfig& c) { c.coldStartMinDays = kMaxWindowDays + 1; }));
    assert(rejects([](AnalyticsConfig& c) { c.coOccurrenceWindow = kDay * (kMaxWindowDays + 1); }));
    assert(rejects([](AnalyticsConfig& c) { c.alertDedupWindow = kDay * (kMaxWindowDays + 1); }));
    assert(!rejects([](AnalyticsConfig& c) { c.hsiWindowDays = kMaxWindowDays; }));

    threw = false;
    auto withBadEvent = events;
    withBadEvent.push_back(Symptom("bad", "2024-02-30T10:00:00Z", "cough"));
    try {
        pipeline->compute(withBadEvent, std::nullopt);
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] topN and configuration checks." << std::endl;
}

void testIdentityService() {
    std::cout << "[Test] Per-identity service..." << std::endl;
    auto pipeline = MakePipeline();
    IdentityAnalyticsService service(pipeline, MakeStores());
    auto events = MonthOfData();

    std::vector<HealthEvent> history;
    for (const auto& event : events) {
        service.ingest("alice", event, history);
        history.push_back(event);
    }

    GraphSummary incremental = service.graphSummary("alice");
    AnalyticsResult batch = pipeline->compute(events, std::nullopt);
    assert(incremental.nodeCount == batch.graph->nodeCount);
    assert(incremental.edgeCount == batch.graph->edgeCount);
    for (size_t i = 0; i < incremental.strongestEdges.size(); ++i) {
        assert(incremental.strongestEdges[i].sourceConcept == batch.graph->strongestEdges[i].sourceConcept);
        assert(incremental.strongestEdges[i].edge.weight == batch.graph->strongestEdges[i].edge.weight);
    }
    assert(service.graphSummary("nobody").nodeCount == 0);

    AnalyticsResult first = service.refresh("alice", events);
    const size_t activeCount = first.alerts.size();
    assert(activeCount == batch.alerts.size());
    for (const auto& alert : first.alerts) assert(alert.id.rfind("alert-", 0) == 0);

    // Re-running inside the dedup window raises nothing new.
    AnalyticsResult second = service.refresh("alice", events);
    assert(second.alerts.size() == activeCount);
    assert(!HasRule(second.alerts, AlertRuleType::HsiDrop));

    std::string acknowledgedId = second.alerts.front().id;
    assert(service.acknowledge("alice", acknowledgedId));
    assert(!service.acknowledge("alice", acknowledgedId));
    assert(service.activeAlerts("alice").size() == activeCount - 1);

    // An acknowledged alert no longer suppresses its rule.
    AnalyticsResult third = service.refresh("alice", events);
    assert(third.alerts.size() == activeCount);

    auto snapshot = service.exportState("alice", events);
    assert(snapshot.events.size() == events.size());
    assert(snapshot.hsiHistory.size() == 3);
    assert(snapshot.alerts.size() == activeCount + 1);

    IdentityAnalyticsService restored(pipeline, MakeStores());
    restored.importState("alice", snapshot);
    assert(restored.graphSummary("alice").edgeCount == incremental.edgeCount);
    assert(restored.activeAlerts("alice").size() == activeCount);
    assert(!restored.acknowledge("alice", acknowledgedId));

    bool threw = false;
    try {
        IdentityAnalyticsService broken(pipeline, AnalyticsStores{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Per-identity service." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AnalyticsPipeline Test..." << std::endl;
    testSparseInput();
    testFullMonth();
    testTopNAndConfiguration();
    testIdentityService();
    std::cout << "[PASS] AnalyticsPipeline Test." << std::endl;
    return 0;
}
