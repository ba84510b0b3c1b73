#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/AlertStore.hpp"
#include "test/TestEvents.hpp"

using namespace healthiq::domain;
using namespace healthiq::test;
using healthiq::infrastructure::AlertStore;

namespace {

UserAlert Raised(AlertRuleType type, long hours) {
    UserAlert alert;
    alert.ruleType = type;
    alert.severity = AlertSeverity::Warning;
    alert.triggeredAt = BaseTime() + std::chrono::hours(hours);
    alert.title = RuleTypeToString(type);
    return alert;
}

void testDeduplication() {
    std::cout << "[Test] Duplicate suppression..." << std::endl;
    AlertStore store;

    auto first = store.save("alice", Raised(AlertRuleType::HsiDrop, 0));
    assert(first);
    assert(first->id == "alert-1");

    assert(!store.save("alice", Raised(AlertRuleType::HsiDrop, 10)));
    assert(!store.save("alice", Raised(AlertRuleType::HsiDrop, 24))); // window is inclusive

    // Other rule types and other identities are independent.
    auto other = store.save("alice", Raised(AlertRuleType::LoggingGap, 10));
    assert(other && other->id == "alert-2");
    auto bob = store.save("bob", Raised(AlertRuleType::HsiDrop, 10));
    assert(bob && bob->id == "alert-1");

    auto later = store.save("alice", Raised(AlertRuleType::HsiDrop, 25));
    assert(later && later->id == "alert-3");
    assert(store.allAlerts("alice").size() == 3);
    std::cout << "[PASS] Duplicate suppression." << std::endl;
}

void testAcknowledgment() {
    std::cout << "[Test] Acknowledgment..." << std::endl;
    AlertStore store;
    auto alert = store.save("alice", Raised(AlertRuleType::AdherenceDecline, 0));
    assert(alert);

    const TimePoint ackAt = BaseTime() + std::chrono::hours(2);
    assert(store.acknowledge("alice", alert->id, ackAt));
    assert(!store.acknowledge("alice", alert->id, ackAt + std::chrono::hours(1))); // terminal
    assert(!store.acknowledge("alice", "alert-99", ackAt));
    assert(!store.acknowledge("nobody", alert->id, ackAt));

    auto all = store.allAlerts("alice");
    assert(all.size() == 1);
    assert(all[0].acknowledged);
    assert(all[0].acknowledgedAt && *all[0].acknowledgedAt == ackAt);
    assert(store.activeAlerts("alice").empty());

    // An acknowledged alert no longer blocks the rule from re-raising.
    auto again = store.save("alice", Raised(AlertRuleType::AdherenceDecline, 3));
    assert(again && again->id == "alert-2");
    assert(!again->acknowledged);
    std::cout << "[PASS] Acknowledgment." << std::endl;
}

void testActiveOrdering() {
    std::cout << "[Test] Active alerts ordering..." << std::endl;
    AlertStore store;
    store.save("alice", Raised(AlertRuleType::LoggingGap, 5));
    store.save("alice", Raised(AlertRuleType::HsiDrop, 20));
    store.save("alice", Raised(AlertRuleType::SymptomEscalation, 1));

    auto active = store.activeAlerts("alice");
    assert(active.size() == 3);
    assert(active[0].ruleType == AlertRuleType::HsiDrop);
    assert(active[1].ruleType == AlertRuleType::LoggingGap);
    assert(active[2].ruleType == AlertRuleType::SymptomEscalation);
    assert(store.activeAlerts("unknown").empty());
    assert(store.allAlerts("unknown").empty());
    std::cout << "[PASS] Active alerts ordering." << std::endl;
}

void testRestore() {
    std::cout << "[Test] Restore from snapshot..." << std::endl;
    AlertStore store;

    UserAlert acked = Raised(AlertRuleType::HsiDrop, 0);
    acked.id = "alert-4";
    acked.acknowledged = true;
    acked.acknowledgedAt = BaseTime() + std::chrono::hours(1);
    UserAlert open = Raised(AlertRuleType::LoggingGap, 2);
    open.id = "alert-7";
    store.restore("alice", {acked, open});

    assert(store.allAlerts("alice").size() == 2);
    assert(store.activeAlerts("alice").size() == 1);
    assert(!store.save("alice", Raised(AlertRuleType::LoggingGap, 3)));
    auto next = store.save("alice", Raised(AlertRuleType::HsiDrop, 3));
    assert(next && next->id == "alert-8");

    bool threw = false;
    try {
        store.restore("alice", {open, open});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.allAlerts("alice").size() == 3); // untouched by the failed restore
    std::cout << "[PASS] Restore from snapshot." << std::endl;
}

void testCustomWindow() {
    std::cout << "[Test] Configured dedup window..." << std::endl;
    AlertStore store(std::chrono::hours(2));
    assert(store.save("alice", Raised(AlertRuleType::HsiDrop, 0)));
    assert(!store.save("alice", Raised(AlertRuleType::HsiDrop, 2)));
    assert(store.save("alice", Raised(AlertRuleType::HsiDrop, 3)));
    std::cout << "[PASS] Configured dedup window." << std::endl;
}

void testEarlierReplay() {
    std::cout << "[Test] Replay with an earlier clock..." << std::endl;
    AlertStore store;
    assert(store.save("alice", Raised(AlertRuleType::LoggingGap, 30)));

    // Within 24h before the active alert: still a duplicate.
    assert(!store.save("alice", Raised(AlertRuleType::LoggingGap, 10)));
    assert(!store.save("alice", Raised(AlertRuleType::LoggingGap, 6)));
    assert(store.activeAlerts("alice").size() == 1);

    auto older = store.save("alice", Raised(AlertRuleType::LoggingGap, 5));
    assert(older && older->id == "alert-2");
    std::cout << "[PASS] Replay with an earlier clock." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AlertStore Test..." << std::endl;
    testDeduplication();
    testAcknowledgment();
    testActiveOrdering();
    testRestore();
    testCustomWindow();
    testEarlierReplay();
    std::cout << "[PASS] AlertStore Test." << std::endl;
    return 0;
}
