#include <cassert>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/GraphBuilder.hpp"
#include "domain/AnalyticsErrors.hpp"
#include "infrastructure/GraphStore.hpp"
#include "test/TestEvents.hpp"

using namespace healthiq::domain;
using namespace healthiq::test;
using healthiq::application::GraphBuilder;
using healthiq::infrastructure::GraphStore;

namespace {

/** @brief Id-independent description of a graph: node and edge keys with all their attributes. */
std::set<std::string> Fingerprint(const HealthGraph& graph) {
    std::set<std::string> lines;
    for (const auto& [key, node] : graph.nodes()) {
        std::ostringstream ss;
        ss << "N " << node.name << "|" << CategoryToString(node.category) << "|" << node.occurrenceCount << "|"
           << FormatIsoTimestamp(node.firstSeen) << "|" << FormatIsoTimestamp(node.lastSeen);
        lines.insert(ss.str());
    }
    for (const auto& [key, edge] : graph.edges()) {
        std::ostringstream ss;
        ss << "E " << graph.nodeById(edge.sourceNode)->name << "->" << graph.nodeById(edge.targetNode)->name
           << "|" << RelationToString(edge.relation) << "|" << edge.weight << "|"
           << FormatIsoTimestamp(edge.firstObserved) << "|" << FormatIsoTimestamp(edge.lastObserved) << "|";
        for (const auto& id : edge.evidenceEventIds) ss << id << ",";
        lines.insert(ss.str());
    }
    return lines;
}

const GraphEdge* FindEdge(const HealthGraph& graph, const std::string& from, const std::string& to, GraphRelation relation) {
    for (const auto& [key, edge] : graph.edges()) {
        if (graph.nodeById(edge.sourceNode)->name == from && graph.nodeById(edge.targetNode)->name == to &&
            edge.relation == relation) {
            return &edge;
        }
    }
    return nullptr;
}

std::vector<HealthEvent> MixedTimeline() {
    return {
        Lifestyle("l1", At(0), "poor sleep", "stressed at work"),
        Symptom("s1", At(6), "Headache and nausea", "6/10"),
        Medication("m1", At(7), "Ibuprofen"),
        Symptom("s2", At(30), "headache", "7"),
        Clinical("c1", At(30), "GP visit", "tension headache"),
        Symptom("s3", At(20), "feeling tired"),                 // out of chronological order
        Lifestyle("l2", At(72), "slept well", std::nullopt),
        Medication("m2", At(78), "ibuprofen", AdherenceOutcome::Missed),
        Insight("i1", At(79), "s2"),
        Symptom("s4", At(80), "Headache", "severe"),
        Symptom("s5", At(200), "back pain"),
        Medication("m3", At(248), "Ibuprofen"),                 // exactly 48h after s5
    };
}

void testRelationsAndDirection() {
    std::cout << "[Test] Relations and edge direction..." << std::endl;
    GraphBuilder builder;
    std::vector<HealthEvent> events = {
        Lifestyle("l1", At(0), "poor sleep"),
        Symptom("s1", At(10), "headache"),
        Medication("m1", At(12), "Ibuprofen"),
    };
    HealthGraph graph = builder.buildGraph(events);

    assert(graph.nodeCount() == 3);
    assert(graph.edgeCount() == 3);

    const GraphEdge* sleepToHeadache = FindEdge(graph, "poor_sleep", "headache", GraphRelation::TemporalSequence);
    assert(sleepToHeadache);
    assert(sleepToHeadache->weight == 1.0);
    assert(sleepToHeadache->evidenceEventIds == std::set<std::string>{"s1"});
    assert(sleepToHeadache->firstObserved == ParseIsoTimestamp(At(10)));

    assert(FindEdge(graph, "headache", "ibuprofen", GraphRelation::MedicationResponse));
    assert(FindEdge(graph, "poor_sleep", "ibuprofen", GraphRelation::CoOccurrence));
    assert(!FindEdge(graph, "ibuprofen", "headache", GraphRelation::MedicationResponse));

    assert(GraphBuilder::relationFor(ConceptCategory::Symptom, ConceptCategory::Medication) ==
           GraphRelation::MedicationResponse);
    assert(GraphBuilder::relationFor(ConceptCategory::Symptom, ConceptCategory::Lifestyle) ==
           GraphRelation::TemporalSequence);
    assert(GraphBuilder::relationFor(ConceptCategory::Clinical, ConceptCategory::Symptom) ==
           GraphRelation::CoOccurrence);
    std::cout << "[PASS] Relations and edge direction." << std::endl;
}

void testReinforcementAndNoSelfLoops() {
    std::cout << "[Test] Reinforcement and self-loops..." << std::endl;
    GraphBuilder builder;
    std::vector<HealthEvent> events = {
        Symptom("s1", At(0), "headache"),
        Medication("m1", At(1), "Ibuprofen"),
        Medication("m2", At(2), "ibuprofen"),
    };
    HealthGraph graph = builder.buildGraph(events);

    assert(graph.nodeCount() == 2);
    assert(graph.edgeCount() == 1);
    const GraphEdge* edge = FindEdge(graph, "headache", "ibuprofen", GraphRelation::MedicationResponse);
    assert(edge);
    assert(edge->weight == 1.5);
    assert((edge->evidenceEventIds == std::set<std::string>{"m1", "m2"}));
    assert(edge->firstObserved == ParseIsoTimestamp(At(1)));
    assert(edge->lastObserved == ParseIsoTimestamp(At(2)));

    for (const auto& [key, e] : graph.edges()) assert(e.sourceNode != e.targetNode);

    // A multi-concept event never links to itself either.
    HealthGraph single = builder.buildGraph({Symptom("s9", At(0), "migraine with nausea")});
    assert(single.nodeCount() == 2);
    assert(single.edgeCount() == 0);

    auto summary = builder.build(events, 15);
    assert(summary.topConcepts.front().name == "ibuprofen");
    assert(summary.topConcepts.front().occurrenceCount == 2);
    assert(summary.strongestEdges.front().sourceConcept == "headache");
    assert(summary.strongestEdges.front().targetConcept == "ibuprofen");
    std::cout << "[PASS] Reinforcement and self-loops." << std::endl;
}

void testWindowBoundary() {
    std::cout << "[Test] Co-occurrence window boundary..." << std::endl;
    GraphBuilder builder;
    HealthGraph inside = builder.buildGraph({Symptom("s1", At(0), "cough"), Symptom("s2", At(48), "fever")});
    assert(inside.edgeCount() == 1);
    HealthGraph outside = builder.buildGraph({Symptom("s1", At(0), "cough"), Symptom("s2", At(49), "fever")});
    assert(outside.edgeCount() == 0);
    assert(outside.nodeCount() == 2);
    std::cout << "[PASS] Co-occurrence window boundary." << std::endl;
}

void testBatchIdempotence() {
    std::cout << "[Test] Batch idempotence..." << std::endl;
    GraphBuilder builder;
    auto events = MixedTimeline();
    auto first = Fingerprint(builder.buildGraph(events));
    auto second = Fingerprint(builder.buildGraph(events));
    assert(first == second);

    auto summaryA = builder.build(events, 5);
    auto summaryB = builder.build(events, 5);
    assert(summaryA.nodeCount == summaryB.nodeCount);
    assert(summaryA.topConcepts.size() == 5);
    for (size_t i = 0; i < summaryA.strongestEdges.size(); ++i) {
        assert(summaryA.strongestEdges[i].sourceConcept == summaryB.strongestEdges[i].sourceConcept);
        assert(summaryA.strongestEdges[i].edge.weight == summaryB.strongestEdges[i].edge.weight);
    }
    std::cout << "[PASS] Batch idempotence." << std::endl;
}

void testIncrementalMatchesBatch() {
    std::cout << "[Test] Incremental equals batch..." << std::endl;
    GraphBuilder builder;
    auto events = MixedTimeline();

    GraphStore store;
    std::vector<HealthEvent> processed;
    for (const auto& event : events) {
        builder.process(store, "user-1", event, processed);
        processed.push_back(event);
    }

    auto incremental = store.snapshot("user-1");
    assert(incremental);
    assert(Fingerprint(*incremental) == Fingerprint(builder.buildGraph(events)));

    // Replaying an event's own id in the history is ignored.
    GraphStore selfStore;
    builder.process(selfStore, "u", events[1], {events[1]});
    auto selfGraph = selfStore.snapshot("u");
    assert(selfGraph->nodeCount() == 2);
    assert(selfGraph->edgeCount() == 0);
    assert(selfGraph->findNode("headache", ConceptCategory::Symptom)->occurrenceCount == 1);
    std::cout << "[PASS] Incremental equals batch." << std::endl;
}

void testFailures() {
    std::cout << "[Test] Malformed input and configuration..." << std::endl;
    GraphBuilder builder;

    bool threw = false;
    try {
        builder.build({Symptom("s1", At(0), "cough"), Symptom("bad", "yesterday-ish", "fever")}, 10);
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);

    GraphStore store;
    threw = false;
    try {
        builder.process(store, "user-1", Symptom("s2", At(1), "fever"), {Symptom("bad", "2024-13-40", "cough")});
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);
    assert(!store.snapshot("user-1"));

    threw = false;
    try {
        builder.process(store, "user-2", Symptom("s2", At(1), "fever"), {Symptom("s1", At(0), "cough")});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(!store.snapshot("user-2") || store.snapshot("user-2")->nodeCount() == 0);

    threw = false;
    try {
        builder.build({}, 0);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    assert(builder.resolveTopN(100) == 50);
    assert(builder.resolveTopN(3) == 3);

    auto empty = builder.build({}, 15);
    assert(empty.nodeCount == 0 && empty.edgeCount == 0 && empty.topConcepts.empty());
    std::cout << "[PASS] Malformed input and configuration." << std::endl;
}

void testEdgeOrderAcrossCategories() {
    std::cout << "[Test] Edge order with labels shared across categories..." << std::endl;
    const TimePoint at = ParseIsoTimestamp(At(0));

    // Same concepts inserted in opposite orders, so node and edge ids differ.
    auto build = [&at](bool lifestyleFirst) {
        HealthGraph graph;
        int headache = graph.upsertNode("headache", ConceptCategory::Symptom, at);
        int first = graph.upsertNode("caffeine", lifestyleFirst ? ConceptCategory::Lifestyle : ConceptCategory::Medication, at);
        int second = graph.upsertNode("caffeine", lifestyleFirst ? ConceptCategory::Medication : ConceptCategory::Lifestyle, at);
        graph.upsertEdge(headache, first, GraphRelation::CoOccurrence, "e1", at);
        graph.upsertEdge(headache, second, GraphRelation::CoOccurrence, "e1", at);
        return graph;
    };
    HealthGraph a = build(true);
    HealthGraph b = build(false);

    auto summaryA = a.summarize(15);
    auto summaryB = b.summarize(15);
    assert(summaryA.strongestEdges.size() == 2);
    assert(summaryB.strongestEdges.size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        assert(summaryA.strongestEdges[i].targetConcept == "caffeine");
        assert(a.nodeById(summaryA.strongestEdges[i].edge.targetNode)->category ==
               b.nodeById(summaryB.strongestEdges[i].edge.targetNode)->category);
    }
    assert(a.nodeById(summaryA.strongestEdges[0].edge.targetNode)->category == ConceptCategory::Medication);
    std::cout << "[PASS] Edge order with labels shared across categories." << std::endl;
}

void testOutOfRangeTimestamps() {
    std::cout << "[Test] Timestamps outside the supported years..." << std::endl;
    GraphBuilder builder;
    std::vector<HealthEvent> events = {
        Symptom("s1", At(0), "headache"),
        Symptom("s2", "2608-09-15T00:00:00Z", "nausea"),
    };

    bool threw = false;
    try {
        builder.buildGraph(events);
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ParseIsoTimestamp("9999-12-31T00:00:00Z");
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ParseIsoTimestamp("1677-01-01T00:00:00Z");
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);

    assert(FormatIsoTimestamp(ParseIsoTimestamp("2200-12-31T23:59:59Z")) == "2200-12-31T23:59:59.000Z");
    assert(FormatIsoTimestamp(ParseIsoTimestamp("1900-01-01T00:00:00Z")) == "1900-01-01T00:00:00.000Z");
    std::cout << "[PASS] Timestamps outside the supported years." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting GraphBuilder Test..." << std::endl;
    testRelationsAndDirection();
    testReinforcementAndNoSelfLoops();
    testWindowBoundary();
    testBatchIdempotence();
    testIncrementalMatchesBatch();
    testFailures();
    testEdgeOrderAcrossCategories();
    testOutOfRangeTimestamps();
    std::cout << "[PASS] GraphBuilder Test." << std::endl;
    return 0;
}
