/**
 * @file GraphBuilder.cpp
 * @brief Implementation of GraphBuilder.
 */

#include "application/GraphBuilder.hpp"
#include "application/ConceptExtractor.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace healthiq::application {

using namespace healthiq::domain;

GraphBuilder::GraphBuilder(AnalyticsConfig config) : m_config(std::move(config)) {
    m_config.validate();
}

GraphRelation GraphBuilder::relationFor(ConceptCategory a, ConceptCategory b) {
    auto isPair = [a, b](ConceptCategory x, ConceptCategory y) {
        return (a == x && b == y) || (a == y && b == x);
    };
    if (isPair(ConceptCategory::Medication, ConceptCategory::Symptom)) return GraphRelation::MedicationResponse;
    if (isPair(ConceptCategory::Lifestyle, ConceptCategory::Symptom)) return GraphRelation::TemporalSequence;
    return GraphRelation::CoOccurrence;
}

size_t GraphBuilder::resolveTopN(int requested) const {
    if (requested < 1) {
        throw ConfigurationError("topN must be >= 1, got " + std::to_string(requested));
    }
    return static_cast<size_t>(std::min(requested, m_config.maxTopN));
}

GraphBuilder::PreparedEvent GraphBuilder::prepare(const HealthEvent& event) {
    PreparedEvent prepared;
    prepared.id = IdOf(event);
    prepared.time = TimeOf(event);
    prepared.concepts = ConceptExtractor::extract(event);
    return prepared;
}

bool GraphBuilder::withinWindow(TimePoint a, TimePoint b) const {
    auto gap = a > b ? a - b : b - a;
    return gap <= m_config.coOccurrenceWindow;
}

void GraphBuilder::upsertNodes(HealthGraph& graph, const PreparedEvent& event) {
    for (const auto& c : event.concepts) {
        graph.upsertNode(c.name, c.category, event.time);
    }
}

void GraphBuilder::link(HealthGraph& graph, const PreparedEvent& earlier, const PreparedEvent& later) {
    for (const auto& from : earlier.concepts) {
        auto source = graph.findNode(from.name, from.category);
        if (!source) {
            throw std::invalid_argument("Event '" + earlier.id + "' was never processed into this graph");
        }
        for (const auto& to : later.concepts) {
            auto target = graph.findNode(to.name, to.category);
            if (!target) {
                throw std::invalid_argument("Event '" + later.id + "' was never processed into this graph");
            }
            if (source->id == target->id) continue;
            graph.upsertEdge(source->id, target->id, relationFor(from.category, to.category),
                             later.id, later.time);
        }
    }
}

HealthGraph GraphBuilder::buildGraph(const std::vector<HealthEvent>& events) const {
    std::vector<PreparedEvent> prepared;
    prepared.reserve(events.size());
    for (const auto& event : events) prepared.push_back(prepare(event));

    HealthGraph graph;
    for (const auto& event : prepared) upsertNodes(graph, event);

    // Chronological order with input position as tie-break; order[p] is always the earlier side.
    std::vector<size_t> order(prepared.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&prepared](size_t a, size_t b) {
        return prepared[a].time < prepared[b].time;
    });

    for (size_t p = 0; p < order.size(); ++p) {
        const auto& earlier = prepared[order[p]];
        for (size_t q = p + 1; q < order.size(); ++q) {
            const auto& later = prepared[order[q]];
            if (!withinWindow(earlier.time, later.time)) break;
            if (earlier.id == later.id) continue;
            link(graph, earlier, later);
        }
    }
    return graph;
}

GraphSummary GraphBuilder::build(const std::vector<HealthEvent>& events, int topN) const {
    size_t limit = resolveTopN(topN);
    return buildGraph(events).summarize(limit);
}

void GraphBuilder::process(infrastructure::GraphStore& store,
                           const std::string& identity,
                           const HealthEvent& newEvent,
                           const std::vector<HealthEvent>& historicalEvents) const {
    PreparedEvent current = prepare(newEvent);

    std::vector<PreparedEvent> neighbours;
    for (const auto& past : historicalEvents) {
        if (IdOf(past) == current.id) continue;
        PreparedEvent candidate = prepare(past);
        if (withinWindow(candidate.time, current.time)) {
            neighbours.push_back(std::move(candidate));
        }
    }

    store.update(identity, [&](HealthGraph& graph) {
        for (const auto& past : neighbours) {
            for (const auto& c : past.concepts) {
                if (!graph.findNode(c.name, c.category)) {
                    throw std::invalid_argument("Event '" + past.id + "' was never processed into this graph");
                }
            }
        }
        upsertNodes(graph, current);
        for (const auto& past : neighbours) {
            if (past.time <= current.time) {
                link(graph, past, current);
            } else {
                link(graph, current, past);
            }
        }
    });
}

} // namespace healthiq::application
