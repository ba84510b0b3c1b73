/**
 * @file HealthGraph.cpp
 * @brief Implementation of HealthGraph.
 */

#include "domain/HealthGraph.hpp"

#include <algorithm>
#include <stdexcept>

namespace healthiq::domain {

std::string RelationToString(GraphRelation relation) {
    switch (relation) {
        case GraphRelation::CoOccurrence: return "co_occurrence";
        case GraphRelation::TemporalSequence: return "temporal_sequence";
        case GraphRelation::ReportedTrigger: return "reported_trigger";
        case GraphRelation::MedicationResponse: return "medication_response";
        default: return "co_occurrence";
    }
}

std::optional<GraphRelation> RelationFromString(const std::string& value) {
    if (value == "co_occurrence") return GraphRelation::CoOccurrence;
    if (value == "temporal_sequence") return GraphRelation::TemporalSequence;
    if (value == "reported_trigger") return GraphRelation::ReportedTrigger;
    if (value == "medication_response") return GraphRelation::MedicationResponse;
    return std::nullopt;
}

int HealthGraph::upsertNode(const std::string& name, ConceptCategory category, TimePoint seenAt) {
    NodeKey key{name, category};
    auto it = m_nodes.find(key);
    if (it != m_nodes.end()) {
        GraphNode& node = it->second;
        node.occurrenceCount += 1;
        node.firstSeen = std::min(node.firstSeen, seenAt);
        node.lastSeen = std::max(node.lastSeen, seenAt);
        return node.id;
    }

    GraphNode node;
    node.id = m_nextNodeId++;
    node.name = name;
    node.category = category;
    node.occurrenceCount = 1;
    node.firstSeen = seenAt;
    node.lastSeen = seenAt;
    m_nodes.emplace(key, node);
    m_nodeKeysById.emplace(node.id, key);
    return node.id;
}

bool HealthGraph::upsertEdge(int sourceNode, int targetNode, GraphRelation relation,
                             const std::string& evidenceEventId, TimePoint observedAt) {
    if (sourceNode == targetNode) return false;

    EdgeKey key{sourceNode, targetNode, relation};
    auto it = m_edges.find(key);
    if (it != m_edges.end()) {
        GraphEdge& edge = it->second;
        edge.weight += kReinforcement;
        edge.evidenceEventIds.insert(evidenceEventId);
        edge.firstObserved = std::min(edge.firstObserved, observedAt);
        edge.lastObserved = std::max(edge.lastObserved, observedAt);
        return true;
    }

    GraphEdge edge;
    edge.id = m_nextEdgeId++;
    edge.sourceNode = sourceNode;
    edge.targetNode = targetNode;
    edge.relation = relation;
    edge.weight = kInitialEdgeWeight;
    edge.evidenceEventIds.insert(evidenceEventId);
    edge.firstObserved = observedAt;
    edge.lastObserved = observedAt;
    m_edges.emplace(key, std::move(edge));
    return true;
}

void HealthGraph::restoreNode(const GraphNode& node) {
    NodeKey key{node.name, node.category};
    if (m_nodes.count(key) || m_nodeKeysById.count(node.id)) {
        throw std::runtime_error("Duplicate graph node in snapshot: " + node.name);
    }
    m_nodes.emplace(key, node);
    m_nodeKeysById.emplace(node.id, key);
    m_nextNodeId = std::max(m_nextNodeId, node.id + 1);
}

void HealthGraph::restoreEdge(const GraphEdge& edge) {
    if (!nodeById(edge.sourceNode) || !nodeById(edge.targetNode)) {
        throw std::runtime_error("Graph edge references unknown node: " + std::to_string(edge.id));
    }
    if (edge.sourceNode == edge.targetNode) {
        throw std::runtime_error("Self-loop in graph snapshot: " + std::to_string(edge.id));
    }
    m_edges[EdgeKey{edge.sourceNode, edge.targetNode, edge.relation}] = edge;
    m_nextEdgeId = std::max(m_nextEdgeId, edge.id + 1);
}

std::optional<GraphNode> HealthGraph::findNode(const std::string& name, ConceptCategory category) const {
    auto it = m_nodes.find(NodeKey{name, category});
    if (it == m_nodes.end()) return std::nullopt;
    return it->second;
}

const GraphNode* HealthGraph::nodeById(int id) const {
    auto it = m_nodeKeysById.find(id);
    if (it == m_nodeKeysById.end()) return nullptr;
    return &m_nodes.at(it->second);
}

GraphSummary HealthGraph::summarize(size_t topN) const {
    GraphSummary summary;
    summary.nodeCount = m_nodes.size();
    summary.edgeCount = m_edges.size();

    std::vector<GraphNode> nodes;
    nodes.reserve(m_nodes.size());
    for (const auto& [key, node] : m_nodes) nodes.push_back(node);

    std::sort(nodes.begin(), nodes.end(), [](const GraphNode& a, const GraphNode& b) {
        if (a.occurrenceCount != b.occurrenceCount) return a.occurrenceCount > b.occurrenceCount;
        if (a.firstSeen != b.firstSeen) return a.firstSeen < b.firstSeen;
        if (a.name != b.name) return a.name < b.name;
        return a.category < b.category;
    });
    if (nodes.size() > topN) nodes.resize(topN);
    summary.topConcepts = std::move(nodes);

    std::vector<SummaryEdge> edges;
    edges.reserve(m_edges.size());
    for (const auto& [key, edge] : m_edges) {
        SummaryEdge view;
        view.edge = edge;
        view.sourceConcept = nodeById(edge.sourceNode)->name;
        view.targetConcept = nodeById(edge.targetNode)->name;
        edges.push_back(std::move(view));
    }

    // Node ids differ between batch and incremental builds, so ties end on the endpoint keys.
    std::sort(edges.begin(), edges.end(), [this](const SummaryEdge& a, const SummaryEdge& b) {
        if (a.edge.weight != b.edge.weight) return a.edge.weight > b.edge.weight;
        if (a.edge.firstObserved != b.edge.firstObserved) return a.edge.firstObserved < b.edge.firstObserved;
        if (a.sourceConcept != b.sourceConcept) return a.sourceConcept < b.sourceConcept;
        if (a.targetConcept != b.targetConcept) return a.targetConcept < b.targetConcept;
        if (a.edge.relation != b.edge.relation) return a.edge.relation < b.edge.relation;
        ConceptCategory aSource = nodeById(a.edge.sourceNode)->category;
        ConceptCategory bSource = nodeById(b.edge.sourceNode)->category;
        if (aSource != bSource) return aSource < bSource;
        return nodeById(a.edge.targetNode)->category < nodeById(b.edge.targetNode)->category;
    });
    if (edges.size() > topN) edges.resize(topN);
    summary.strongestEdges = std::move(edges);

    return summary;
}

} // namespace healthiq::domain
