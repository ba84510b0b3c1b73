/**
 * @file HealthGraph.hpp
 * @brief Per-identity directed, weighted concept graph.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "domain/ExtractedConcept.hpp"
#include "domain/Timestamp.hpp"

namespace healthiq::domain {

/**
 * @enum GraphRelation
 * @brief Kind of relationship an edge records.
 */
enum class GraphRelation {
    CoOccurrence,       ///< Concepts observed within the co-occurrence window.
    TemporalSequence,   ///< Lifestyle factor paired with a symptom.
    ReportedTrigger,    ///< User-declared trigger (not derived automatically).
    MedicationResponse  ///< Medication paired with a symptom.
};

std::string RelationToString(GraphRelation relation);
std::optional<GraphRelation> RelationFromString(const std::string& value);

/**
 * @struct GraphNode
 * @brief One concept; identity is (name, category). Cumulative and never deleted.
 */
struct GraphNode {
    int id = 0;
    std::string name;
    ConceptCategory category = ConceptCategory::Symptom;
    int occurrenceCount = 0;
    TimePoint firstSeen;
    TimePoint lastSeen;
};

/**
 * @struct GraphEdge
 * @brief Directed relation; identity is (sourceNode, targetNode, relation).
 */
struct GraphEdge {
    int id = 0;
    int sourceNode = 0;
    int targetNode = 0;
    GraphRelation relation = GraphRelation::CoOccurrence;
    double weight = 0.0;
    std::set<std::string> evidenceEventIds;
    TimePoint firstObserved;
    TimePoint lastObserved;
};

/** @brief Edge as reported in a summary, with both endpoint labels resolved. */
struct SummaryEdge {
    GraphEdge edge;
    std::string sourceConcept;
    std::string targetConcept;
};

struct GraphSummary {
    size_t nodeCount = 0;
    size_t edgeCount = 0;
    std::vector<GraphNode> topConcepts;
    std::vector<SummaryEdge> strongestEdges;
};

/**
 * @class HealthGraph
 * @brief Holds nodes and edges and implements the idempotent upsert rules.
 *
 * Not synchronized; the owning store serializes access per identity.
 */
class HealthGraph {
public:
    static constexpr double kInitialEdgeWeight = 1.0;
    static constexpr double kReinforcement = 0.5;

    using NodeKey = std::pair<std::string, ConceptCategory>;
    using EdgeKey = std::tuple<int, int, GraphRelation>;

    /**
     * @brief Inserts the node or bumps its occurrence count and widens [firstSeen, lastSeen].
     * @return The node id.
     */
    int upsertNode(const std::string& name, ConceptCategory category, TimePoint seenAt);

    /**
     * @brief Inserts the edge with weight 1.0 or adds 0.5 to an existing one.
     * @return false (and no change) when source and target are the same node.
     */
    bool upsertEdge(int sourceNode, int targetNode, GraphRelation relation,
                    const std::string& evidenceEventId, TimePoint observedAt);

    /** @brief Re-inserts a persisted node verbatim (id included). */
    void restoreNode(const GraphNode& node);

    /** @brief Re-inserts a persisted edge verbatim; both endpoints must already be restored. */
    void restoreEdge(const GraphEdge& edge);

    /**
     * @brief Top-N nodes by occurrence and top-N edges by weight, both descending.
     *
     * Ties: nodes by firstSeen, then name/category; edges by firstObserved, then
     * source concept, target concept, relation and the endpoint categories.
     */
    GraphSummary summarize(size_t topN) const;

    std::optional<GraphNode> findNode(const std::string& name, ConceptCategory category) const;
    const GraphNode* nodeById(int id) const;

    const std::map<NodeKey, GraphNode>& nodes() const { return m_nodes; }
    const std::map<EdgeKey, GraphEdge>& edges() const { return m_edges; }

    size_t nodeCount() const { return m_nodes.size(); }
    size_t edgeCount() const { return m_edges.size(); }

private:
    std::map<NodeKey, GraphNode> m_nodes;
    std::map<int, NodeKey> m_nodeKeysById;
    std::map<EdgeKey, GraphEdge> m_edges;
    int m_nextNodeId = 1;
    int m_nextEdgeId = 1;
};

} // namespace healthiq::domain
