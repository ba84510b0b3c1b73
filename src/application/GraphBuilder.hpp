/**
 * @file GraphBuilder.hpp
 * @brief Builds the concept graph from events, in batch or one event at a time.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/AnalyticsConfig.hpp"
#include "domain/ExtractedConcept.hpp"
#include "domain/HealthEvent.hpp"
#include "domain/HealthGraph.hpp"
#include "infrastructure/GraphStore.hpp"

namespace healthiq::application {

/**
 * @class GraphBuilder
 * @brief Deterministic, server-side graph construction.
 *
 * Both modes share one linking rule, so feeding events one by one through
 * process() (each against every earlier event inside the co-occurrence window)
 * produces exactly the nodes, edges and weights of a single build() over the
 * same events.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(domain::AnalyticsConfig config = {});

    /**
     * @brief Full rebuild. Pure.
     * @param topN Requested summary size; capped at the configured maximum.
     * @throws MalformedEventError on an unparseable timestamp.
     * @throws ConfigurationError if topN < 1.
     */
    domain::GraphSummary build(const std::vector<domain::HealthEvent>& events, int topN) const;

    /** @brief Full rebuild returning the graph itself. */
    domain::HealthGraph buildGraph(const std::vector<domain::HealthEvent>& events) const;

    /**
     * @brief Incremental update of @p identity's graph in @p store.
     *
     * @param historicalEvents Every previously processed event whose timestamp lies
     *        within the co-occurrence window of @p newEvent. Events outside the window
     *        are ignored; an entry with the same id as @p newEvent is skipped. On equal
     *        timestamps the historical event counts as the earlier one.
     * @throws MalformedEventError before touching the store if any timestamp is invalid.
     * @throws std::invalid_argument if a historical event was never processed into this graph.
     */
    void process(infrastructure::GraphStore& store,
                 const std::string& identity,
                 const domain::HealthEvent& newEvent,
                 const std::vector<domain::HealthEvent>& historicalEvents) const;

    /** @brief Clamps to the configured maximum. @throws ConfigurationError if < 1. */
    size_t resolveTopN(int requested) const;

    /** @brief medication_response, temporal_sequence or co_occurrence for a category pair. */
    static domain::GraphRelation relationFor(domain::ConceptCategory a, domain::ConceptCategory b);

private:
    struct PreparedEvent {
        std::string id;
        domain::TimePoint time;
        std::vector<domain::ExtractedConcept> concepts;
    };

    static PreparedEvent prepare(const domain::HealthEvent& event);
    bool withinWindow(domain::TimePoint a, domain::TimePoint b) const;
    static void upsertNodes(domain::HealthGraph& graph, const PreparedEvent& event);
    static void link(domain::HealthGraph& graph, const PreparedEvent& earlier, const PreparedEvent& later);

    domain::AnalyticsConfig m_config;
};

} // namespace healthiq::application
