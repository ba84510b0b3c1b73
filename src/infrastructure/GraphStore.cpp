/**
 * @file GraphStore.cpp
 * @brief Implementation of GraphStore.
 */

#include "infrastructure/GraphStore.hpp"

namespace healthiq::infrastructure {

std::optional<domain::HealthGraph> GraphStore::snapshot(const std::string& identity) const {
    return m_graphs.withExisting(identity, [](const domain::HealthGraph& graph) { return graph; });
}

domain::GraphSummary GraphStore::summarize(const std::string& identity, size_t topN) const {
    auto summary = m_graphs.withExisting(identity, [topN](const domain::HealthGraph& graph) {
        return graph.summarize(topN);
    });
    return summary ? *summary : domain::GraphSummary{};
}

void GraphStore::replace(const std::string& identity, domain::HealthGraph graph) {
    m_graphs.withState(identity, [&graph](domain::HealthGraph& current) { current = std::move(graph); });
}

} // namespace healthiq::infrastructure
