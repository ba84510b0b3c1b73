/**
 * @file IdentityAnalyticsService.cpp
 * @brief Implementation of IdentityAnalyticsService.
 */

#include "application/IdentityAnalyticsService.hpp"

#include <iostream>
#include <stdexcept>

namespace healthiq::application {

using namespace healthiq::domain;

IdentityAnalyticsService::IdentityAnalyticsService(std::shared_ptr<const AnalyticsPipeline> pipeline,
                                                   AnalyticsStores stores)
    : m_pipeline(std::move(pipeline)), m_stores(std::move(stores)) {
    if (!m_pipeline || !m_stores.graphs || !m_stores.alerts || !m_stores.hsiHistory) {
        throw std::invalid_argument("IdentityAnalyticsService requires a pipeline and all stores");
    }
}

void IdentityAnalyticsService::ingest(const std::string& identity,
                                      const HealthEvent& event,
                                      const std::vector<HealthEvent>& recentHistory) {
    m_pipeline->graphBuilder().process(*m_stores.graphs, identity, event, recentHistory);
}

GraphSummary IdentityAnalyticsService::graphSummary(const std::string& identity, std::optional<int> topN) const {
    size_t limit = m_pipeline->graphBuilder().resolveTopN(topN.value_or(m_pipeline->config().defaultTopN));
    return m_stores.graphs->summarize(identity, limit);
}

AnalyticsResult IdentityAnalyticsService::refresh(const std::string& identity, const std::vector<HealthEvent>& events) {
    const TimePoint now = m_pipeline->now();
    const auto& engine = m_pipeline->alertEngine();

    AnalyticsResult result;
    result.eventCount = events.size();
    result.hsi = m_pipeline->scorer().compute(events, m_pipeline->config().hsiWindowDays, now);

    auto graph = m_stores.graphs->snapshot(identity);
    if (graph) {
        result.graph = graph->summarize(m_pipeline->graphBuilder().resolveTopN(m_pipeline->config().defaultTopN));
    }

    size_t raised = 0;
    // Holds the identity's history lock from reading the previous snapshot to appending this one.
    m_stores.hsiHistory->appendNext(identity, [&](const std::optional<HSIScore>& previous) {
        AlertEvaluationContext context{result.hsi, previous, events, result.graph, now};
        for (auto& alert : engine.evaluate(context)) {
            if (m_stores.alerts->save(identity, std::move(alert))) ++raised;
        }

        result.alerts = m_stores.alerts->activeAlerts(identity);
        result.risk = engine.computeRisk(result.hsi, result.alerts);
        result.suggestions = engine.suggest(result.hsi, result.alerts, result.graph);
        return result.hsi;
    });

    std::clog << "[IdentityAnalyticsService] Refreshed " << identity << ": HSI " << result.hsi.score
              << ", " << raised << " new alert(s), " << result.alerts.size() << " active" << std::endl;
    return result;
}

std::vector<UserAlert> IdentityAnalyticsService::activeAlerts(const std::string& identity) const {
    return m_stores.alerts->activeAlerts(identity);
}

bool IdentityAnalyticsService::acknowledge(const std::string& identity, const std::string& alertId) {
    return m_stores.alerts->acknowledge(identity, alertId, m_pipeline->now());
}

IdentitySnapshot IdentityAnalyticsService::exportState(const std::string& identity, std::vector<HealthEvent> events) const {
    IdentitySnapshot snapshot;
    snapshot.events = std::move(events);
    snapshot.graph = m_stores.graphs->snapshot(identity).value_or(HealthGraph{});
    snapshot.alerts = m_stores.alerts->allAlerts(identity);
    snapshot.hsiHistory = m_stores.hsiHistory->history(identity);
    return snapshot;
}

void IdentityAnalyticsService::importState(const std::string& identity, const IdentitySnapshot& snapshot) {
    m_stores.graphs->replace(identity, snapshot.graph);
    m_stores.alerts->restore(identity, snapshot.alerts);
    m_stores.hsiHistory->restore(identity, snapshot.hsiHistory);
}

} // namespace healthiq::application
