/**
 * @file IdentityAnalyticsService.hpp
 * @brief Stateful per-identity analytics over injected stores.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AnalyticsPipeline.hpp"
#include "domain/IdentityStateRepository.hpp"
#include "infrastructure/AlertStore.hpp"
#include "infrastructure/GraphStore.hpp"
#include "infrastructure/HsiHistoryStore.hpp"

namespace healthiq::application {

/**
 * @struct AnalyticsStores
 * @brief The stores a service instance works against; created once by the host.
 */
struct AnalyticsStores {
    std::shared_ptr<infrastructure::GraphStore> graphs;
    std::shared_ptr<infrastructure::AlertStore> alerts;
    std::shared_ptr<infrastructure::HsiHistoryStore> hsiHistory;
};

/**
 * @class IdentityAnalyticsService
 * @brief Incremental graph ingestion, HSI refresh with alert persistence, acknowledgment.
 *
 * Thread-safe: every store serializes work per identity, and refreshes of one
 * identity run one at a time from reading the previous HSI to appending the new one.
 */
class IdentityAnalyticsService {
public:
    /** @throws std::invalid_argument if the pipeline or any store is missing. */
    IdentityAnalyticsService(std::shared_ptr<const AnalyticsPipeline> pipeline, AnalyticsStores stores);

    /**
     * @brief Adds one event to the identity's graph.
     * @param recentHistory Previously ingested events within the co-occurrence window of @p event.
     */
    void ingest(const std::string& identity,
                const domain::HealthEvent& event,
                const std::vector<domain::HealthEvent>& recentHistory);

    domain::GraphSummary graphSummary(const std::string& identity, std::optional<int> topN = std::nullopt) const;

    /**
     * @brief Recomputes the HSI, raises and stores alerts, appends the HSI snapshot.
     *
     * The previous HSI comes from the history store and the graph summary from the
     * graph store; either may be absent. The returned result carries every active
     * alert of the identity, not only the ones raised by this call.
     */
    AnalyticsResult refresh(const std::string& identity, const std::vector<domain::HealthEvent>& events);

    std::vector<domain::UserAlert> activeAlerts(const std::string& identity) const;

    /** @return false for unknown or already acknowledged alerts. */
    bool acknowledge(const std::string& identity, const std::string& alertId);

    /** @brief Everything held for @p identity, with @p events as its processed event log. */
    domain::IdentitySnapshot exportState(const std::string& identity, std::vector<domain::HealthEvent> events) const;

    /** @brief Replaces the identity's graph, alerts and HSI history with @p snapshot. */
    void importState(const std::string& identity, const domain::IdentitySnapshot& snapshot);

private:
    std::shared_ptr<const AnalyticsPipeline> m_pipeline;
    AnalyticsStores m_stores;
};

} // namespace healthiq::application
