/**
 * @file AnalyticsPipeline.hpp
 * @brief One-shot orchestration: HSI, graph, alerts, risk and suggestions.
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "application/AlertEngine.hpp"
#include "application/GraphBuilder.hpp"
#include "application/HSIScorer.hpp"
#include "domain/Clock.hpp"

namespace healthiq::application {

struct AnalyticsResult {
    domain::HSIScore hsi;
    std::optional<domain::GraphSummary> graph;
    std::vector<domain::UserAlert> alerts;
    domain::RiskStatus risk;
    std::vector<domain::BehavioralSuggestion> suggestions;
    size_t eventCount = 0;

    /** @brief False while the window holds too little data to trust the score. */
    bool hasSufficientData() const { return hsi.dataConfidence != domain::DataConfidence::Low; }
};

/**
 * @class AnalyticsPipeline
 * @brief Stateless orchestrator; safe to share between threads.
 */
class AnalyticsPipeline {
public:
    /** @throws ConfigurationError if @p config is invalid. */
    AnalyticsPipeline(domain::AnalyticsConfig config, std::shared_ptr<const domain::Clock> clock);

    /**
     * @brief Runs the full computation over an ordered event sequence.
     * @param topN Graph summary size; the configured default when absent.
     * @throws ConfigurationError before any work if topN < 1.
     * @throws MalformedEventError on an unparseable event timestamp.
     */
    AnalyticsResult compute(const std::vector<domain::HealthEvent>& events,
                            const std::optional<domain::HSIScore>& previousHSI,
                            std::optional<int> topN = std::nullopt) const;

    const domain::AnalyticsConfig& config() const { return m_config; }
    const GraphBuilder& graphBuilder() const { return m_graphBuilder; }
    const HSIScorer& scorer() const { return m_scorer; }
    const AlertEngine& alertEngine() const { return m_alertEngine; }
    domain::TimePoint now() const { return m_clock->now(); }

private:
    domain::AnalyticsConfig m_config;
    std::shared_ptr<const domain::Clock> m_clock;
    GraphBuilder m_graphBuilder;
    HSIScorer m_scorer;
    AlertEngine m_alertEngine;
};

} // namespace healthiq::application
