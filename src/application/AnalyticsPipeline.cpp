/**
 * @file AnalyticsPipeline.cpp
 * @brief Implementation of AnalyticsPipeline.
 */

#include "application/AnalyticsPipeline.hpp"

#include <stdexcept>

namespace healthiq::application {

using namespace healthiq::domain;

AnalyticsPipeline::AnalyticsPipeline(AnalyticsConfig config, std::shared_ptr<const Clock> clock)
    : m_config(std::move(config)),
      m_clock(std::move(clock)),
      m_graphBuilder(m_config),
      m_scorer(m_config),
      m_alertEngine(m_config) {
    if (!m_clock) {
        throw std::invalid_argument("AnalyticsPipeline requires a clock");
    }
}

AnalyticsResult AnalyticsPipeline::compute(const std::vector<HealthEvent>& events,
                                           const std::optional<HSIScore>& previousHSI,
                                           std::optional<int> topN) const {
    const size_t limit = m_graphBuilder.resolveTopN(topN.value_or(m_config.defaultTopN));
    const TimePoint now = m_clock->now();

    AnalyticsResult result;
    result.eventCount = events.size();
    result.hsi = m_scorer.compute(events, m_config.hsiWindowDays, now);
    result.graph = m_graphBuilder.buildGraph(events).summarize(limit);

    AlertEvaluationContext context{result.hsi, previousHSI, events, result.graph, now};
    result.alerts = m_alertEngine.evaluate(context);
    result.risk = m_alertEngine.computeRisk(result.hsi, result.alerts);
    result.suggestions = m_alertEngine.suggest(result.hsi, result.alerts, result.graph);
    return result;
}

} // namespace healthiq::application
