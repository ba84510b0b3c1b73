/**
 * @file AlertEngine.hpp
 * @brief Rule-based alerts, risk tier and template suggestions.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/Alert.hpp"
#include "domain/AnalyticsConfig.hpp"
#include "domain/HSIScore.hpp"
#include "domain/HealthEvent.hpp"
#include "domain/HealthGraph.hpp"

namespace healthiq::application {

/**
 * @struct AlertEvaluationContext
 * @brief Everything one evaluation pass looks at.
 */
struct AlertEvaluationContext {
    domain::HSIScore currentHSI;
    std::optional<domain::HSIScore> previousHSI;
    std::vector<domain::HealthEvent> events;
    std::optional<domain::GraphSummary> graphSummary;
    domain::TimePoint now;
};

/**
 * @class AlertEngine
 * @brief Deterministic rules only. Nothing here generates free text.
 */
class AlertEngine {
public:
    explicit AlertEngine(domain::AnalyticsConfig config = {});

    /**
     * @brief Runs every rule in fixed order.
     *
     * Returns nothing during cold start (too few events or too short a history).
     * Returned alerts have no id; the alert store assigns one.
     *
     * @throws MalformedEventError if any event timestamp is unparseable.
     */
    std::vector<domain::UserAlert> evaluate(const AlertEvaluationContext& context) const;

    /** @brief Only unacknowledged alerts count. */
    domain::RiskStatus computeRisk(const domain::HSIScore& hsi,
                                   const std::vector<domain::UserAlert>& alerts) const;

    std::vector<domain::BehavioralSuggestion> suggest(const domain::HSIScore& hsi,
                                                      const std::vector<domain::UserAlert>& alerts,
                                                      const std::optional<domain::GraphSummary>& graph) const;

    /** @brief True once enough history exists for rules to run. */
    bool pastColdStart(const std::vector<domain::HealthEvent>& events, domain::TimePoint now) const;

private:
    struct TimedEvent {
        const domain::HealthEvent* event;
        domain::TimePoint at;
    };

    std::optional<domain::UserAlert> hsiDrop(const AlertEvaluationContext& context) const;
    std::optional<domain::UserAlert> newSymptomCluster(const std::vector<TimedEvent>& events, domain::TimePoint now) const;
    std::optional<domain::UserAlert> adherenceDecline(const std::vector<TimedEvent>& events, domain::TimePoint now) const;
    std::optional<domain::UserAlert> loggingGap(const std::vector<TimedEvent>& events, domain::TimePoint now) const;
    std::optional<domain::UserAlert> symptomEscalation(const std::vector<TimedEvent>& events, domain::TimePoint now) const;
    std::optional<domain::UserAlert> coOccurrenceSpike(const std::optional<domain::GraphSummary>& graph,
                                                       domain::TimePoint now) const;

    domain::AnalyticsConfig m_config;
};

} // namespace healthiq::application
