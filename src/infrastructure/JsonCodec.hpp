/**
 * @file JsonCodec.hpp
 * @brief JSON wire format for events, analytics records and identity snapshots.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AnalyticsPipeline.hpp"
#include "domain/Alert.hpp"
#include "domain/HSIScore.hpp"
#include "domain/HealthEvent.hpp"
#include "domain/HealthGraph.hpp"

namespace healthiq::infrastructure {

/** @brief Decoded input of a one-shot computation. */
struct ComputeInput {
    std::vector<domain::HealthEvent> events;
    std::optional<domain::HSIScore> previousHSI;
};

/**
 * @class JsonCodec
 * @brief Stateless conversions between domain records and nlohmann::json.
 *
 * Event decoding is strict: unknown eventType, a missing required field, a wrong
 * JSON type, a bad enum value or an unparseable timestamp.absolute all raise
 * MalformedEventError naming the offending event.
 */
class JsonCodec {
public:
    static domain::HealthEvent DecodeEvent(const nlohmann::json& j);
    static std::vector<domain::HealthEvent> DecodeEvents(const nlohmann::json& j);
    static nlohmann::json EncodeEvent(const domain::HealthEvent& event);
    static nlohmann::json EncodeEvents(const std::vector<domain::HealthEvent>& events);

    /** @brief Accepts a bare event array or an object {"events": [...], "previousHSI": {...}}. */
    static ComputeInput DecodeComputeInput(const nlohmann::json& j);

    static nlohmann::json EncodeHSIScore(const domain::HSIScore& score);
    /** @throws MalformedEventError on a structurally invalid snapshot. */
    static domain::HSIScore DecodeHSIScore(const nlohmann::json& j);

    static nlohmann::json EncodeGraphSummary(const domain::GraphSummary& summary);
    static nlohmann::json EncodeAlert(const domain::UserAlert& alert);
    /** @throws MalformedEventError on a structurally invalid alert. */
    static domain::UserAlert DecodeAlert(const nlohmann::json& j);
    static nlohmann::json EncodeRisk(const domain::RiskStatus& risk);
    static nlohmann::json EncodeSuggestion(const domain::BehavioralSuggestion& suggestion);
    static nlohmann::json EncodeResult(const application::AnalyticsResult& result);

    /** @brief Full graph (every node and edge) for persistence. */
    static nlohmann::json EncodeGraph(const domain::HealthGraph& graph);
    /** @throws MalformedEventError or std::runtime_error on an inconsistent snapshot. */
    static domain::HealthGraph DecodeGraph(const nlohmann::json& j);
};

} // namespace healthiq::infrastructure
