/**
 * @file Alert.hpp
 * @brief Alert, risk tier and behavioral suggestion records produced by the alert engine.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Timestamp.hpp"

namespace healthiq::domain {

/**
 * @enum AlertRuleType
 * @brief Built-in rule templates, in evaluation order.
 */
enum class AlertRuleType {
    HsiDrop,
    NewSymptomCluster,
    AdherenceDecline,
    LoggingGap,
    SymptomEscalation,
    CoOccurrenceSpike
};

enum class AlertSeverity {
    Info,       ///< Informational, no action needed.
    Warning,    ///< Monitor closely.
    Attention   ///< Review recommended.
};

enum class RiskLevel {
    Green,
    Yellow,
    Orange
};

inline std::string RuleTypeToString(AlertRuleType type) {
    switch (type) {
        case AlertRuleType::HsiDrop: return "hsi_drop";
        case AlertRuleType::NewSymptomCluster: return "new_symptom_cluster";
        case AlertRuleType::AdherenceDecline: return "adherence_decline";
        case AlertRuleType::LoggingGap: return "logging_gap";
        case AlertRuleType::SymptomEscalation: return "symptom_escalation";
        case AlertRuleType::CoOccurrenceSpike: return "co_occurrence_spike";
        default: return "unknown";
    }
}

inline std::optional<AlertRuleType> RuleTypeFromString(const std::string& value) {
    if (value == "hsi_drop") return AlertRuleType::HsiDrop;
    if (value == "new_symptom_cluster") return AlertRuleType::NewSymptomCluster;
    if (value == "adherence_decline") return AlertRuleType::AdherenceDecline;
    if (value == "logging_gap") return AlertRuleType::LoggingGap;
    if (value == "symptom_escalation") return AlertRuleType::SymptomEscalation;
    if (value == "co_occurrence_spike") return AlertRuleType::CoOccurrenceSpike;
    return std::nullopt;
}

inline std::string SeverityToString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Info: return "info";
        case AlertSeverity::Warning: return "warning";
        case AlertSeverity::Attention: return "attention";
        default: return "info";
    }
}

inline std::optional<AlertSeverity> SeverityFromString(const std::string& value) {
    if (value == "info") return AlertSeverity::Info;
    if (value == "warning") return AlertSeverity::Warning;
    if (value == "attention") return AlertSeverity::Attention;
    return std::nullopt;
}

inline std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Green: return "green";
        case RiskLevel::Yellow: return "yellow";
        case RiskLevel::Orange: return "orange";
        default: return "green";
    }
}

/**
 * @struct UserAlert
 * @brief Created once by the engine; the only later mutation is acknowledgment.
 */
struct UserAlert {
    std::string id; ///< Empty until the alert store accepts it.
    AlertRuleType ruleType = AlertRuleType::HsiDrop;
    TimePoint triggeredAt;
    AlertSeverity severity = AlertSeverity::Info;
    std::string title;
    std::string explanation;
    std::vector<std::string> evidenceIds;
    bool acknowledged = false;
    std::optional<TimePoint> acknowledgedAt;
};

struct RiskStatus {
    RiskLevel level = RiskLevel::Green;
    double hsiScore = 0.0;
    int activeAlertCount = 0;
    int warningCount = 0;
    int attentionCount = 0;
    std::string description;
};

/** @brief Fixed-template suggestion; never free-form generated text. */
struct BehavioralSuggestion {
    std::string category;
    std::string suggestion;
    std::string basedOn;
};

} // namespace healthiq::domain
