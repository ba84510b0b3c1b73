/**
 * @file HealthEvent.cpp
 * @brief Wire names for the event enums and timestamp access.
 */

#include "domain/HealthEvent.hpp"
#include "domain/AnalyticsErrors.hpp"

namespace healthiq::domain {

TimePoint TimeOf(const HealthEvent& event) {
    const auto& header = HeaderOf(event);
    try {
        return ParseIsoTimestamp(header.timestamp);
    } catch (const MalformedEventError& e) {
        throw MalformedEventError("Event '" + header.id + "': " + e.what());
    }
}

std::string EventTypeToString(HealthEventType type) {
    switch (type) {
        case HealthEventType::Medication: return "Medication";
        case HealthEventType::Symptom: return "Symptom";
        case HealthEventType::Lifestyle: return "Lifestyle";
        case HealthEventType::Clinical: return "Clinical";
        case HealthEventType::Insight: return "Insight";
        default: return "Unknown";
    }
}

std::optional<HealthEventType> EventTypeFromString(const std::string& value) {
    if (value == "Medication") return HealthEventType::Medication;
    if (value == "Symptom") return HealthEventType::Symptom;
    if (value == "Lifestyle") return HealthEventType::Lifestyle;
    if (value == "Clinical") return HealthEventType::Clinical;
    if (value == "Insight") return HealthEventType::Insight;
    return std::nullopt;
}

std::string EventSourceToString(EventSource source) {
    switch (source) {
        case EventSource::User: return "user";
        case EventSource::Prescription: return "prescription";
        case EventSource::Device: return "device";
        case EventSource::Doctor: return "doctor";
        default: return "user";
    }
}

std::optional<EventSource> EventSourceFromString(const std::string& value) {
    if (value == "user") return EventSource::User;
    if (value == "prescription") return EventSource::Prescription;
    if (value == "device") return EventSource::Device;
    if (value == "doctor") return EventSource::Doctor;
    return std::nullopt;
}

std::string ConfidenceToString(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::Low: return "low";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::High: return "high";
        default: return "medium";
    }
}

std::optional<ConfidenceLevel> ConfidenceFromString(const std::string& value) {
    if (value == "low") return ConfidenceLevel::Low;
    if (value == "medium") return ConfidenceLevel::Medium;
    if (value == "high") return ConfidenceLevel::High;
    return std::nullopt;
}

std::string VisibilityToString(VisibilityScope scope) {
    switch (scope) {
        case VisibilityScope::UserOnly: return "user-only";
        case VisibilityScope::DoctorShareable: return "doctor-shareable";
        default: return "user-only";
    }
}

std::optional<VisibilityScope> VisibilityFromString(const std::string& value) {
    if (value == "user-only") return VisibilityScope::UserOnly;
    if (value == "doctor-shareable") return VisibilityScope::DoctorShareable;
    return std::nullopt;
}

std::string AdherenceToString(AdherenceOutcome outcome) {
    switch (outcome) {
        case AdherenceOutcome::Taken: return "taken";
        case AdherenceOutcome::Missed: return "missed";
        case AdherenceOutcome::Delayed: return "delayed";
        default: return "taken";
    }
}

std::optional<AdherenceOutcome> AdherenceFromString(const std::string& value) {
    if (value == "taken") return AdherenceOutcome::Taken;
    if (value == "missed") return AdherenceOutcome::Missed;
    if (value == "delayed") return AdherenceOutcome::Delayed;
    return std::nullopt;
}

std::string ReviewStatusToString(InsightReviewStatus status) {
    return status == InsightReviewStatus::Reviewed ? "reviewed" : "draft";
}

std::optional<InsightReviewStatus> ReviewStatusFromString(const std::string& value) {
    if (value == "draft") return InsightReviewStatus::Draft;
    if (value == "reviewed") return InsightReviewStatus::Reviewed;
    return std::nullopt;
}

} // namespace healthiq::domain
