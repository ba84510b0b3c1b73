/**
 * @file HealthEvent.hpp
 * @brief Timeline event kinds consumed by the analytics pipeline.
 *
 * The event set is closed: HealthEvent is a std::variant and every consumer
 * dispatches with std::visit, so adding a kind breaks the build until each
 * component handles it.
 */

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "domain/Timestamp.hpp"

namespace healthiq::domain {

enum class HealthEventType {
    Medication,
    Symptom,
    Lifestyle,
    Clinical,
    Insight
};

enum class EventSource {
    User,
    Prescription,
    Device,
    Doctor
};

/** @brief Capture/interpretation reliability, not disease likelihood. */
enum class ConfidenceLevel {
    Low,
    Medium,
    High
};

enum class VisibilityScope {
    UserOnly,
    DoctorShareable
};

enum class AdherenceOutcome {
    Taken,
    Missed,
    Delayed
};

enum class InsightReviewStatus {
    Draft,
    Reviewed
};

/**
 * @struct EventHeader
 * @brief Fields shared by every event kind.
 */
struct EventHeader {
    std::string id;
    std::string timestamp;                 ///< timestamp.absolute, ISO-8601.
    EventSource source = EventSource::User;
    ConfidenceLevel confidence = ConfidenceLevel::Medium;
    VisibilityScope visibilityScope = VisibilityScope::UserOnly;
    std::vector<std::string> tags;
    std::string notes;
};

struct SymptomEvent {
    static constexpr HealthEventType Type = HealthEventType::Symptom;
    EventHeader header;
    std::string description;
    std::optional<std::string> intensity;   ///< User-chosen wording: "mild", "7/10", ...
    std::optional<std::string> userReportedContext;
};

struct MedicationEvent {
    static constexpr HealthEventType Type = HealthEventType::Medication;
    EventHeader header;
    std::string name;
    std::string dosage;
    std::string intendedSchedule;
    AdherenceOutcome adherenceOutcome = AdherenceOutcome::Taken;
};

struct LifestyleEvent {
    static constexpr HealthEventType Type = HealthEventType::Lifestyle;
    EventHeader header;
    std::optional<std::string> sleep;
    std::optional<std::string> stress;
    std::optional<std::string> activity;
    std::optional<std::string> food;
};

struct ClinicalEvent {
    static constexpr HealthEventType Type = HealthEventType::Clinical;
    EventHeader header;
    std::string doctorVisit;
    std::optional<std::string> diagnosisLabel;
};

/** @brief Reviewed or draft interpretation; excluded from analytics. */
struct InsightEvent {
    static constexpr HealthEventType Type = HealthEventType::Insight;
    EventHeader header;
    std::vector<std::string> evidenceEventIds;
    InsightReviewStatus reviewStatus = InsightReviewStatus::Draft;
};

using HealthEvent = std::variant<
    MedicationEvent,
    SymptomEvent,
    LifestyleEvent,
    ClinicalEvent,
    InsightEvent
>;

/** @brief Compile-time guard for exhaustive if-constexpr chains over HealthEvent. */
template <typename>
inline constexpr bool kUnhandledEventKind = false;

inline const EventHeader& HeaderOf(const HealthEvent& event) {
    return std::visit([](const auto& e) -> const EventHeader& { return e.header; }, event);
}

inline HealthEventType TypeOf(const HealthEvent& event) {
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::Type; }, event);
}

inline const std::string& IdOf(const HealthEvent& event) {
    return HeaderOf(event).id;
}

/**
 * @brief Parsed timestamp of an event.
 * @throws MalformedEventError if timestamp.absolute is not valid ISO-8601.
 */
TimePoint TimeOf(const HealthEvent& event);

std::string EventTypeToString(HealthEventType type);
std::optional<HealthEventType> EventTypeFromString(const std::string& value);

std::string EventSourceToString(EventSource source);
std::optional<EventSource> EventSourceFromString(const std::string& value);

std::string ConfidenceToString(ConfidenceLevel level);
std::optional<ConfidenceLevel> ConfidenceFromString(const std::string& value);

std::string VisibilityToString(VisibilityScope scope);
std::optional<VisibilityScope> VisibilityFromString(const std::string& value);

std::string AdherenceToString(AdherenceOutcome outcome);
std::optional<AdherenceOutcome> AdherenceFromString(const std::string& value);

std::string ReviewStatusToString(InsightReviewStatus status);
std::optional<InsightReviewStatus> ReviewStatusFromString(const std::string& value);

} // namespace healthiq::domain
