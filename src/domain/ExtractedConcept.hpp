/**
 * @file ExtractedConcept.hpp
 * @brief Normalized concept label derived from a single event.
 */

#pragma once

#include <optional>
#include <string>

namespace healthiq::domain {

enum class ConceptCategory {
    Symptom,
    Medication,
    Lifestyle,
    Clinical
};

inline std::string CategoryToString(ConceptCategory category) {
    switch (category) {
        case ConceptCategory::Symptom: return "symptom";
        case ConceptCategory::Medication: return "medication";
        case ConceptCategory::Lifestyle: return "lifestyle";
        case ConceptCategory::Clinical: return "clinical";
        default: return "symptom";
    }
}

inline std::optional<ConceptCategory> CategoryFromString(const std::string& value) {
    if (value == "symptom") return ConceptCategory::Symptom;
    if (value == "medication") return ConceptCategory::Medication;
    if (value == "lifestyle") return ConceptCategory::Lifestyle;
    if (value == "clinical") return ConceptCategory::Clinical;
    return std::nullopt;
}

/**
 * @struct ExtractedConcept
 * @brief Ephemeral; recomputed from the event on demand and never stored.
 */
struct ExtractedConcept {
    std::string name; ///< Normalized label, e.g. "headache", "poor_sleep".
    ConceptCategory category = ConceptCategory::Symptom;
    std::string sourceEventId;
    std::string timestamp; ///< Copied from the source event's timestamp.absolute.
};

} // namespace healthiq::domain
