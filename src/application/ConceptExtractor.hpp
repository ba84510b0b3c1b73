/**
 * @file ConceptExtractor.hpp
 * @brief Deterministic mapping from timeline events to normalized health concepts.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/ExtractedConcept.hpp"
#include "domain/HealthEvent.hpp"

namespace healthiq::application {

/**
 * @class ConceptExtractor
 * @brief Keyword/phrase matching only; no I/O and no model calls.
 *
 * Phrase tables are ordered vectors and are scanned in declaration order, so the
 * emitted concepts are reproducible. Every matching phrase yields its own concept:
 * "severe headache and nausea" produces both "headache" and "nausea".
 */
class ConceptExtractor {
public:
    /** @brief Concepts for one event, in table order. Insight events yield none. */
    static std::vector<domain::ExtractedConcept> extract(const domain::HealthEvent& event);

    /** @brief Concatenation of extract() over @p events, preserving input order. */
    static std::vector<domain::ExtractedConcept> extractBatch(const std::vector<domain::HealthEvent>& events);

    /**
     * @brief Lowercases, drops everything except [a-z0-9], whitespace, '-' and '\'',
     * collapses whitespace runs and trims.
     */
    static std::string normalizeText(const std::string& text);

    using SymptomPhrase = std::pair<const char*, const char*>;
    struct LifestyleRule {
        const char* label;
        std::vector<const char*> keywords;
    };

    static const std::vector<SymptomPhrase>& symptomPhrases();
    static const std::vector<LifestyleRule>& lifestyleRules();

private:
    static std::vector<domain::ExtractedConcept> fromSymptom(const domain::SymptomEvent& event);
    static std::vector<domain::ExtractedConcept> fromMedication(const domain::MedicationEvent& event);
    static std::vector<domain::ExtractedConcept> fromLifestyle(const domain::LifestyleEvent& event);
    static std::vector<domain::ExtractedConcept> fromClinical(const domain::ClinicalEvent& event);
};

} // namespace healthiq::application
