/**
 * @file ConceptExtractor.cpp
 * @brief Implementation of ConceptExtractor.
 */

#include "application/ConceptExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace healthiq::application {

using namespace healthiq::domain;

namespace {

ExtractedConcept MakeConcept(std::string name, ConceptCategory category, const EventHeader& header) {
    ExtractedConcept c;
    c.name = std::move(name);
    c.category = category;
    c.sourceEventId = header.id;
    c.timestamp = header.timestamp;
    return c;
}

std::string SpacesToUnderscores(std::string text) {
    std::replace(text.begin(), text.end(), ' ', '_');
    return text;
}

} // namespace

const std::vector<ConceptExtractor::SymptomPhrase>& ConceptExtractor::symptomPhrases() {
    static const std::vector<SymptomPhrase> kPhrases = {
        {"headache", "headache"},
        {"head pain", "headache"},
        {"migraine", "migraine"},
        {"head ache", "headache"},
        {"cephalgia", "headache"},
        {"nausea", "nausea"},
        {"feeling sick", "nausea"},
        {"queasy", "nausea"},
        {"vomiting", "vomiting"},
        {"throwing up", "vomiting"},
        {"fatigue", "fatigue"},
        {"tired", "fatigue"},
        {"exhaustion", "fatigue"},
        {"exhausted", "fatigue"},
        {"low energy", "fatigue"},
        {"insomnia", "insomnia"},
        {"trouble sleeping", "insomnia"},
        {"can't sleep", "insomnia"},
        {"difficulty sleeping", "insomnia"},
        {"back pain", "back_pain"},
        {"backache", "back_pain"},
        {"stomach pain", "stomach_pain"},
        {"abdominal pain", "stomach_pain"},
        {"belly pain", "stomach_pain"},
        {"chest pain", "chest_pain"},
        {"joint pain", "joint_pain"},
        {"arthralgia", "joint_pain"},
        {"dizziness", "dizziness"},
        {"dizzy", "dizziness"},
        {"lightheaded", "dizziness"},
        {"vertigo", "dizziness"},
        {"anxiety", "anxiety"},
        {"anxious", "anxiety"},
        {"worried", "anxiety"},
        {"depression", "depression"},
        {"depressed", "depression"},
        {"feeling down", "depression"},
        {"low mood", "depression"},
        {"cough", "cough"},
        {"coughing", "cough"},
        {"fever", "fever"},
        {"high temperature", "fever"},
        {"sore throat", "sore_throat"},
        {"throat pain", "sore_throat"},
        {"shortness of breath", "shortness_of_breath"},
        {"breathlessness", "shortness_of_breath"},
        {"difficulty breathing", "shortness_of_breath"},
        {"rash", "rash"},
        {"skin rash", "rash"},
        {"hives", "rash"},
        {"muscle pain", "muscle_pain"},
        {"myalgia", "muscle_pain"},
        {"constipation", "constipation"},
        {"diarrhea", "diarrhea"},
        {"bloating", "bloating"},
        {"swelling", "swelling"},
        {"palpitations", "palpitations"},
        {"heart racing", "palpitations"},
        {"weight gain", "weight_change"},
        {"weight loss", "weight_change"},
    };
    return kPhrases;
}

const std::vector<ConceptExtractor::LifestyleRule>& ConceptExtractor::lifestyleRules() {
    static const std::vector<LifestyleRule> kRules = {
        {"poor_sleep", {"poor sleep", "bad sleep", "didn't sleep", "insomnia", "restless", "woke up"}},
        {"good_sleep", {"good sleep", "slept well", "rested", "8 hours"}},
        {"high_stress", {"stressed", "high stress", "stressful", "anxious", "overwhelmed", "pressure"}},
        {"low_stress", {"relaxed", "calm", "no stress", "peaceful"}},
        {"exercise", {"exercise", "workout", "gym", "running", "walking", "yoga", "swimming"}},
        {"sedentary", {"sedentary", "no exercise", "inactive", "sat all day"}},
        {"healthy_eating", {"healthy food", "vegetables", "balanced", "fruits", "salad"}},
        {"unhealthy_eating", {"junk food", "fast food", "skipped meal", "sugar", "alcohol"}},
    };
    return kRules;
}

std::string ConceptExtractor::normalizeText(const std::string& text) {
    std::string kept;
    kept.reserve(text.size());
    for (unsigned char ch : text) {
        char c = static_cast<char>(std::tolower(ch));
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '\'' || std::isspace(static_cast<unsigned char>(c))) {
            kept.push_back(c);
        }
    }

    // Collapse whitespace and trim.
    std::stringstream ss(kept);
    std::string word;
    std::string out;
    while (ss >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::vector<ExtractedConcept> ConceptExtractor::fromSymptom(const SymptomEvent& event) {
    std::vector<ExtractedConcept> concepts;
    const std::string normalized = normalizeText(event.description);

    for (const auto& [phrase, label] : symptomPhrases()) {
        if (normalized.find(phrase) != std::string::npos) {
            concepts.push_back(MakeConcept(label, ConceptCategory::Symptom, event.header));
        }
    }

    if (concepts.empty()) {
        std::stringstream ss(normalized);
        std::string token;
        std::string shortDesc;
        for (int i = 0; i < 4 && (ss >> token); ++i) {
            if (!shortDesc.empty()) shortDesc += '_';
            shortDesc += token;
        }
        concepts.push_back(MakeConcept(shortDesc.empty() ? "unclassified_symptom" : shortDesc,
                                       ConceptCategory::Symptom, event.header));
    }
    return concepts;
}

std::vector<ExtractedConcept> ConceptExtractor::fromMedication(const MedicationEvent& event) {
    std::string name = SpacesToUnderscores(normalizeText(event.name));
    return {MakeConcept(name.empty() ? "unknown_medication" : name, ConceptCategory::Medication, event.header)};
}

std::vector<ExtractedConcept> ConceptExtractor::fromLifestyle(const LifestyleEvent& event) {
    std::vector<ExtractedConcept> concepts;

    std::string combined;
    for (const auto* field : {&event.sleep, &event.stress, &event.activity, &event.food}) {
        if (!field->has_value() || (*field)->empty()) continue;
        if (!combined.empty()) combined += ' ';
        combined += **field;
    }
    const std::string normalized = normalizeText(combined);

    for (const auto& rule : lifestyleRules()) {
        bool hit = std::any_of(rule.keywords.begin(), rule.keywords.end(), [&](const char* kw) {
            return normalized.find(kw) != std::string::npos;
        });
        if (hit) {
            concepts.push_back(MakeConcept(rule.label, ConceptCategory::Lifestyle, event.header));
        }
    }

    if (concepts.empty() && !combined.empty()) {
        concepts.push_back(MakeConcept("lifestyle_logged", ConceptCategory::Lifestyle, event.header));
    }
    return concepts;
}

std::vector<ExtractedConcept> ConceptExtractor::fromClinical(const ClinicalEvent& event) {
    std::vector<ExtractedConcept> concepts;
    if (event.diagnosisLabel) {
        std::string label = SpacesToUnderscores(normalizeText(*event.diagnosisLabel));
        if (!label.empty()) {
            concepts.push_back(MakeConcept(label, ConceptCategory::Clinical, event.header));
        }
    }
    concepts.push_back(MakeConcept("doctor_visit", ConceptCategory::Clinical, event.header));
    return concepts;
}

std::vector<ExtractedConcept> ConceptExtractor::extract(const HealthEvent& event) {
    return std::visit([](const auto& e) -> std::vector<ExtractedConcept> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SymptomEvent>) {
            return fromSymptom(e);
        } else if constexpr (std::is_same_v<T, MedicationEvent>) {
            return fromMedication(e);
        } else if constexpr (std::is_same_v<T, LifestyleEvent>) {
            return fromLifestyle(e);
        } else if constexpr (std::is_same_v<T, ClinicalEvent>) {
            return fromClinical(e);
        } else if constexpr (std::is_same_v<T, InsightEvent>) {
            return {}; // Insights are interpretations, not observations.
        } else {
            static_assert(kUnhandledEventKind<T>, "ConceptExtractor: unhandled HealthEvent kind");
        }
    }, event);
}

std::vector<ExtractedConcept> ConceptExtractor::extractBatch(const std::vector<HealthEvent>& events) {
    std::vector<ExtractedConcept> all;
    for (const auto& event : events) {
        auto concepts = extract(event);
        all.insert(all.end(), concepts.begin(), concepts.end());
    }
    return all;
}

} // namespace healthiq::application
