/**
 * @file HSIScorer.cpp
 * @brief Implementation of HSIScorer.
 */

#include "application/HSIScorer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace healthiq::application {

using namespace healthiq::domain;

namespace {

double Clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

std::string ToLower(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string DescriptionKey(const std::string& description) {
    std::string lower = ToLower(description);
    auto first = lower.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = lower.find_last_not_of(" \t\r\n");
    return lower.substr(first, last - first + 1);
}

/**
 * @brief Reads digits[.digits] starting at @p pos.
 * @return The value and the position just past it, or std::nullopt when no digit is at @p pos.
 */
std::optional<std::pair<double, size_t>> ReadNumber(const std::string& text, size_t pos) {
    size_t i = pos;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i == pos) return std::nullopt;
    if (i + 1 < text.size() && text[i] == '.' && std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    }
    return std::make_pair(std::stod(text.substr(pos, i - pos)), i);
}

size_t SkipSpaces(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    return pos;
}

/** @brief "a / b" anywhere in the text, with an integer denominator. */
std::optional<std::pair<double, double>> FindFraction(const std::string& text) {
    for (size_t start = 0; start < text.size(); ++start) {
        auto numerator = ReadNumber(text, start);
        if (!numerator) continue;
        size_t pos = SkipSpaces(text, numerator->second);
        if (pos >= text.size() || text[pos] != '/') continue;
        pos = SkipSpaces(text, pos + 1);
        size_t digitsEnd = pos;
        while (digitsEnd < text.size() && std::isdigit(static_cast<unsigned char>(text[digitsEnd]))) ++digitsEnd;
        if (digitsEnd == pos) continue;
        return std::make_pair(numerator->first, std::stod(text.substr(pos, digitsEnd - pos)));
    }
    return std::nullopt;
}

const std::vector<std::pair<const char*, double>>& IntensityKeywords() {
    static const std::vector<std::pair<const char*, double>> keywords = {
        {"mild", 3}, {"slight", 2}, {"moderate", 5}, {"severe", 8}, {"extreme", 10},
        {"low", 2}, {"medium", 5}, {"high", 8}, {"very", 7}, {"terrible", 9}, {"awful", 9},
    };
    return keywords;
}

} // namespace

HSIScorer::HSIScorer(AnalyticsConfig config) : m_config(std::move(config)) {
    m_config.validate();
}

std::optional<double> HSIScorer::parseIntensity(const std::string& raw) {
    if (auto fraction = FindFraction(raw)) {
        if (fraction->second != 0) {
            return Clamp(fraction->first / fraction->second * 10.0, 0.0, 10.0);
        }
    }

    if (auto leading = ReadNumber(raw, SkipSpaces(raw, 0))) {
        return Clamp(leading->first, 0.0, 10.0);
    }

    std::string lower = ToLower(raw);
    for (const auto& [keyword, value] : IntensityKeywords()) {
        if (lower.find(keyword) != std::string::npos) return value;
    }
    return std::nullopt;
}

double HSIScorer::coefficientOfVariation(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    double mean = sum / static_cast<double>(values.size());
    if (mean == 0.0) return 0.0;
    double variance = 0.0;
    for (double v : values) variance += (v - mean) * (v - mean);
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance) / mean;
}

double HSIScorer::linearSlope(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double n = static_cast<double>(values.size());
    double sumX = 0, sumY = 0, sumXY = 0, sumX2 = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        double x = static_cast<double>(i);
        sumX += x;
        sumY += values[i];
        sumXY += x * values[i];
        sumX2 += x * x;
    }
    double denom = n * sumX2 - sumX * sumX;
    if (denom == 0.0) return 0.0;
    return (n * sumXY - sumX * sumY) / denom;
}

double HSIScorer::symptomRegularity(const std::vector<Bucketed>& symptoms, int windowDays) const {
    if (symptoms.size() < 3) return kNeutralRegularity;

    std::vector<double> dailyCounts(static_cast<size_t>(windowDays), 0.0);
    std::vector<double> intensities;
    std::set<std::string> descriptions;
    for (const auto& item : symptoms) {
        const auto& symptom = std::get<SymptomEvent>(*item.event);
        dailyCounts[static_cast<size_t>(item.bucket)] += 1.0;
        if (symptom.intensity) {
            if (auto value = parseIntensity(*symptom.intensity)) intensities.push_back(*value);
        }
        descriptions.insert(DescriptionKey(symptom.description));
    }

    double countScore = Clamp(90.0 - 50.0 * coefficientOfVariation(dailyCounts), 10.0, 95.0);
    double intensityScore = kNeutralIntensityRegularity;
    if (intensities.size() >= 3) {
        intensityScore = Clamp(85.0 - 40.0 * coefficientOfVariation(intensities), 10.0, 95.0);
    }

    double diversityPenalty = 3.0 * std::max(0.0, static_cast<double>(descriptions.size()) - 5.0);
    double blended = (countScore + intensityScore) / 2.0 - diversityPenalty;
    return std::round(std::max(5.0, blended));
}

double HSIScorer::behavioralConsistency(const std::vector<Bucketed>& medications,
                                        const std::vector<Bucketed>& lifestyle,
                                        int windowDays) const {
    std::optional<double> adherence;
    if (medications.size() >= 3) {
        size_t taken = 0;
        for (const auto& item : medications) {
            if (std::get<MedicationEvent>(*item.event).adherenceOutcome == AdherenceOutcome::Taken) ++taken;
        }
        adherence = 100.0 * static_cast<double>(taken) / static_cast<double>(medications.size());
    }

    std::optional<double> coverage;
    if (!lifestyle.empty()) {
        std::set<int> days;
        for (const auto& item : lifestyle) days.insert(item.bucket);
        coverage = 100.0 * std::min(1.0, static_cast<double>(days.size()) / static_cast<double>(windowDays));
    }

    if (adherence && coverage) return std::round(0.6 * *adherence + 0.4 * *coverage);
    if (adherence) return std::round(*adherence);
    if (coverage) return std::round(*coverage);
    return kNeutralConsistency;
}

double HSIScorer::trajectoryDirection(const std::vector<Bucketed>& symptoms) const {
    if (symptoms.size() < 5) return kNeutralTrajectory;

    // bucket -> (count, summed intensity)
    std::map<int, std::pair<int, double>> burdenByDay;
    for (const auto& item : symptoms) {
        const auto& symptom = std::get<SymptomEvent>(*item.event);
        double intensity = kUnratedIntensity;
        if (symptom.intensity) {
            if (auto value = parseIntensity(*symptom.intensity)) intensity = *value;
        }
        auto& day = burdenByDay[item.bucket];
        day.first += 1;
        day.second += intensity;
    }

    std::vector<double> burden;
    burden.reserve(burdenByDay.size());
    for (const auto& [bucket, day] : burdenByDay) {
        burden.push_back(day.first * (day.second / day.first));
    }

    return std::round(Clamp(60.0 - 60.0 * linearSlope(burden), 10.0, 95.0));
}

HSIScore HSIScorer::compute(const std::vector<HealthEvent>& events, TimePoint now) const {
    return compute(events, m_config.hsiWindowDays, now);
}

HSIScore HSIScorer::compute(const std::vector<HealthEvent>& events, int windowDays, TimePoint now) const {
    if (windowDays <= 0 || windowDays > kMaxWindowDays) {
        throw ConfigurationError("HSI windowDays must be in [1, " + std::to_string(kMaxWindowDays) + "], got " +
                                 std::to_string(windowDays));
    }

    const TimePoint windowStart = now - kDay * windowDays;

    std::vector<Bucketed> symptoms;
    std::vector<Bucketed> medications;
    std::vector<Bucketed> lifestyle;
    std::set<HealthEventType> types;
    std::vector<std::string> contributing;
    std::optional<TimePoint> earliest;
    std::optional<TimePoint> latest;

    for (const auto& event : events) {
        TimePoint at = TimeOf(event);
        HealthEventType type = TypeOf(event);
        if (type == HealthEventType::Insight) continue;
        if (at < windowStart || at > now) continue;

        int bucket = static_cast<int>((at - windowStart) / kDay);
        bucket = std::min(bucket, windowDays - 1);
        Bucketed item{&event, bucket};

        switch (type) {
            case HealthEventType::Symptom: symptoms.push_back(item); break;
            case HealthEventType::Medication: medications.push_back(item); break;
            case HealthEventType::Lifestyle: lifestyle.push_back(item); break;
            default: break;
        }

        types.insert(type);
        contributing.push_back(IdOf(event));
        earliest = earliest ? std::min(*earliest, at) : at;
        latest = latest ? std::max(*latest, at) : at;
    }

    HSIScore result;
    result.windowDays = windowDays;
    result.computedAt = now;
    result.symptomRegularity = symptomRegularity(symptoms, windowDays);
    result.behavioralConsistency = behavioralConsistency(medications, lifestyle, windowDays);
    result.trajectoryDirection = trajectoryDirection(symptoms);

    double composite = m_config.regularityWeight * result.symptomRegularity
                     + m_config.consistencyWeight * result.behavioralConsistency
                     + m_config.trajectoryWeight * result.trajectoryDirection;
    result.score = Clamp(std::round(composite), 0.0, 100.0);

    double spanDays = earliest ? DaysBetween(*earliest, *latest) : 0.0;
    size_t count = contributing.size();
    if (count >= 30 && types.size() >= 3 && spanDays >= 21.0) {
        result.dataConfidence = DataConfidence::High;
    } else if (count >= 15 && types.size() >= 2 && spanDays >= 14.0) {
        result.dataConfidence = DataConfidence::Medium;
    } else {
        result.dataConfidence = DataConfidence::Low;
    }

    result.contributingEventIds = std::move(contributing);
    return result;
}

} // namespace healthiq::application
