#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "application/HSIScorer.hpp"
#include "domain/AnalyticsErrors.hpp"
#include "test/TestEvents.hpp"

using namespace healthiq::domain;
using namespace healthiq::test;
using healthiq::application::HSIScorer;

namespace {

const TimePoint kNow = BaseTime() + kDay * 30;

std::string DayAt(int day) {
    return At(day * 24 + 12);
}

bool Near(const std::optional<double>& value, double expected) {
    return value && std::fabs(*value - expected) < 1e-9;
}

bool InRange(double v) {
    return v >= 0.0 && v <= 100.0 && std::isfinite(v);
}

void assertComposite(const HSIScore& s) {
    double expected = std::round(0.4 * s.symptomRegularity + 0.3 * s.behavioralConsistency + 0.3 * s.trajectoryDirection);
    assert(s.score == std::max(0.0, std::min(100.0, expected)));
}

void testIntensityParsing() {
    std::cout << "[Test] Intensity parsing..." << std::endl;
    assert(Near(HSIScorer::parseIntensity("7/10"), 7.0));
    assert(Near(HSIScorer::parseIntensity("pain 3 / 5 today"), 6.0));
    assert(Near(HSIScorer::parseIntensity("8"), 8.0));
    assert(Near(HSIScorer::parseIntensity("  5 out of ten"), 5.0));
    assert(Near(HSIScorer::parseIntensity("12"), 10.0));
    assert(Near(HSIScorer::parseIntensity("Mild"), 3.0));
    assert(Near(HSIScorer::parseIntensity("very severe"), 8.0));
    assert(Near(HSIScorer::parseIntensity("slightly annoying"), 2.0));
    assert(!HSIScorer::parseIntensity("pain 4/0"));
    assert(!HSIScorer::parseIntensity("none"));
    assert(!HSIScorer::parseIntensity(""));
    std::cout << "[PASS] Intensity parsing." << std::endl;
}

void testStatisticsHelpers() {
    std::cout << "[Test] CV and slope helpers..." << std::endl;
    assert(HSIScorer::coefficientOfVariation({}) == 0.0);
    assert(HSIScorer::coefficientOfVariation({4.0}) == 0.0);
    assert(HSIScorer::coefficientOfVariation({0.0, 0.0, 0.0}) == 0.0);
    assert(HSIScorer::coefficientOfVariation({2.0, 2.0, 2.0}) == 0.0);
    assert(std::fabs(HSIScorer::coefficientOfVariation({1.0, 3.0}) - 0.5) < 1e-12);

    assert(HSIScorer::linearSlope({5.0}) == 0.0);
    assert(std::fabs(HSIScorer::linearSlope({1.0, 2.0, 3.0, 4.0}) - 1.0) < 1e-12);
    assert(std::fabs(HSIScorer::linearSlope({6.0, 4.0, 2.0}) + 2.0) < 1e-12);
    std::cout << "[PASS] CV and slope helpers." << std::endl;
}

void testNeutralDefaults() {
    std::cout << "[Test] Neutral defaults on sparse data..." << std::endl;
    HSIScorer scorer;

    HSIScore empty = scorer.compute({}, 30, kNow);
    assert(empty.symptomRegularity == HSIScorer::kNeutralRegularity);
    assert(empty.behavioralConsistency == HSIScorer::kNeutralConsistency);
    assert(empty.trajectoryDirection == HSIScorer::kNeutralTrajectory);
    assert(empty.dataConfidence == DataConfidence::Low);
    assert(empty.contributingEventIds.empty());
    assert(empty.windowDays == 30);
    assert(empty.computedAt == kNow);
    assertComposite(empty);

    std::vector<HealthEvent> sparse = {
        Symptom("s1", DayAt(1), "headache", "5"),
        Symptom("s2", DayAt(2), "headache", "6"),
        Medication("m1", DayAt(3), "Ibuprofen"),
        Medication("m2", DayAt(4), "Ibuprofen", AdherenceOutcome::Missed),
    };
    HSIScore s = scorer.compute(sparse, 30, kNow);
    assert(s.symptomRegularity == 60.0);       // fewer than 3 symptoms
    assert(s.behavioralConsistency == 70.0);   // fewer than 3 medications, no lifestyle
    assert(s.trajectoryDirection == 55.0);     // fewer than 5 symptoms
    assertComposite(s);
    std::cout << "[PASS] Neutral defaults on sparse data." << std::endl;
}

void testWindowFiltering() {
    std::cout << "[Test] Window filtering..." << std::endl;
    HSIScorer scorer;
    std::vector<HealthEvent> events = {
        Symptom("before", At(-1), "cough"),
        Symptom("start", FormatIsoTimestamp(BaseTime()), "cough"),
        Symptom("mid", DayAt(10), "cough"),
        Insight("insight", DayAt(11), "mid"),
        Symptom("end", FormatIsoTimestamp(kNow), "cough"),
        Symptom("after", FormatIsoTimestamp(kNow + std::chrono::hours(1)), "cough"),
    };
    HSIScore s = scorer.compute(events, 30, kNow);
    assert((s.contributingEventIds == std::vector<std::string>{"start", "mid", "end"}));
    assert(InRange(s.symptomRegularity));

    bool threw = false;
    try {
        scorer.compute(events, 0, kNow);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        scorer.compute({Symptom("bad", "03/01/2024", "cough")}, 30, kNow);
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);

    // A far-future event must fail rather than land inside the window.
    threw = false;
    try {
        scorer.compute({Symptom("future", "2608-09-15T00:00:00Z", "cough")}, 30, kNow);
    } catch (const MalformedEventError&) {
        threw = true;
    }
    assert(threw);

    std::vector<HealthEvent> recent = {Symptom("recent", DayAt(29), "cough")};
    threw = false;
    try {
        scorer.compute(recent, 200000, kNow);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        scorer.compute(recent, kMaxWindowDays + 1, kNow);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    HSIScore widest = scorer.compute(recent, kMaxWindowDays, kNow);
    assert((widest.contributingEventIds == std::vector<std::string>{"recent"}));
    std::cout << "[PASS] Window filtering." << std::endl;
}

void testBehavioralConsistency() {
    std::cout << "[Test] Behavioral consistency..." << std::endl;
    HSIScorer scorer;
    std::vector<HealthEvent> meds = {
        Medication("m1", DayAt(1), "Metformin"),
        Medication("m2", DayAt(2), "Metformin"),
        Medication("m3", DayAt(3), "Metformin"),
        Medication("m4", DayAt(4), "Metformin", AdherenceOutcome::Missed),
    };
    assert(scorer.compute(meds, 30, kNow).behavioralConsistency == 75.0);

    std::vector<HealthEvent> mixed = meds;
    for (int day = 10; day < 16; ++day) {
        mixed.push_back(Lifestyle("l" + std::to_string(day), DayAt(day), "slept well"));
    }
    mixed.push_back(Lifestyle("l-dup", At(15 * 24 + 20), "slept well")); // same bucket as day 15
    // 0.6 * 75 + 0.4 * (6 / 30 * 100)
    assert(scorer.compute(mixed, 30, kNow).behavioralConsistency == 53.0);

    std::vector<HealthEvent> lifestyleOnly(mixed.begin() + 4, mixed.end());
    assert(scorer.compute(lifestyleOnly, 30, kNow).behavioralConsistency == 20.0);
    std::cout << "[PASS] Behavioral consistency." << std::endl;
}

void testEscalatingSymptomsDepressTrajectory() {
    std::cout << "[Test] Escalating symptom burden..." << std::endl;
    HSIScorer scorer;
    std::vector<HealthEvent> events;
    for (int i = 1; i <= 12; ++i) {
        std::ostringstream intensity;
        intensity << (1.0 + 0.5 * i) << "/10";
        events.push_back(Symptom("s" + std::to_string(i), DayAt(17 + i), "Headache", intensity.str()));
    }

    HSIScore s = scorer.compute(events, 30, kNow);
    assert(s.trajectoryDirection == 30.0); // slope 0.5 -> 60 - 30
    assert(s.trajectoryDirection < 40.0);
    assert(InRange(s.symptomRegularity));
    assert(InRange(s.score));
    assertComposite(s);
    assert(s.contributingEventIds.size() == 12);

    std::vector<HealthEvent> improving;
    for (int i = 1; i <= 6; ++i) {
        improving.push_back(Symptom("r" + std::to_string(i), DayAt(20 + i), "back pain", std::to_string(9 - i)));
    }
    assert(scorer.compute(improving, 30, kNow).trajectoryDirection == 95.0); // slope -1 -> clamped
    std::cout << "[PASS] Escalating symptom burden." << std::endl;
}

void testDiversityPenaltyAndBounds() {
    std::cout << "[Test] Diversity penalty and bounds..." << std::endl;
    HSIScorer scorer;
    const char* descriptions[] = {"cough", "fever", "rash", "nausea", "dizzy", "tired", "back pain", "itchy eyes",
                                  "sore throat", "chest pain", "bloating", "hives"};
    std::vector<HealthEvent> scattered;
    for (int i = 0; i < 12; ++i) {
        scattered.push_back(Symptom("d" + std::to_string(i), DayAt(i * 2), descriptions[i], i % 2 ? "extreme" : "1"));
    }
    HSIScore s = scorer.compute(scattered, 30, kNow);
    assert(s.symptomRegularity >= 5.0);
    assert(s.symptomRegularity <= 40.0); // 7 extra descriptions cost 21 points
    assert(InRange(s.score) && InRange(s.behavioralConsistency) && InRange(s.trajectoryDirection));
    std::cout << "[PASS] Diversity penalty and bounds." << std::endl;
}

void testDataConfidence() {
    std::cout << "[Test] Data confidence tiers..." << std::endl;
    HSIScorer scorer;

    std::vector<HealthEvent> rich;
    for (int day = 0; day < 30; ++day) {
        std::string id = "e" + std::to_string(day);
        switch (day % 3) {
            case 0: rich.push_back(Symptom(id, DayAt(day), "headache", "4")); break;
            case 1: rich.push_back(Medication(id, DayAt(day), "Ibuprofen")); break;
            default: rich.push_back(Lifestyle(id, DayAt(day), "slept well")); break;
        }
    }
    assert(scorer.compute(rich, 30, kNow).dataConfidence == DataConfidence::High);

    std::vector<HealthEvent> medium;
    for (int day = 0; day <= 14; ++day) {
        std::string id = "m" + std::to_string(day);
        if (day % 2) medium.push_back(Medication(id, DayAt(day), "Ibuprofen"));
        else medium.push_back(Symptom(id, DayAt(day), "headache"));
    }
    HSIScore m = scorer.compute(medium, 30, kNow);
    assert(m.contributingEventIds.size() == 15);
    assert(m.dataConfidence == DataConfidence::Medium);

    medium.pop_back();
    assert(scorer.compute(medium, 30, kNow).dataConfidence == DataConfidence::Low);
    std::cout << "[PASS] Data confidence tiers." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting HSIScorer Test..." << std::endl;
    testIntensityParsing();
    testStatisticsHelpers();
    testNeutralDefaults();
    testWindowFiltering();
    testBehavioralConsistency();
    testEscalatingSymptomsDepressTrajectory();
    testDiversityPenaltyAndBounds();
    testDataConfidence();
    std::cout << "[PASS] HSIScorer Test." << std::endl;
    return 0;
}
