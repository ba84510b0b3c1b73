/**
 * @file AnalyticsConfig.hpp
 * @brief Tunable constants for graph, scoring and alerting.
 */

#pragma once

#include <chrono>
#include <cmath>
#include <string>

#include "domain/AnalyticsErrors.hpp"
#include "domain/Timestamp.hpp"

namespace healthiq::domain {

/**
 * @struct AnalyticsConfig
 * @brief Defaults reproduce the production thresholds; overrides come from settings.json.
 */
struct AnalyticsConfig {
    // Graph
    std::chrono::hours coOccurrenceWindow{48};
    int defaultTopN = 15;
    int maxTopN = 50;

    // HSI
    int hsiWindowDays = 30;
    double regularityWeight = 0.4;
    double consistencyWeight = 0.3;
    double trajectoryWeight = 0.3;

    // Alert rules
    double hsiDropThreshold = -10.0;
    int newSymptomMinimum = 3;
    int newSymptomRecentDays = 14;
    int newSymptomLookbackDays = 60;
    double adherenceFloorPct = 70.0;
    int adherenceSampleMinimum = 5;
    int adherenceWindowDays = 14;
    int engagementMinimumEvents = 20;
    int loggingGapDays = 7;
    int escalationRun = 3;
    double coOccurrenceSpikeWeight = 4.0;

    // Cold start
    int coldStartMinEvents = 10;
    int coldStartMinDays = 14;

    // Persistence
    std::chrono::hours alertDedupWindow{24};

    /**
     * @brief Rejects values no computation can run with.
     * @throws ConfigurationError describing the first offending field.
     */
    void validate() const {
        if (coOccurrenceWindow.count() < 0 || coOccurrenceWindow > kDay * kMaxWindowDays) {
            fail("coOccurrenceWindowHours must be in [0, " + std::to_string(kMaxWindowDays * 24) + "]");
        }
        if (defaultTopN < 1) fail("defaultTopN must be >= 1");
        if (maxTopN < 1) fail("maxTopN must be >= 1");
        if (!InDayRange(hsiWindowDays)) fail("hsiWindowDays" + DayRangeText());
        if (regularityWeight < 0 || consistencyWeight < 0 || trajectoryWeight < 0) {
            fail("HSI weights must be non-negative");
        }
        if (std::fabs(regularityWeight + consistencyWeight + trajectoryWeight - 1.0) > 1e-6) {
            fail("HSI weights must sum to 1.0");
        }
        if (hsiDropThreshold >= 0) fail("hsiDropThreshold must be negative");
        if (newSymptomMinimum < 1) fail("newSymptomMinimum must be >= 1");
        if (newSymptomRecentDays < 1 || newSymptomLookbackDays <= newSymptomRecentDays ||
            newSymptomLookbackDays > kMaxWindowDays) {
            fail("newSymptom windows must satisfy 1 <= recent < lookback <= " + std::to_string(kMaxWindowDays));
        }
        if (adherenceFloorPct < 0 || adherenceFloorPct > 100) fail("adherenceFloorPct must be in [0, 100]");
        if (adherenceSampleMinimum < 1) fail("adherenceSampleMinimum must be >= 1");
        if (!InDayRange(adherenceWindowDays)) fail("adherenceWindowDays" + DayRangeText());
        if (engagementMinimumEvents < 0) fail("engagementMinimumEvents must be >= 0");
        if (!InDayRange(loggingGapDays)) fail("loggingGapDays" + DayRangeText());
        if (escalationRun < 2) fail("escalationRun must be >= 2");
        if (coOccurrenceSpikeWeight <= 0) fail("coOccurrenceSpikeWeight must be > 0");
        if (coldStartMinEvents < 0 || coldStartMinDays < 0) fail("cold start thresholds must be >= 0");
        if (coldStartMinDays > kMaxWindowDays) fail("coldStartMinDays must be <= " + std::to_string(kMaxWindowDays));
        if (alertDedupWindow.count() < 0 || alertDedupWindow > kDay * kMaxWindowDays) {
            fail("alertDedupWindowHours must be in [0, " + std::to_string(kMaxWindowDays * 24) + "]");
        }
    }

private:
    static bool InDayRange(int days) { return days >= 1 && days <= kMaxWindowDays; }
    static std::string DayRangeText() { return " must be in [1, " + std::to_string(kMaxWindowDays) + "]"; }

    [[noreturn]] static void fail(const std::string& message) {
        throw ConfigurationError("Invalid analytics configuration: " + message);
    }
};

} // namespace healthiq::domain
