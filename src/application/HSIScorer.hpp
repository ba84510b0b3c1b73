/**
 * @file HSIScorer.hpp
 * @brief Health Stability Index: composite of symptom regularity, behavioral
 *        consistency and trajectory direction over a rolling window.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/AnalyticsConfig.hpp"
#include "domain/HSIScore.hpp"
#include "domain/HealthEvent.hpp"

namespace healthiq::application {

/**
 * @class HSIScorer
 * @brief Stateless and deterministic given @p now.
 *
 * Each dimension falls back to a fixed neutral value when the window holds too
 * little data, so the score is always a finite number in [0, 100].
 */
class HSIScorer {
public:
    static constexpr double kNeutralRegularity = 60.0;
    static constexpr double kNeutralIntensityRegularity = 70.0;
    static constexpr double kNeutralConsistency = 70.0;
    static constexpr double kNeutralTrajectory = 55.0;
    static constexpr double kUnratedIntensity = 5.0;

    explicit HSIScorer(domain::AnalyticsConfig config = {});

    /**
     * @brief Scores the events inside [now - windowDays, now].
     * @throws ConfigurationError if windowDays is outside [1, kMaxWindowDays].
     * @throws MalformedEventError if any event timestamp is unparseable.
     */
    domain::HSIScore compute(const std::vector<domain::HealthEvent>& events,
                             int windowDays,
                             domain::TimePoint now) const;

    /** @brief Same with the configured window length. */
    domain::HSIScore compute(const std::vector<domain::HealthEvent>& events, domain::TimePoint now) const;

    /**
     * @brief Maps free-form intensity wording to [0, 10].
     *
     * "a/b" anywhere reads as a/b*10, then a leading number, then the first
     * matching keyword ("mild", "severe", ...).
     */
    static std::optional<double> parseIntensity(const std::string& raw);

    /** @brief Population coefficient of variation; 0 for empty input or zero mean. */
    static double coefficientOfVariation(const std::vector<double>& values);

    /** @brief Ordinary least squares slope of values against 0..n-1; 0 below two points. */
    static double linearSlope(const std::vector<double>& values);

private:
    struct Bucketed {
        const domain::HealthEvent* event;
        int bucket;
    };

    double symptomRegularity(const std::vector<Bucketed>& symptoms, int windowDays) const;
    double behavioralConsistency(const std::vector<Bucketed>& medications,
                                 const std::vector<Bucketed>& lifestyle,
                                 int windowDays) const;
    double trajectoryDirection(const std::vector<Bucketed>& symptoms) const;

    domain::AnalyticsConfig m_config;
};

} // namespace healthiq::application
