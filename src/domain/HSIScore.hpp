/**
 * @file HSIScore.hpp
 * @brief Health Stability Index snapshot.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Timestamp.hpp"

namespace healthiq::domain {

/** @brief How much windowed data backed the score. */
enum class DataConfidence {
    Low,
    Medium,
    High
};

inline std::string DataConfidenceToString(DataConfidence confidence) {
    switch (confidence) {
        case DataConfidence::Low: return "low";
        case DataConfidence::Medium: return "medium";
        case DataConfidence::High: return "high";
        default: return "low";
    }
}

inline std::optional<DataConfidence> DataConfidenceFromString(const std::string& value) {
    if (value == "low") return DataConfidence::Low;
    if (value == "medium") return DataConfidence::Medium;
    if (value == "high") return DataConfidence::High;
    return std::nullopt;
}

/**
 * @struct HSIScore
 * @brief Immutable once computed; score and all three dimensions lie in [0, 100].
 */
struct HSIScore {
    double score = 0.0;
    double symptomRegularity = 0.0;      ///< Weighted 0.4 by default.
    double behavioralConsistency = 0.0;  ///< Weighted 0.3 by default.
    double trajectoryDirection = 0.0;    ///< Weighted 0.3 by default.
    int windowDays = 30;
    DataConfidence dataConfidence = DataConfidence::Low;
    std::vector<std::string> contributingEventIds;
    TimePoint computedAt;
};

} // namespace healthiq::domain
