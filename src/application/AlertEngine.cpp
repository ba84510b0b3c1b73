/**
 * @file AlertEngine.cpp
 * @brief Implementation of AlertEngine.
 */

#include "application/AlertEngine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace healthiq::application {

using namespace healthiq::domain;

namespace {

constexpr size_t kMaxEvidence = 10;
constexpr size_t kMaxListedSymptoms = 5;

std::string DescriptionKey(const std::string& description) {
    std::string lower;
    lower.reserve(description.size());
    for (unsigned char c : description) lower.push_back(static_cast<char>(std::tolower(c)));
    auto first = lower.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = lower.find_last_not_of(" \t\r\n");
    return lower.substr(first, last - first + 1);
}

/** @brief First decimal number appearing in @p text. */
std::optional<double> FirstNumber(const std::string& text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) continue;
        size_t end = i;
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
        if (end + 1 < text.size() && text[end] == '.' && std::isdigit(static_cast<unsigned char>(text[end + 1]))) {
            ++end;
            while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
        }
        return std::stod(text.substr(i, end - i));
    }
    return std::nullopt;
}

std::string FormatNumber(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

UserAlert MakeAlert(AlertRuleType type, AlertSeverity severity, TimePoint at,
                    std::string title, std::string explanation, std::vector<std::string> evidence) {
    UserAlert alert;
    alert.ruleType = type;
    alert.severity = severity;
    alert.triggeredAt = at;
    alert.title = std::move(title);
    alert.explanation = std::move(explanation);
    alert.evidenceIds = std::move(evidence);
    return alert;
}

bool HasActive(const std::vector<UserAlert>& alerts, AlertRuleType type) {
    return std::any_of(alerts.begin(), alerts.end(), [type](const UserAlert& a) {
        return !a.acknowledged && a.ruleType == type;
    });
}

bool TemporalEdgeTouching(const GraphSummary& graph, const std::string& fragment) {
    return std::any_of(graph.strongestEdges.begin(), graph.strongestEdges.end(), [&fragment](const SummaryEdge& e) {
        if (e.edge.relation != GraphRelation::TemporalSequence) return false;
        return e.sourceConcept.find(fragment) != std::string::npos
            || e.targetConcept.find(fragment) != std::string::npos;
    });
}

} // namespace

AlertEngine::AlertEngine(AnalyticsConfig config) : m_config(std::move(config)) {
    m_config.validate();
}

bool AlertEngine::pastColdStart(const std::vector<HealthEvent>& events, TimePoint now) const {
    if (events.size() < static_cast<size_t>(m_config.coldStartMinEvents) || events.empty()) return false;
    TimePoint earliest = TimeOf(events.front());
    for (const auto& event : events) earliest = std::min(earliest, TimeOf(event));
    return DaysBetween(earliest, now) >= static_cast<double>(m_config.coldStartMinDays);
}

std::vector<UserAlert> AlertEngine::evaluate(const AlertEvaluationContext& context) const {
    std::vector<TimedEvent> timed;
    timed.reserve(context.events.size());
    for (const auto& event : context.events) timed.push_back({&event, TimeOf(event)});

    std::vector<UserAlert> alerts;
    if (!pastColdStart(context.events, context.now)) return alerts;

    auto keep = [&alerts](std::optional<UserAlert> alert) {
        if (alert) alerts.push_back(std::move(*alert));
    };
    keep(hsiDrop(context));
    keep(newSymptomCluster(timed, context.now));
    keep(adherenceDecline(timed, context.now));
    keep(loggingGap(timed, context.now));
    keep(symptomEscalation(timed, context.now));
    keep(coOccurrenceSpike(context.graphSummary, context.now));
    return alerts;
}

std::optional<UserAlert> AlertEngine::hsiDrop(const AlertEvaluationContext& context) const {
    if (!context.previousHSI) return std::nullopt;

    double delta = context.currentHSI.score - context.previousHSI->score;
    if (delta > m_config.hsiDropThreshold) return std::nullopt;

    std::ostringstream explanation;
    explanation << "Your Health Stability Index dropped from " << std::lround(context.previousHSI->score)
                << " to " << std::lround(context.currentHSI.score) << " (" << std::lround(delta)
                << " points) since the previous snapshot. This may reflect changes in your symptom patterns, "
                   "medication adherence, or lifestyle factors.";

    const auto& ids = context.currentHSI.contributingEventIds;
    std::vector<std::string> evidence(ids.begin(), ids.begin() + std::min(ids.size(), kMaxEvidence));
    return MakeAlert(AlertRuleType::HsiDrop, AlertSeverity::Warning, context.now,
                     "Health Stability Index declined significantly", explanation.str(), std::move(evidence));
}

std::optional<UserAlert> AlertEngine::newSymptomCluster(const std::vector<TimedEvent>& events, TimePoint now) const {
    const TimePoint recentStart = now - kDay * m_config.newSymptomRecentDays;
    const TimePoint lookbackStart = now - kDay * m_config.newSymptomLookbackDays;

    std::vector<std::string> recentOrder;
    std::set<std::string> recent;
    std::set<std::string> older;
    std::vector<std::string> recentIds;

    for (const auto& item : events) {
        const auto* symptom = std::get_if<SymptomEvent>(item.event);
        if (!symptom) continue;
        std::string key = DescriptionKey(symptom->description);
        if (item.at >= recentStart) {
            if (recent.insert(key).second) recentOrder.push_back(key);
            recentIds.push_back(symptom->header.id);
        } else if (item.at >= lookbackStart) {
            older.insert(key);
        }
    }

    std::vector<std::string> novel;
    for (const auto& key : recentOrder) {
        if (!older.count(key)) novel.push_back(key);
    }
    if (novel.size() < static_cast<size_t>(m_config.newSymptomMinimum)) return std::nullopt;

    std::vector<std::string> listed(novel.begin(), novel.begin() + std::min(novel.size(), kMaxListedSymptoms));
    std::ostringstream title;
    title << novel.size() << " new symptom types in the past " << m_config.newSymptomRecentDays << " days";
    std::ostringstream explanation;
    explanation << "You've reported " << novel.size() << " symptom types in the last "
                << m_config.newSymptomRecentDays << " days that weren't present in the "
                << (m_config.newSymptomLookbackDays - m_config.newSymptomRecentDays)
                << " days before that. New symptoms: " << Join(listed, ", ")
                << ". Consider reviewing your health patterns.";

    recentIds.resize(std::min(recentIds.size(), kMaxEvidence));
    return MakeAlert(AlertRuleType::NewSymptomCluster, AlertSeverity::Attention, now,
                     title.str(), explanation.str(), std::move(recentIds));
}

std::optional<UserAlert> AlertEngine::adherenceDecline(const std::vector<TimedEvent>& events, TimePoint now) const {
    const TimePoint windowStart = now - kDay * m_config.adherenceWindowDays;

    std::vector<std::string> ids;
    size_t taken = 0;
    for (const auto& item : events) {
        const auto* medication = std::get_if<MedicationEvent>(item.event);
        if (!medication || item.at < windowStart) continue;
        ids.push_back(medication->header.id);
        if (medication->adherenceOutcome == AdherenceOutcome::Taken) ++taken;
    }
    if (ids.size() < static_cast<size_t>(m_config.adherenceSampleMinimum)) return std::nullopt;

    double rate = 100.0 * static_cast<double>(taken) / static_cast<double>(ids.size());
    if (rate >= m_config.adherenceFloorPct) return std::nullopt;

    std::ostringstream explanation;
    explanation << "Your medication adherence rate over the past " << m_config.adherenceWindowDays
                << " days is " << std::lround(rate) << "% (" << taken << " of " << ids.size()
                << " doses taken). Consistent medication use can be important for managing health conditions.";

    ids.resize(std::min(ids.size(), kMaxEvidence));
    return MakeAlert(AlertRuleType::AdherenceDecline, AlertSeverity::Warning, now,
                     "Medication adherence has decreased", explanation.str(), std::move(ids));
}

std::optional<UserAlert> AlertEngine::loggingGap(const std::vector<TimedEvent>& events, TimePoint now) const {
    if (events.empty() || events.size() < static_cast<size_t>(m_config.engagementMinimumEvents)) return std::nullopt;

    TimePoint latest = events.front().at;
    for (const auto& item : events) latest = std::max(latest, item.at);
    if (latest >= now - kDay * m_config.loggingGapDays) return std::nullopt;

    long gapDays = std::lround(DaysBetween(latest, now));
    std::string title = "No health events logged in " + std::to_string(gapDays) + " days";
    std::string explanation = "It's been " + std::to_string(gapDays)
        + " days since your last health event. Regular logging helps HealthIQ provide better insights "
          "and track your health trajectory accurately.";
    return MakeAlert(AlertRuleType::LoggingGap, AlertSeverity::Info, now, title, explanation, {});
}

std::optional<UserAlert> AlertEngine::symptomEscalation(const std::vector<TimedEvent>& events, TimePoint now) const {
    const size_t run = static_cast<size_t>(m_config.escalationRun);

    std::vector<std::string> groupOrder;
    std::map<std::string, std::vector<TimedEvent>> groups;
    for (const auto& item : events) {
        const auto* symptom = std::get_if<SymptomEvent>(item.event);
        if (!symptom) continue;
        std::string key = DescriptionKey(symptom->description);
        auto& group = groups[key];
        if (group.empty()) groupOrder.push_back(key);
        group.push_back(item);
    }

    for (const auto& key : groupOrder) {
        auto group = groups[key];
        if (group.size() < run) continue;
        std::stable_sort(group.begin(), group.end(), [](const TimedEvent& a, const TimedEvent& b) {
            return a.at < b.at;
        });

        std::vector<std::pair<std::string, double>> rated;
        for (const auto& item : group) {
            const auto& symptom = std::get<SymptomEvent>(*item.event);
            if (!symptom.intensity) continue;
            if (auto value = FirstNumber(*symptom.intensity)) rated.emplace_back(symptom.header.id, *value);
        }
        if (rated.size() < run) continue;

        std::vector<std::pair<std::string, double>> tail(rated.end() - static_cast<long>(run), rated.end());
        bool increasing = true;
        for (size_t i = 1; i < tail.size(); ++i) {
            if (tail[i].second <= tail[i - 1].second) increasing = false;
        }
        if (!increasing) continue;

        std::vector<std::string> values;
        std::vector<std::string> evidence;
        for (const auto& [id, value] : tail) {
            values.push_back(FormatNumber(value));
            evidence.push_back(id);
        }
        std::string explanation = "The intensity of \"" + key + "\" has increased across the last "
            + std::to_string(tail.size()) + " occurrences (" + Join(values, " -> ")
            + "). If this trend continues, consider discussing it with a healthcare professional.";
        return MakeAlert(AlertRuleType::SymptomEscalation, AlertSeverity::Warning, now,
                         "\"" + key + "\" intensity increasing", explanation, std::move(evidence));
    }
    return std::nullopt;
}

std::optional<UserAlert> AlertEngine::coOccurrenceSpike(const std::optional<GraphSummary>& graph, TimePoint now) const {
    if (!graph) return std::nullopt;

    const SummaryEdge* strongest = nullptr;
    for (const auto& candidate : graph->strongestEdges) {
        if (candidate.edge.weight < m_config.coOccurrenceSpikeWeight) continue;
        if (!strongest || candidate.edge.weight > strongest->edge.weight) strongest = &candidate;
    }
    if (!strongest) return std::nullopt;

    std::ostringstream explanation;
    explanation << "A frequent co-occurrence between \"" << strongest->sourceConcept << "\" and \""
                << strongest->targetConcept << "\" has been detected (strength: "
                << std::fixed << std::setprecision(1) << strongest->edge.weight
                << "). This pattern may be worth exploring.";

    std::vector<std::string> evidence(strongest->edge.evidenceEventIds.begin(), strongest->edge.evidenceEventIds.end());
    evidence.resize(std::min(evidence.size(), kMaxEvidence));
    return MakeAlert(AlertRuleType::CoOccurrenceSpike, AlertSeverity::Info, now,
                     "Strong health pattern detected", explanation.str(), std::move(evidence));
}

RiskStatus AlertEngine::computeRisk(const HSIScore& hsi, const std::vector<UserAlert>& alerts) const {
    RiskStatus status;
    status.hsiScore = hsi.score;
    for (const auto& alert : alerts) {
        if (alert.acknowledged) continue;
        ++status.activeAlertCount;
        if (alert.severity == AlertSeverity::Warning) ++status.warningCount;
        if (alert.severity == AlertSeverity::Attention) ++status.attentionCount;
    }

    if (hsi.score < 40 || status.activeAlertCount >= 3) {
        status.level = RiskLevel::Orange;
        status.description = "Your health trajectory shows patterns that deserve attention. Consider reviewing "
                             "your recent health data and discussing changes with a healthcare professional.";
    } else if (hsi.score < 70 || status.warningCount + status.attentionCount >= 1) {
        status.level = RiskLevel::Yellow;
        status.description = "Some health patterns have been flagged. HealthIQ is monitoring your trajectory. "
                             "Consider reviewing the alert details.";
    } else {
        status.level = RiskLevel::Green;
        status.description = "Your health trajectory appears stable. Continue logging health events for the "
                             "most accurate tracking.";
    }
    return status;
}

std::vector<BehavioralSuggestion> AlertEngine::suggest(const HSIScore& hsi,
                                                       const std::vector<UserAlert>& alerts,
                                                       const std::optional<GraphSummary>& graph) const {
    std::vector<BehavioralSuggestion> suggestions;

    if (hsi.behavioralConsistency < 50 && HasActive(alerts, AlertRuleType::AdherenceDecline)) {
        suggestions.push_back({"medication",
                               "Your medication consistency has changed recently. Logging medication events can "
                               "help you and your doctor understand your health trajectory better.",
                               "Medication adherence scoring"});
    }

    if (graph) {
        if (TemporalEdgeTouching(*graph, "sleep")) {
            suggestions.push_back({"sleep",
                                   "Your recent health patterns suggest sleep consistency may be a factor worth "
                                   "tracking more carefully.",
                                   "Health graph analysis: sleep-symptom correlation"});
        }
        if (TemporalEdgeTouching(*graph, "stress")) {
            suggestions.push_back({"stress",
                                   "Stress-related patterns have been observed in your health data. Consider "
                                   "tracking stress levels alongside symptoms for better insight.",
                                   "Health graph analysis: stress correlation"});
        }
    }

    if (HasActive(alerts, AlertRuleType::LoggingGap)) {
        suggestions.push_back({"engagement",
                               "Regular health logging improves the accuracy of your Health Stability Index. "
                               "Even brief daily entries make a difference.",
                               "Logging gap detection"});
    }

    if (HasActive(alerts, AlertRuleType::SymptomEscalation)) {
        suggestions.push_back({"monitoring",
                               "A symptom shows an increasing trend. Tracking this symptom with consistent "
                               "intensity ratings will help identify whether the pattern continues.",
                               "Symptom escalation detection"});
    }

    return suggestions;
}

} // namespace healthiq::application
