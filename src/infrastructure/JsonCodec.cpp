/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"

#include "domain/AnalyticsErrors.hpp"

namespace healthiq::infrastructure {

using json = nlohmann::json;
using namespace healthiq::domain;

namespace {

[[noreturn]] void Malformed(const std::string& where, const std::string& message) {
    throw MalformedEventError(where + ": " + message);
}

std::string RequireString(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) Malformed(where, std::string("missing required field '") + key + "'");
    if (!j.at(key).is_string()) Malformed(where, std::string("field '") + key + "' must be a string");
    return j.at(key).get<std::string>();
}

std::optional<std::string> OptionalString(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) Malformed(where, std::string("field '") + key + "' must be a string");
    return j.at(key).get<std::string>();
}

std::vector<std::string> StringList(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;
    if (!j.at(key).is_array()) Malformed(where, std::string("field '") + key + "' must be an array");
    for (const auto& item : j.at(key)) {
        if (!item.is_string()) Malformed(where, std::string("field '") + key + "' must hold strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

/** @brief Decodes an enum field; absent fields yield @p fallback, unknown values throw. */
template <typename E, typename Parse>
E EnumField(const json& j, const char* key, const std::string& where, Parse parse, std::optional<E> fallback) {
    if (!j.contains(key)) {
        if (fallback) return *fallback;
        Malformed(where, std::string("missing required field '") + key + "'");
    }
    std::string raw = RequireString(j, key, where);
    auto value = parse(raw);
    if (!value) Malformed(where, std::string("invalid ") + key + " '" + raw + "'");
    return *value;
}

double RequireNumber(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j.at(key).is_number()) {
        Malformed(where, std::string("field '") + key + "' must be a number");
    }
    return j.at(key).get<double>();
}

TimePoint RequireTime(const json& j, const char* key, const std::string& where) {
    return ParseIsoTimestamp(RequireString(j, key, where));
}

EventHeader DecodeHeader(const json& j, const std::string& where) {
    EventHeader header;
    header.id = RequireString(j, "id", where);
    if (header.id.empty()) Malformed(where, "id must not be empty");

    if (!j.contains("timestamp") || !j.at("timestamp").is_object()) {
        Malformed(where, "missing required object 'timestamp'");
    }
    header.timestamp = RequireString(j.at("timestamp"), "absolute", where);
    try {
        ParseIsoTimestamp(header.timestamp);
    } catch (const MalformedEventError& e) {
        Malformed(where, e.what());
    }

    header.source = EnumField<EventSource>(j, "source", where, EventSourceFromString, EventSource::User);
    header.confidence = EnumField<ConfidenceLevel>(j, "confidence", where, ConfidenceFromString,
                                                   ConfidenceLevel::Medium);
    header.visibilityScope = EnumField<VisibilityScope>(j, "visibilityScope", where, VisibilityFromString,
                                                        VisibilityScope::UserOnly);
    header.tags = StringList(j, "tags", where);
    header.notes = OptionalString(j, "notes", where).value_or("");
    return header;
}

json EncodeHeader(const EventHeader& header, HealthEventType type) {
    json j;
    j["id"] = header.id;
    j["eventType"] = EventTypeToString(type);
    j["timestamp"] = {{"absolute", header.timestamp}};
    j["source"] = EventSourceToString(header.source);
    j["confidence"] = ConfidenceToString(header.confidence);
    j["visibilityScope"] = VisibilityToString(header.visibilityScope);
    if (!header.tags.empty()) j["tags"] = header.tags;
    if (!header.notes.empty()) j["notes"] = header.notes;
    return j;
}

void PutOptional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

json EncodeNode(const GraphNode& node) {
    return {
        {"id", node.id},
        {"concept", node.name},
        {"category", CategoryToString(node.category)},
        {"occurrenceCount", node.occurrenceCount},
        {"firstSeen", FormatIsoTimestamp(node.firstSeen)},
        {"lastSeen", FormatIsoTimestamp(node.lastSeen)},
    };
}

json EncodeEdge(const GraphEdge& edge) {
    return {
        {"id", edge.id},
        {"sourceNodeId", edge.sourceNode},
        {"targetNodeId", edge.targetNode},
        {"relation", RelationToString(edge.relation)},
        {"weight", edge.weight},
        {"evidenceEventIds", std::vector<std::string>(edge.evidenceEventIds.begin(), edge.evidenceEventIds.end())},
        {"firstObserved", FormatIsoTimestamp(edge.firstObserved)},
        {"lastObserved", FormatIsoTimestamp(edge.lastObserved)},
    };
}

} // namespace

HealthEvent JsonCodec::DecodeEvent(const json& j) {
    if (!j.is_object()) throw MalformedEventError("Event must be a JSON object");

    std::string where = "event";
    if (j.contains("id") && j.at("id").is_string()) where += " '" + j.at("id").get<std::string>() + "'";

    try {
        std::string rawType = RequireString(j, "eventType", where);
        auto type = EventTypeFromString(rawType);
        if (!type) Malformed(where, "unknown eventType '" + rawType + "'");

        EventHeader header = DecodeHeader(j, where);

        switch (*type) {
            case HealthEventType::Symptom: {
                SymptomEvent e;
                e.header = std::move(header);
                e.description = RequireString(j, "description", where);
                e.intensity = OptionalString(j, "intensity", where);
                e.userReportedContext = OptionalString(j, "userReportedContext", where);
                return e;
            }
            case HealthEventType::Medication: {
                MedicationEvent e;
                e.header = std::move(header);
                e.name = RequireString(j, "name", where);
                e.dosage = OptionalString(j, "dosage", where).value_or("");
                e.intendedSchedule = OptionalString(j, "intendedSchedule", where).value_or("");
                e.adherenceOutcome = EnumField<AdherenceOutcome>(j, "adherenceOutcome", where,
                                                                  AdherenceFromString, std::nullopt);
                return e;
            }
            case HealthEventType::Lifestyle: {
                LifestyleEvent e;
                e.header = std::move(header);
                e.sleep = OptionalString(j, "sleep", where);
                e.stress = OptionalString(j, "stress", where);
                e.activity = OptionalString(j, "activity", where);
                e.food = OptionalString(j, "food", where);
                return e;
            }
            case HealthEventType::Clinical: {
                ClinicalEvent e;
                e.header = std::move(header);
                e.doctorVisit = RequireString(j, "doctorVisit", where);
                e.diagnosisLabel = OptionalString(j, "diagnosisLabel", where);
                return e;
            }
            case HealthEventType::Insight: {
                InsightEvent e;
                e.header = std::move(header);
                e.evidenceEventIds = StringList(j, "evidenceEventIds", where);
                if (e.evidenceEventIds.empty()) Malformed(where, "evidenceEventIds must not be empty");
                e.reviewStatus = EnumField<InsightReviewStatus>(j, "reviewStatus", where,
                                                                ReviewStatusFromString, InsightReviewStatus::Draft);
                return e;
            }
            default:
                Malformed(where, "unsupported eventType '" + rawType + "'");
        }
    } catch (const json::exception& e) {
        Malformed(where, e.what());
    }
}

std::vector<HealthEvent> JsonCodec::DecodeEvents(const json& j) {
    if (!j.is_array()) throw MalformedEventError("Events must be a JSON array");
    std::vector<HealthEvent> events;
    events.reserve(j.size());
    for (const auto& item : j) events.push_back(DecodeEvent(item));
    return events;
}

json JsonCodec::EncodeEvent(const HealthEvent& event) {
    return std::visit([](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json j = EncodeHeader(e.header, T::Type);
        if constexpr (std::is_same_v<T, SymptomEvent>) {
            j["description"] = e.description;
            PutOptional(j, "intensity", e.intensity);
            PutOptional(j, "userReportedContext", e.userReportedContext);
        } else if constexpr (std::is_same_v<T, MedicationEvent>) {
            j["name"] = e.name;
            j["dosage"] = e.dosage;
            j["intendedSchedule"] = e.intendedSchedule;
            j["adherenceOutcome"] = AdherenceToString(e.adherenceOutcome);
        } else if constexpr (std::is_same_v<T, LifestyleEvent>) {
            PutOptional(j, "sleep", e.sleep);
            PutOptional(j, "stress", e.stress);
            PutOptional(j, "activity", e.activity);
            PutOptional(j, "food", e.food);
        } else if constexpr (std::is_same_v<T, ClinicalEvent>) {
            j["doctorVisit"] = e.doctorVisit;
            PutOptional(j, "diagnosisLabel", e.diagnosisLabel);
        } else if constexpr (std::is_same_v<T, InsightEvent>) {
            j["evidenceEventIds"] = e.evidenceEventIds;
            j["reviewStatus"] = ReviewStatusToString(e.reviewStatus);
        } else {
            static_assert(kUnhandledEventKind<T>, "EncodeEvent must handle every event kind");
        }
        return j;
    }, event);
}

json JsonCodec::EncodeEvents(const std::vector<HealthEvent>& events) {
    json out = json::array();
    for (const auto& event : events) out.push_back(EncodeEvent(event));
    return out;
}

ComputeInput JsonCodec::DecodeComputeInput(const json& j) {
    ComputeInput input;
    if (j.is_array()) {
        input.events = DecodeEvents(j);
        return input;
    }
    if (!j.is_object() || !j.contains("events")) {
        throw MalformedEventError("Input must be an event array or an object with an 'events' array");
    }
    input.events = DecodeEvents(j.at("events"));
    if (j.contains("previousHSI") && !j.at("previousHSI").is_null()) {
        input.previousHSI = DecodeHSIScore(j.at("previousHSI"));
    }
    return input;
}

json JsonCodec::EncodeHSIScore(const HSIScore& score) {
    return {
        {"score", score.score},
        {"symptomRegularity", score.symptomRegularity},
        {"behavioralConsistency", score.behavioralConsistency},
        {"trajectoryDirection", score.trajectoryDirection},
        {"windowDays", score.windowDays},
        {"dataConfidence", DataConfidenceToString(score.dataConfidence)},
        {"contributingEventIds", score.contributingEventIds},
        {"computedAt", FormatIsoTimestamp(score.computedAt)},
    };
}

HSIScore JsonCodec::DecodeHSIScore(const json& j) {
    const std::string where = "HSI snapshot";
    if (!j.is_object()) Malformed(where, "must be a JSON object");

    HSIScore score;
    score.score = RequireNumber(j, "score", where);
    score.symptomRegularity = j.contains("symptomRegularity") ? RequireNumber(j, "symptomRegularity", where) : 0.0;
    score.behavioralConsistency =
        j.contains("behavioralConsistency") ? RequireNumber(j, "behavioralConsistency", where) : 0.0;
    score.trajectoryDirection =
        j.contains("trajectoryDirection") ? RequireNumber(j, "trajectoryDirection", where) : 0.0;
    score.windowDays = j.contains("windowDays") ? static_cast<int>(RequireNumber(j, "windowDays", where)) : 30;
    score.dataConfidence = EnumField<DataConfidence>(j, "dataConfidence", where, DataConfidenceFromString,
                                                     DataConfidence::Low);
    score.contributingEventIds = StringList(j, "contributingEventIds", where);
    if (j.contains("computedAt")) score.computedAt = RequireTime(j, "computedAt", where);
    if (score.score < 0 || score.score > 100) Malformed(where, "score must lie in [0, 100]");
    return score;
}

json JsonCodec::EncodeGraphSummary(const GraphSummary& summary) {
    json nodes = json::array();
    for (const auto& node : summary.topConcepts) nodes.push_back(EncodeNode(node));

    json edges = json::array();
    for (const auto& view : summary.strongestEdges) {
        json edge = EncodeEdge(view.edge);
        edge["sourceConcept"] = view.sourceConcept;
        edge["targetConcept"] = view.targetConcept;
        edges.push_back(std::move(edge));
    }

    return {
        {"nodeCount", summary.nodeCount},
        {"edgeCount", summary.edgeCount},
        {"topConcepts", nodes},
        {"strongestEdges", edges},
    };
}

json JsonCodec::EncodeAlert(const UserAlert& alert) {
    json j = {
        {"id", alert.id},
        {"ruleType", RuleTypeToString(alert.ruleType)},
        {"triggeredAt", FormatIsoTimestamp(alert.triggeredAt)},
        {"severity", SeverityToString(alert.severity)},
        {"title", alert.title},
        {"explanation", alert.explanation},
        {"evidenceIds", alert.evidenceIds},
        {"acknowledged", alert.acknowledged},
    };
    if (alert.acknowledgedAt) j["acknowledgedAt"] = FormatIsoTimestamp(*alert.acknowledgedAt);
    return j;
}

UserAlert JsonCodec::DecodeAlert(const json& j) {
    const std::string where = "alert";
    if (!j.is_object()) Malformed(where, "must be a JSON object");

    UserAlert alert;
    alert.id = RequireString(j, "id", where);
    alert.ruleType = EnumField<AlertRuleType>(j, "ruleType", where, RuleTypeFromString, std::nullopt);
    alert.triggeredAt = RequireTime(j, "triggeredAt", where);
    alert.severity = EnumField<AlertSeverity>(j, "severity", where, SeverityFromString, std::nullopt);
    alert.title = RequireString(j, "title", where);
    alert.explanation = RequireString(j, "explanation", where);
    alert.evidenceIds = StringList(j, "evidenceIds", where);
    if (j.contains("acknowledged")) {
        if (!j.at("acknowledged").is_boolean()) Malformed(where, "field 'acknowledged' must be a boolean");
        alert.acknowledged = j.at("acknowledged").get<bool>();
    }
    if (j.contains("acknowledgedAt")) alert.acknowledgedAt = RequireTime(j, "acknowledgedAt", where);
    return alert;
}

json JsonCodec::EncodeRisk(const RiskStatus& risk) {
    return {
        {"level", RiskLevelToString(risk.level)},
        {"hsiScore", risk.hsiScore},
        {"activeAlertCount", risk.activeAlertCount},
        {"warningCount", risk.warningCount},
        {"attentionCount", risk.attentionCount},
        {"description", risk.description},
    };
}

json JsonCodec::EncodeSuggestion(const BehavioralSuggestion& suggestion) {
    return {
        {"category", suggestion.category},
        {"suggestion", suggestion.suggestion},
        {"basedOn", suggestion.basedOn},
    };
}

json JsonCodec::EncodeResult(const application::AnalyticsResult& result) {
    json alerts = json::array();
    for (const auto& alert : result.alerts) alerts.push_back(EncodeAlert(alert));
    json suggestions = json::array();
    for (const auto& suggestion : result.suggestions) suggestions.push_back(EncodeSuggestion(suggestion));

    json j;
    j["hsi"] = EncodeHSIScore(result.hsi);
    j["graph"] = result.graph ? EncodeGraphSummary(*result.graph) : json(nullptr);
    j["alerts"] = alerts;
    j["risk"] = EncodeRisk(result.risk);
    j["suggestions"] = suggestions;
    j["eventCount"] = result.eventCount;
    j["hasSufficientData"] = result.hasSufficientData();
    return j;
}

json JsonCodec::EncodeGraph(const HealthGraph& graph) {
    json nodes = json::array();
    for (const auto& [key, node] : graph.nodes()) nodes.push_back(EncodeNode(node));
    json edges = json::array();
    for (const auto& [key, edge] : graph.edges()) edges.push_back(EncodeEdge(edge));
    return {{"nodes", nodes}, {"edges", edges}};
}

HealthGraph JsonCodec::DecodeGraph(const json& j) {
    const std::string where = "graph snapshot";
    if (!j.is_object()) Malformed(where, "must be a JSON object");

    HealthGraph graph;
    try {
        for (const auto& n : j.at("nodes")) {
            GraphNode node;
            node.id = n.at("id").get<int>();
            node.name = RequireString(n, "concept", where);
            node.category = EnumField<ConceptCategory>(n, "category", where, CategoryFromString, std::nullopt);
            node.occurrenceCount = n.at("occurrenceCount").get<int>();
            node.firstSeen = RequireTime(n, "firstSeen", where);
            node.lastSeen = RequireTime(n, "lastSeen", where);
            graph.restoreNode(node);
        }
        for (const auto& e : j.at("edges")) {
            GraphEdge edge;
            edge.id = e.at("id").get<int>();
            edge.sourceNode = e.at("sourceNodeId").get<int>();
            edge.targetNode = e.at("targetNodeId").get<int>();
            edge.relation = EnumField<GraphRelation>(e, "relation", where, RelationFromString, std::nullopt);
            edge.weight = RequireNumber(e, "weight", where);
            for (const auto& id : StringList(e, "evidenceEventIds", where)) edge.evidenceEventIds.insert(id);
            edge.firstObserved = RequireTime(e, "firstObserved", where);
            edge.lastObserved = RequireTime(e, "lastObserved", where);
            graph.restoreEdge(edge);
        }
    } catch (const json::exception& e) {
        Malformed(where, e.what());
    }
    return graph;
}

} // namespace healthiq::infrastructure
