// floor_guard_classify.cpp
#include "floor_guard_classify.h"
#include "floor_guard_fields.h"
#include "floor_guard_geometry.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

namespace floor_guard {
namespace classify {

using json = nlohmann::json;

namespace {

template <typename T>
using SynonymTable = std::vector<std::pair<std::vector<std::string>, T>>;

// Checked top to bottom; the first row containing the word wins
const SynonymTable<EventType>& typeSynonyms() {
    static const SynonymTable<EventType> table = {
        {{"fall_down", "slip", "slipfall", "trip"}, EventType::FALL},
        {{"violence", "assault", "aggressive", "fight"}, EventType::FIGHT},
        {{"queue", "congestion", "crowding", "crowd"}, EventType::CROWD},
        {{"loiter", "idle", "linger", "loitering"}, EventType::LOITERING},
    };
    return table;
}

const SynonymTable<int>& severitySynonyms() {
    static const SynonymTable<int> table = {
        {{"p1", "l3", "high", "critical", "severe", "urgent"}, 3},
        {{"p2", "l2", "medium", "med", "moderate"}, 2},
        {{"p3", "l1", "low", "minor"}, 1},
    };
    return table;
}

const SynonymTable<IncidentStatus>& statusSynonyms() {
    static const SynonymTable<IncidentStatus> table = {
        {{"open", "opened", "detected", "created", "new_alert"}, IncidentStatus::NEW},
        {{"acknowledged", "acknowledge", "in_progress", "processing", "dispatched"}, IncidentStatus::ACK},
        {{"closed", "done", "resolved_done", "complete", "completed"}, IncidentStatus::RESOLVED},
    };
    return table;
}

template <typename T>
bool lookupSynonym(const SynonymTable<T>& table, const std::string& word, T& result) {
    for (const auto& row : table) {
        if (std::find(row.first.begin(), row.first.end(), word) != row.first.end()) {
            result = row.second;
            return true;
        }
    }
    return false;
}

// Lower-cased trimmed text of a string value
bool normalizedWord(const json* value, std::string& word) {
    std::string text;
    if (!fields::readString(value, text)) {
        return false;
    }
    word = StringUtils::toLower(StringUtils::trim(text));
    return true;
}

// Digits and dots of `word`, parsed; "L2" -> 2, "p-3" -> 3
bool embeddedNumber(const std::string& word, double& number) {
    std::string digits;
    for (char c : word) {
        if ((c >= '0' && c <= '9') || c == '.') {
            digits.push_back(c);
        }
    }
    if (digits.empty()) {
        return false;
    }
    char* end = nullptr;
    double parsed = std::strtod(digits.c_str(), &end);
    if (end != digits.c_str() + digits.size() || !std::isfinite(parsed)) {
        return false;
    }
    number = parsed;
    return true;
}

int severityForType(EventType type) {
    if (type == EventType::FALL || type == EventType::FIGHT) {
        return 3;
    }
    if (type == EventType::CROWD) {
        return 2;
    }
    return 1;
}

} // namespace

EventType eventTypeFromValue(const json* value) {
    std::string word;
    if (!normalizedWord(value, word)) {
        return EventType::UNKNOWN;
    }

    EventType type = EventType::UNKNOWN;
    if (eventTypeFromString(word, type)) {
        return type;
    }
    if (lookupSynonym(typeSynonyms(), word, type)) {
        return type;
    }
    return EventType::UNKNOWN;
}

EventType resolveEventType(const json& record) {
    EventType primary = eventTypeFromValue(fields::pickField(record, fields::Field::Type));
    if (primary != EventType::UNKNOWN) {
        return primary;
    }
    return eventTypeFromValue(fields::pickField(record, fields::Field::TypeFallback));
}

int severityFromValue(const json* value, EventType type) {
    if (value && value->is_number()) {
        double number = value->get<double>();
        if (number == 1.0 || number == 2.0 || number == 3.0) {
            return static_cast<int>(number);
        }
    }

    std::string word;
    if (normalizedWord(value, word)) {
        int severity = 0;
        if (lookupSynonym(severitySynonyms(), word, severity)) {
            return severity;
        }
        double embedded = 0.0;
        if (embeddedNumber(word, embedded) && embedded >= 1.0 && embedded <= 3.0) {
            return static_cast<int>(std::lround(embedded));
        }
    }

    if (value && value->is_number()) {
        double number = value->get<double>();
        if (std::isfinite(number)) {
            if (number >= 3.0) return 3;
            if (number >= 2.0) return 2;
            return 1;
        }
    }

    // Nothing parsed: derive from the event type
    return severityForType(type);
}

double defaultConfidence(int severity) {
    if (severity >= 3) return 0.92;
    if (severity == 2) return 0.84;
    return 0.78;
}

double confidenceFromValue(const json* value, int severity) {
    double parsed = 0.0;
    if (fields::parseNumber(value, parsed)) {
        if (parsed > 1.0 && parsed <= 100.0) {
            return clamp01(parsed / 100.0);
        }
        return clamp01(parsed);
    }
    return defaultConfidence(severity);
}

IncidentStatus incidentStatusFromValue(const json* value) {
    std::string word;
    if (!normalizedWord(value, word)) {
        return IncidentStatus::NEW;
    }

    IncidentStatus status = IncidentStatus::NEW;
    if (incidentStatusFromString(word, status)) {
        return status;
    }
    if (lookupSynonym(statusSynonyms(), word, status)) {
        return status;
    }
    return IncidentStatus::NEW;
}

EventSource sourceFromValue(const json* value, EventSource fallback) {
    std::string word;
    if (!normalizedWord(value, word)) {
        return fallback;
    }

    EventSource source = fallback;
    if (eventSourceFromString(word, source)) {
        return source;
    }
    if (StringUtils::contains(word, "camera")) {
        return EventSource::CAMERA;
    }
    if (StringUtils::contains(word, "demo")) {
        return EventSource::DEMO;
    }
    if (!word.empty()) {
        return EventSource::API;
    }
    return fallback;
}

} // namespace classify
} // namespace floor_guard
