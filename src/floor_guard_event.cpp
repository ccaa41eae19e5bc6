// floor_guard_event.cpp
#include "floor_guard_event.h"

#include <algorithm>

namespace floor_guard {

using json = nlohmann::json;

std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::CROWD: return "crowd";
        case EventType::FALL: return "fall";
        case EventType::FIGHT: return "fight";
        case EventType::LOITERING: return "loitering";
        case EventType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string eventSourceToString(EventSource source) {
    switch (source) {
        case EventSource::DEMO: return "demo";
        case EventSource::CAMERA: return "camera";
        case EventSource::API: return "api";
        case EventSource::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string incidentStatusToString(IncidentStatus status) {
    switch (status) {
        case IncidentStatus::NEW: return "new";
        case IncidentStatus::ACK: return "ack";
        case IncidentStatus::RESOLVED: return "resolved";
    }
    return "new";
}

bool eventTypeFromString(const std::string& text, EventType& type) {
    static const EventType all[] = {
        EventType::CROWD, EventType::FALL, EventType::FIGHT, EventType::LOITERING, EventType::UNKNOWN
    };
    for (EventType candidate : all) {
        if (eventTypeToString(candidate) == text) {
            type = candidate;
            return true;
        }
    }
    return false;
}

bool eventSourceFromString(const std::string& text, EventSource& source) {
    static const EventSource all[] = {
        EventSource::DEMO, EventSource::CAMERA, EventSource::API, EventSource::UNKNOWN
    };
    for (EventSource candidate : all) {
        if (eventSourceToString(candidate) == text) {
            source = candidate;
            return true;
        }
    }
    return false;
}

bool incidentStatusFromString(const std::string& text, IncidentStatus& status) {
    static const IncidentStatus all[] = {
        IncidentStatus::NEW, IncidentStatus::ACK, IncidentStatus::RESOLVED
    };
    for (IncidentStatus candidate : all) {
        if (incidentStatusToString(candidate) == text) {
            status = candidate;
            return true;
        }
    }
    return false;
}

json Event::toJson() const {
    json j;
    j["id"] = id;
    j["store_id"] = storeId;
    j["detected_at"] = detectedAt;
    j["ingested_at"] = ingestedAt;
    j["latency_ms"] = latencyMs;
    j["type"] = eventTypeToString(type);
    j["severity"] = severity;
    j["confidence"] = confidence;
    j["zone_id"] = zoneId;

    if (!cameraId.empty()) j["camera_id"] = cameraId;
    if (!trackId.empty()) j["track_id"] = trackId;
    if (!objectLabel.empty()) j["object_label"] = objectLabel;
    if (!rawStatus.empty()) j["raw_status"] = rawStatus;
    if (!modelVersion.empty()) j["model_version"] = modelVersion;
    if (!note.empty()) j["note"] = note;

    j["source"] = eventSourceToString(source);
    j["incident_status"] = incidentStatusToString(incidentStatus);
    j["x"] = x;
    j["y"] = y;
    j["world_x_m"] = worldXMeters;
    j["world_z_m"] = worldZMeters;
    return j;
}

bool isNewerEvent(const Event& candidate, const Event& current) {
    if (candidate.detectedAt != current.detectedAt) {
        return candidate.detectedAt > current.detectedAt;
    }
    return candidate.ingestedAt > current.ingestedAt;
}

bool eventFeedOrder(const Event& a, const Event& b) {
    if (a.detectedAt != b.detectedAt) {
        return a.detectedAt > b.detectedAt;
    }
    if (a.ingestedAt != b.ingestedAt) {
        return a.ingestedAt > b.ingestedAt;
    }
    return a.id < b.id;
}

void sortEventFeed(std::vector<Event>& events) {
    std::sort(events.begin(), events.end(), eventFeedOrder);
}

json eventsToJson(const std::vector<Event>& events) {
    json array = json::array();
    for (const auto& event : events) {
        array.push_back(event.toJson());
    }
    return array;
}

} // namespace floor_guard
