// floor_guard_event.h
#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace floor_guard {

enum class EventType {
    CROWD,
    FALL,
    FIGHT,
    LOITERING,
    UNKNOWN
};

enum class EventSource {
    DEMO,
    CAMERA,
    API,
    UNKNOWN
};

enum class IncidentStatus {
    NEW,
    ACK,
    RESOLVED
};

std::string eventTypeToString(EventType type);
std::string eventSourceToString(EventSource source);
std::string incidentStatusToString(IncidentStatus status);

// Exact canonical names only (lower case); false for anything else
bool eventTypeFromString(const std::string& text, EventType& type);
bool eventSourceFromString(const std::string& text, EventSource& source);
bool incidentStatusFromString(const std::string& text, IncidentStatus& status);

/**
 * Canonical event anchored on the floor plan.
 *
 * x/y are map-normalized and always inside [0,1]. An event is replaced
 * wholesale by a newer record with the same id, never edited in place.
 */
struct Event {
    std::string id;
    std::string storeId;
    int64_t detectedAt = 0;   // Epoch ms
    int64_t ingestedAt = 0;   // Epoch ms
    int64_t latencyMs = 0;

    EventType type = EventType::UNKNOWN;
    int severity = 1;         // 1..3
    double confidence = 0.0;  // 0..1
    std::string zoneId;

    // Optional descriptors, empty when absent
    std::string cameraId;
    std::string trackId;
    std::string objectLabel;
    std::string rawStatus;
    std::string modelVersion;
    std::string note;

    EventSource source = EventSource::UNKNOWN;
    IncidentStatus incidentStatus = IncidentStatus::NEW;

    double x = 0.0;
    double y = 0.0;
    double worldXMeters = 0.0;
    double worldZMeters = 0.0;

    // Snake-case record that normalizes back to the same event
    nlohmann::json toJson() const;
};

// True when `candidate` should replace `current` (strictly newer by
// detectedAt, then ingestedAt)
bool isNewerEvent(const Event& candidate, const Event& current);

// Newest first: detectedAt desc, ingestedAt desc, id asc
bool eventFeedOrder(const Event& a, const Event& b);

void sortEventFeed(std::vector<Event>& events);

nlohmann::json eventsToJson(const std::vector<Event>& events);

} // namespace floor_guard
