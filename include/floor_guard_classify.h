// floor_guard_classify.h
#pragma once

#include "floor_guard_event.h"

#include <string>
#include <nlohmann/json.hpp>

namespace floor_guard {

/**
 * Heuristic classification of loosely typed detection fields.
 *
 * Every classifier first matches the lower-cased text against the canonical
 * names, then against its synonym table in table order, and only then applies
 * its fallback rule. A null value goes straight to the fallback.
 */
namespace classify {

// Canonical type or synonym match; Unknown when nothing matches
EventType eventTypeFromValue(const nlohmann::json* value);

// Primary type fields, then the status fields when the primary is unknown
EventType resolveEventType(const nlohmann::json& record);

// Literal 1/2/3, severity words, digits embedded in text, numeric thresholds,
// and finally a default derived from the event type
int severityFromValue(const nlohmann::json* value, EventType type);

// 0..1 as-is, (1, 100] divided by 100, anything else clamped; per-severity
// default when the value is not numeric
double confidenceFromValue(const nlohmann::json* value, int severity);

IncidentStatus incidentStatusFromValue(const nlohmann::json* value);

EventSource sourceFromValue(const nlohmann::json* value, EventSource fallback);

// Severity-based default confidence
double defaultConfidence(int severity);

} // namespace classify
} // namespace floor_guard
