// floor_guard_fields.h
#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace floor_guard {
namespace fields {

/**
 * Logical fields of a raw detection record. Each field is resolved by
 * trying its candidate key paths in order (see keyPaths) and handing the
 * first non-null value to the field's parser.
 */
enum class Field {
    EventId,
    CameraId,
    TrackId,
    DetectedAt,
    IngestedAt,
    Latency,
    RawStatus,
    ObjectLabel,
    Type,
    TypeFallback,
    Severity,
    Confidence,
    NormX,
    NormY,
    WorldX,
    WorldZ,
    WorldXMeters,
    WorldZMeters,
    BBox,
    FrameWidth,
    FrameHeight,
    PositionPair,
    ZoneId,
    StoreId,
    Source,
    IncidentStatus,
    ModelVersion,
    NoteText,
    NoteCause,
    NoteAction
};

// Ordered candidate key paths ("a.b.c" walks nested objects)
const std::vector<std::string>& keyPaths(Field field);

// Value at a dotted path, or nullptr when absent or null
const nlohmann::json* readPath(const nlohmann::json& record, const std::string& path);

// First non-null value among the paths
const nlohmann::json* pickValue(const nlohmann::json& record, const std::vector<std::string>& paths);

inline const nlohmann::json* pickField(const nlohmann::json& record, Field field) {
    return pickValue(record, keyPaths(field));
}

// Non-empty trimmed string, or a finite number rendered as a rounded integer
bool parseId(const nlohmann::json* value, std::string& id);

// Finite number, or a string holding one
bool parseNumber(const nlohmann::json* value, double& number);

// Non-empty trimmed string
bool parseText(const nlohmann::json* value, std::string& text);

// Raw string value (untrimmed), when the value is a string
bool readString(const nlohmann::json* value, std::string& text);

/**
 * Epoch milliseconds from epoch seconds, epoch milliseconds, numeric strings
 * or ISO-8601 date strings. Seconds in [1e9, 1e11] are scaled by 1000.
 * Values before 2000-01-01 or more than 365 days after `nowMs` are rejected.
 */
bool parseEpochMs(const nlohmann::json* value, int64_t nowMs, int64_t& epochMs);

// Bounds used by parseEpochMs
int64_t minValidEpochMs();
const int64_t kMaxFutureDriftMs = 1000LL * 60 * 60 * 24 * 365;

} // namespace fields
} // namespace floor_guard
