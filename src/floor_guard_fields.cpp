// floor_guard_fields.cpp
#include "floor_guard_fields.h"
#include "floor_guard_utils.h"

#include <cmath>
#include <cstdlib>
#include <map>

namespace floor_guard {
namespace fields {

using json = nlohmann::json;

namespace {

const std::map<Field, std::vector<std::string>>& fieldTable() {
    static const std::map<Field, std::vector<std::string>> table = {
        {Field::EventId, {"id", "event_id", "eventId", "uuid", "alarm_id", "alarmId", "alert_id", "alertId"}},
        {Field::CameraId, {"camera_id", "cameraId", "camera.id", "device_id", "deviceId", "device.id"}},
        {Field::TrackId, {"track_id", "trackId", "tracking_id", "trackingId", "object_id", "objectId"}},
        {Field::DetectedAt, {"detected_at", "detectedAt", "ts", "timestamp", "created_at", "createdAt", "time"}},
        {Field::IngestedAt, {"ingested_at", "ingestedAt", "received_at", "receivedAt", "updated_at", "updatedAt"}},
        {Field::Latency, {"latency_ms", "latencyMs", "latency", "delay_ms"}},
        {Field::RawStatus, {"status", "state", "event_status", "result.status", "payload.status", "raw_status"}},
        {Field::ObjectLabel, {"label", "object.label", "class", "class_name", "object.class", "event_label",
                              "object_label"}},
        {Field::Type, {"type", "event_type", "eventType", "category", "event_name", "label"}},
        {Field::TypeFallback, {"status", "state", "event_status", "eventState"}},
        {Field::Severity, {"severity", "priority", "level", "risk", "risk_level", "riskLevel", "status", "state"}},
        {Field::Confidence, {"confidence", "score", "probability", "confidence_score", "confidenceScore"}},
        {Field::NormX, {"x", "x_norm", "xNorm", "position.x", "position.x_norm", "position.xNorm", "location.x",
                        "location.x_norm", "location.xNorm", "coord.x", "coordinates.x", "point.x", "geo.x"}},
        {Field::NormY, {"y", "y_norm", "yNorm", "position.y", "position.y_norm", "position.yNorm", "location.y",
                        "location.y_norm", "location.yNorm", "coord.y", "coordinates.y", "point.y", "geo.y"}},
        {Field::WorldX, {"world.x", "worldX", "world_x", "position.world.x", "position_world.x", "location.world.x",
                         "location.world_x", "location.x_m", "x_m"}},
        {Field::WorldZ, {"world.z", "worldZ", "world_z", "position.world.z", "position_world.z", "location.world.z",
                         "location.world_z", "location.z_m", "z_m"}},
        {Field::WorldXMeters, {"world_x_m", "worldXMeters"}},
        {Field::WorldZMeters, {"world_z_m", "worldZMeters"}},
        {Field::BBox, {"location.bbox", "location.bounding_box", "location.box", "bbox", "bounding_box", "box",
                       "position.bbox", "detection.bbox"}},
        {Field::FrameWidth, {"frame.width", "frameWidth", "image.width", "imageWidth", "resolution.width",
                             "data.frame.width", "payload.frame.width", "camera.frame_width",
                             "location.frame.width", "location.frame_width", "meta.frame_width", "meta.width"}},
        {Field::FrameHeight, {"frame.height", "frameHeight", "image.height", "imageHeight", "resolution.height",
                              "data.frame.height", "payload.frame.height", "camera.frame_height",
                              "location.frame.height", "location.frame_height", "meta.frame_height",
                              "meta.height"}},
        {Field::PositionPair, {"position", "location", "coord", "coordinates", "point"}},
        {Field::ZoneId, {"zone_id", "zoneId", "zone.id", "zone.zone_id", "location.zone_id", "location.zoneId",
                         "area_id", "areaId"}},
        {Field::StoreId, {"store_id", "storeId", "store.id", "site_id", "siteId", "shop_id", "shopId"}},
        {Field::Source, {"source", "provider", "channel", "origin", "ingest_source"}},
        {Field::IncidentStatus, {"incident_status", "incidentStatus", "status", "state", "resolution",
                                 "result.status"}},
        {Field::ModelVersion, {"model_version", "modelVersion", "model.version"}},
        {Field::NoteText, {"note", "message", "description", "reason", "summary", "vlm_analysis.summary"}},
        {Field::NoteCause, {"vlm_analysis.cause", "analysis.cause"}},
        {Field::NoteAction, {"vlm_analysis.action", "analysis.action", "action", "recommended_action"}},
    };
    return table;
}

bool parseNumericText(const std::string& raw, double& number) {
    const std::string text = StringUtils::trim(raw);
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return false;
    }
    number = value;
    return true;
}

} // namespace

const std::vector<std::string>& keyPaths(Field field) {
    static const std::vector<std::string> empty;
    const auto& table = fieldTable();
    auto it = table.find(field);
    return it == table.end() ? empty : it->second;
}

const json* readPath(const json& record, const std::string& path) {
    const json* cursor = &record;
    for (const auto& chunk : StringUtils::split(path, '.')) {
        if (!cursor->is_object()) {
            return nullptr;
        }
        auto it = cursor->find(chunk);
        if (it == cursor->end()) {
            return nullptr;
        }
        cursor = &(*it);
    }
    return cursor->is_null() ? nullptr : cursor;
}

const json* pickValue(const json& record, const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        const json* value = readPath(record, path);
        if (value) {
            return value;
        }
    }
    return nullptr;
}

bool parseId(const json* value, std::string& id) {
    if (!value) {
        return false;
    }
    if (value->is_string()) {
        std::string trimmed = StringUtils::trim(value->get<std::string>());
        if (trimmed.empty()) {
            return false;
        }
        id = trimmed;
        return true;
    }
    if (value->is_number_integer()) {
        id = value->dump();
        return true;
    }
    if (value->is_number_float()) {
        double number = value->get<double>();
        if (!std::isfinite(number)) {
            return false;
        }
        id = std::to_string(static_cast<long long>(std::llround(number)));
        return true;
    }
    return false;
}

bool parseNumber(const json* value, double& number) {
    if (!value) {
        return false;
    }
    if (value->is_number()) {
        double parsed = value->get<double>();
        if (!std::isfinite(parsed)) {
            return false;
        }
        number = parsed;
        return true;
    }
    if (value->is_string()) {
        return parseNumericText(value->get<std::string>(), number);
    }
    return false;
}

bool parseText(const json* value, std::string& text) {
    if (!value || !value->is_string()) {
        return false;
    }
    std::string trimmed = StringUtils::trim(value->get<std::string>());
    if (trimmed.empty()) {
        return false;
    }
    text = trimmed;
    return true;
}

bool readString(const json* value, std::string& text) {
    if (!value || !value->is_string()) {
        return false;
    }
    text = value->get<std::string>();
    return true;
}

int64_t minValidEpochMs() {
    static const int64_t minEpoch = TimeUtils::utcEpochMs(2000, 1, 1);
    return minEpoch;
}

static bool acceptEpoch(double candidateMs, int64_t nowMs, int64_t& epochMs) {
    if (!std::isfinite(candidateMs)) {
        return false;
    }
    int64_t rounded = static_cast<int64_t>(std::llround(candidateMs));
    if (rounded < minValidEpochMs()) {
        return false;
    }
    if (rounded > nowMs + kMaxFutureDriftMs) {
        return false;
    }
    epochMs = rounded;
    return true;
}

static bool epochFromNumber(double value, int64_t nowMs, int64_t& epochMs) {
    if (value >= 1e12) {
        return acceptEpoch(value, nowMs, epochMs);
    }
    if (value >= 1e9 && value <= 1e11) {
        return acceptEpoch(value * 1000.0, nowMs, epochMs);
    }
    return acceptEpoch(value, nowMs, epochMs);
}

bool parseEpochMs(const json* value, int64_t nowMs, int64_t& epochMs) {
    if (!value) {
        return false;
    }
    if (value->is_number()) {
        double number = value->get<double>();
        if (!std::isfinite(number)) {
            return false;
        }
        return epochFromNumber(number, nowMs, epochMs);
    }
    if (!value->is_string()) {
        return false;
    }

    const std::string text = StringUtils::trim(value->get<std::string>());
    if (text.empty()) {
        return false;
    }

    double number = 0.0;
    if (parseNumericText(text, number)) {
        return epochFromNumber(number, nowMs, epochMs);
    }

    int64_t parsed = 0;
    if (TimeUtils::parseDateTimeMs(text, parsed)) {
        return acceptEpoch(static_cast<double>(parsed), nowMs, epochMs);
    }
    return false;
}

} // namespace fields
} // namespace floor_guard
