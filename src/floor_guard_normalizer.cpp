// floor_guard_normalizer.cpp
#include "floor_guard_normalizer.h"
#include "floor_guard_classify.h"
#include "floor_guard_fields.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace floor_guard {

using json = nlohmann::json;
using fields::Field;

namespace {

const char* const kDefaultStoreId = "s001";

struct BBox {
    double x1;
    double y1;
    double x2;
    double y2;
};

// 0..1 passes through, 0..100 is read as a percentage
bool percentCoordinate(const json* value, double& coordinate) {
    double parsed = 0.0;
    if (!fields::parseNumber(value, parsed)) {
        return false;
    }
    if (parsed >= 0.0 && parsed <= 1.0) {
        coordinate = parsed;
        return true;
    }
    if (parsed >= 0.0 && parsed <= 100.0) {
        coordinate = clamp01(parsed / 100.0);
        return true;
    }
    return false;
}

// Percent rule first, then division by the frame size
bool frameCoordinate(double value, double frameSize, double& coordinate) {
    if (!std::isfinite(value)) {
        return false;
    }
    if (value >= 0.0 && value <= 1.0) {
        coordinate = value;
        return true;
    }
    if (value >= 0.0 && value <= 100.0) {
        coordinate = clamp01(value / 100.0);
        return true;
    }
    if (frameSize > 0.0) {
        coordinate = clamp01(value / frameSize);
        return true;
    }
    return false;
}

BBox orderedBox(double x1, double y1, double x2, double y2) {
    BBox box;
    box.x1 = std::min(x1, x2);
    box.y1 = std::min(y1, y2);
    box.x2 = std::max(x1, x2);
    box.y2 = std::max(y1, y2);
    return box;
}

// [x1, y1, x2, y2], {x1, y1, x2, y2} (with aliases) or {x, y, w, h}
bool parseBBox(const json* value, BBox& box) {
    if (!value) {
        return false;
    }

    if (value->is_array()) {
        if (value->size() < 4) {
            return false;
        }
        double x1 = 0.0, y1 = 0.0, x2 = 0.0, y2 = 0.0;
        if (fields::parseNumber(&(*value)[0], x1) && fields::parseNumber(&(*value)[1], y1) &&
            fields::parseNumber(&(*value)[2], x2) && fields::parseNumber(&(*value)[3], y2)) {
            box = orderedBox(x1, y1, x2, y2);
            return true;
        }
        return false;
    }

    if (!value->is_object()) {
        return false;
    }

    double x1 = 0.0, y1 = 0.0, x2 = 0.0, y2 = 0.0;
    if (fields::parseNumber(fields::pickValue(*value, {"x1", "left", "xmin", "x_min"}), x1) &&
        fields::parseNumber(fields::pickValue(*value, {"y1", "top", "ymin", "y_min"}), y1) &&
        fields::parseNumber(fields::pickValue(*value, {"x2", "right", "xmax", "x_max"}), x2) &&
        fields::parseNumber(fields::pickValue(*value, {"y2", "bottom", "ymax", "y_max"}), y2)) {
        box = orderedBox(x1, y1, x2, y2);
        return true;
    }

    double x = 0.0, y = 0.0, w = 0.0, h = 0.0;
    if (fields::parseNumber(fields::pickValue(*value, {"x", "left"}), x) &&
        fields::parseNumber(fields::pickValue(*value, {"y", "top"}), y) &&
        fields::parseNumber(fields::pickValue(*value, {"w", "width"}), w) &&
        fields::parseNumber(fields::pickValue(*value, {"h", "height"}), h)) {
        box = orderedBox(x, y, x + std::max(0.0, w), y + std::max(0.0, h));
        return true;
    }
    return false;
}

} // namespace

bool isGenericZoneId(const std::string& zoneId) {
    static const char* const generic[] = {"store", "site", "shop", "global", "all"};
    const std::string lowered = StringUtils::toLower(zoneId);
    for (const char* token : generic) {
        if (lowered == token) {
            return true;
        }
    }
    return false;
}

std::string composeNote(const json& record) {
    std::string direct, cause, action;
    fields::parseText(fields::pickField(record, Field::NoteText), direct);
    fields::parseText(fields::pickField(record, Field::NoteCause), cause);
    fields::parseText(fields::pickField(record, Field::NoteAction), action);

    std::vector<std::string> chunks;
    if (!direct.empty()) chunks.push_back(direct);
    if (!cause.empty()) chunks.push_back("cause:" + cause);
    if (!action.empty()) chunks.push_back("action:" + action);

    std::string note;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) {
            note += " | ";
        }
        note += chunks[i];
    }
    return note;
}

EventNormalizer::EventNormalizer(std::shared_ptr<const WorldConfig> world)
    : m_world(world),
      m_resolver(world)
{
}

int EventNormalizer::clampMaxEvents(int maxEvents) {
    return std::max(1, std::min(1000, maxEvents));
}

bool EventNormalizer::normalizedPosition(const json& record, ResolvedPosition& position) const {
    double x = 0.0, y = 0.0;
    if (!percentCoordinate(fields::pickField(record, Field::NormX), x) ||
        !percentCoordinate(fields::pickField(record, Field::NormY), y)) {
        return false;
    }
    position.x = x;
    position.y = y;
    position.method = "normalized";

    // Meters supplied next to normalized coordinates are carried as-is
    double worldX = 0.0, worldZ = 0.0;
    if (fields::parseNumber(fields::pickField(record, Field::WorldXMeters), worldX) &&
        fields::parseNumber(fields::pickField(record, Field::WorldZMeters), worldZ)) {
        position.hasWorld = true;
        position.worldXMeters = worldX;
        position.worldZMeters = worldZ;
    }
    return true;
}

bool EventNormalizer::worldPosition(const json& record, ResolvedPosition& position) const {
    double worldX = 0.0, worldZ = 0.0;
    if (!fields::parseNumber(fields::pickField(record, Field::WorldX), worldX) ||
        !fields::parseNumber(fields::pickField(record, Field::WorldZ), worldZ)) {
        return false;
    }

    const WorldFrame& frame = m_world->worldFrame();
    cv::Point2d worldNorm;
    if (worldX >= 0.0 && worldX <= 1.0 && worldZ >= 0.0 && worldZ <= 1.0) {
        // Producer already sent world-normalized values
        worldNorm = cv::Point2d(worldX, worldZ);
        cv::Point2d meters = worldNormToWorldMeters(frame, worldNorm.x, worldNorm.y);
        position.worldXMeters = meters.x;
        position.worldZMeters = meters.y;
        position.method = "world_norm";
    } else {
        worldNorm = worldMetersToWorldNorm(frame, worldX, worldZ);
        position.worldXMeters = worldX;
        position.worldZMeters = worldZ;
        position.method = "world_meters";
    }

    cv::Point2d mapNorm = m_world->transform().worldNormToMapNorm(worldNorm.x, worldNorm.y);
    position.x = mapNorm.x;
    position.y = mapNorm.y;
    position.hasWorld = true;
    return true;
}

bool EventNormalizer::calibratedBBoxPoint(const std::string& cameraId, double centerX, double centerY,
                                          double frameWidth, double frameHeight, bool hasInputFrame,
                                          cv::Point2d& mapped) const {
    if (cameraId.empty()) {
        return false;
    }
    const CameraCalibration* calibration = m_world->findCamera(cameraId);
    if (!calibration) {
        return false;
    }

    const bool normalizedInput = centerX >= 0.0 && centerX <= 1.0 && centerY >= 0.0 && centerY <= 1.0;
    double x = centerX;
    double y = centerY;

    // Bring the point into the pixel space the homography was fitted in
    if (calibration->hasFrame) {
        if (normalizedInput) {
            x = centerX * calibration->frameWidth;
            y = centerY * calibration->frameHeight;
        } else if (hasInputFrame) {
            x = (centerX / frameWidth) * calibration->frameWidth;
            y = (centerY / frameHeight) * calibration->frameHeight;
        }
    } else if (hasInputFrame && normalizedInput) {
        x = centerX * frameWidth;
        y = centerY * frameHeight;
    }

    cv::Point2d projected;
    if (!applyHomography(calibration->homography, x, y, projected)) {
        return false;
    }
    mapped = cv::Point2d(clamp01(projected.x), clamp01(projected.y));
    return true;
}

bool EventNormalizer::bboxPosition(const json& record, const std::string& cameraId,
                                   bool allowFrameNormalization, ResolvedPosition& position) const {
    BBox box;
    if (!parseBBox(fields::pickField(record, Field::BBox), box)) {
        return false;
    }

    double frameWidthRaw = 0.0, frameHeightRaw = 0.0;
    bool hasWidth = fields::parseNumber(fields::pickField(record, Field::FrameWidth), frameWidthRaw);
    bool hasHeight = fields::parseNumber(fields::pickField(record, Field::FrameHeight), frameHeightRaw);
    const bool hasInputFrame = hasWidth && hasHeight && frameWidthRaw > 0.0 && frameHeightRaw > 0.0;

    // Bottom-center approximates the ground contact point
    const double centerX = (box.x1 + box.x2) / 2.0;
    const double centerY = box.y2;

    cv::Point2d mapped;
    if (calibratedBBoxPoint(cameraId, centerX, centerY, frameWidthRaw, frameHeightRaw, hasInputFrame, mapped)) {
        position.x = mapped.x;
        position.y = mapped.y;
        position.method = "bbox_homography";
        return true;
    }
    if (!allowFrameNormalization) {
        return false;
    }

    const double frameWidth = hasWidth && frameWidthRaw > 0.0 ? frameWidthRaw : m_world->mapPixelWidth();
    const double frameHeight = hasHeight && frameHeightRaw > 0.0 ? frameHeightRaw : m_world->mapPixelHeight();
    double x = 0.0, y = 0.0;
    if (!frameCoordinate(centerX, frameWidth, x) || !frameCoordinate(centerY, frameHeight, y)) {
        return false;
    }
    position.x = x;
    position.y = y;
    position.method = "bbox_frame";
    return true;
}

bool EventNormalizer::pairPosition(const json& record, ResolvedPosition& position) const {
    const json* pair = fields::pickField(record, Field::PositionPair);
    if (!pair || !pair->is_array() || pair->size() < 2) {
        return false;
    }
    double x = 0.0, y = 0.0;
    if (!percentCoordinate(&(*pair)[0], x) || !percentCoordinate(&(*pair)[1], y)) {
        return false;
    }
    position.x = x;
    position.y = y;
    position.method = "pair";
    return true;
}

bool EventNormalizer::zoneCentroidPosition(const json& record, ResolvedPosition& position) const {
    std::string zoneId;
    if (!fields::parseId(fields::pickField(record, Field::ZoneId), zoneId)) {
        return false;
    }
    const ZoneGeometry* zone = m_world->findZone(zoneId);
    if (!zone || !zone->hasExplicitCentroid) {
        return false;
    }
    position.x = zone->centroid.x;
    position.y = zone->centroid.y;
    position.method = "zone_centroid";
    return true;
}

bool EventNormalizer::resolvePosition(const json& record, const std::string& cameraId,
                                      ResolvedPosition& position) const {
    if (normalizedPosition(record, position)) return true;
    if (worldPosition(record, position)) return true;
    if (bboxPosition(record, cameraId, false, position)) return true;
    if (bboxPosition(record, cameraId, true, position)) return true;
    if (pairPosition(record, position)) return true;
    return zoneCentroidPosition(record, position);
}

std::string EventNormalizer::resolveZoneId(const json& record, double x, double y) const {
    std::string explicitZoneId;
    if (fields::parseId(fields::pickField(record, Field::ZoneId), explicitZoneId)) {
        // Unknown ids are still trusted unless they are placeholders
        if (m_world->hasZone(explicitZoneId) || !isGenericZoneId(explicitZoneId)) {
            return explicitZoneId;
        }
    }

    // Outer polygon only, so a point on a shelf stays in its zone
    const ZoneGeometry* hit = m_world->zoneContainingOuter(x, y);
    if (hit) {
        return hit->zoneId;
    }
    return m_world->nearestZoneByCentroid(x, y);
}

bool EventNormalizer::adaptRawEvent(const json& record, const NormalizeOptions& options, Event& event) const {
    if (!record.is_object()) {
        Logger::trace("Normalizer", "Dropped record: not an object");
        return false;
    }

    const int64_t nowMs = options.nowMs > 0 ? options.nowMs : TimeUtils::nowMs();

    Event result;
    fields::parseId(fields::pickField(record, Field::CameraId), result.cameraId);
    fields::parseId(fields::pickField(record, Field::TrackId), result.trackId);

    if (!fields::parseId(fields::pickField(record, Field::EventId), result.id)) {
        if (result.trackId.empty()) {
            Logger::trace("Normalizer", "Dropped record: no id and no track id");
            return false;
        }
        result.id = (result.cameraId.empty() ? std::string("cam-unknown") : result.cameraId) +
                    ":track-" + result.trackId;
    }

    if (!fields::parseEpochMs(fields::pickField(record, Field::DetectedAt), nowMs, result.detectedAt)) {
        Logger::trace("Normalizer", "Dropped record " + result.id + ": no valid timestamp");
        return false;
    }
    if (!fields::parseEpochMs(fields::pickField(record, Field::IngestedAt), nowMs, result.ingestedAt)) {
        result.ingestedAt = result.detectedAt;
    }

    double latency = 0.0;
    if (fields::parseNumber(fields::pickField(record, Field::Latency), latency)) {
        result.latencyMs = std::max<int64_t>(0, std::llround(latency));
    } else {
        result.latencyMs = std::max<int64_t>(0, result.ingestedAt - result.detectedAt);
    }

    fields::readString(fields::pickField(record, Field::RawStatus), result.rawStatus);
    fields::readString(fields::pickField(record, Field::ObjectLabel), result.objectLabel);

    result.type = classify::resolveEventType(record);
    result.severity = classify::severityFromValue(fields::pickField(record, Field::Severity), result.type);
    result.confidence = classify::confidenceFromValue(fields::pickField(record, Field::Confidence),
                                                      result.severity);

    ResolvedPosition position;
    if (!resolvePosition(record, result.cameraId, position)) {
        Logger::trace("Normalizer", "Dropped record " + result.id + ": no resolvable position");
        return false;
    }

    result.zoneId = resolveZoneId(record, position.x, position.y);

    WalkabilityResolver::SnapOutcome outcome = WalkabilityResolver::SnapOutcome::UNCHANGED;
    cv::Point2d snapped = m_resolver.snapToFloor(position.x, position.y, result.zoneId, &outcome);
    result.x = snapped.x;
    result.y = snapped.y;

    if (position.hasWorld && outcome == WalkabilityResolver::SnapOutcome::UNCHANGED) {
        result.worldXMeters = position.worldXMeters;
        result.worldZMeters = position.worldZMeters;
    } else {
        cv::Point2d meters = m_world->mapNormToWorldMeters(result.x, result.y);
        result.worldXMeters = meters.x;
        result.worldZMeters = meters.y;
    }

    if (outcome != WalkabilityResolver::SnapOutcome::UNCHANGED) {
        Logger::trace("Normalizer", "Event " + result.id + " position " + position.method + " " +
                      snapOutcomeToString(outcome) + " in zone " + result.zoneId);
    }

    if (!fields::parseId(fields::pickField(record, Field::StoreId), result.storeId)) {
        result.storeId = options.fallbackStoreId.empty() ? std::string(kDefaultStoreId) : options.fallbackStoreId;
    }

    result.source = classify::sourceFromValue(fields::pickField(record, Field::Source), options.defaultSource);
    result.incidentStatus = classify::incidentStatusFromValue(fields::pickField(record, Field::IncidentStatus));
    fields::parseId(fields::pickField(record, Field::ModelVersion), result.modelVersion);
    result.note = composeNote(record);

    event = std::move(result);
    return true;
}

std::vector<Event> EventNormalizer::normalizeEventFeed(const json& records, const FeedOptions& options) const {
    TIME_SCOPE("normalizeEventFeed");

    std::vector<Event> feed;
    if (!records.is_array()) {
        return feed;
    }

    std::map<std::string, size_t> indexById;
    size_t dropped = 0;
    for (const auto& record : records) {
        Event event;
        if (!adaptRawEvent(record, options, event)) {
            dropped++;
            continue;
        }
        auto it = indexById.find(event.id);
        if (it == indexById.end()) {
            indexById[event.id] = feed.size();
            feed.push_back(std::move(event));
        } else if (isNewerEvent(event, feed[it->second])) {
            feed[it->second] = std::move(event);
        }
    }

    sortEventFeed(feed);
    const size_t maxEvents = static_cast<size_t>(clampMaxEvents(options.maxEvents));
    if (feed.size() > maxEvents) {
        feed.resize(maxEvents);
    }

    Logger::debug("Normalizer", "Normalized " + std::to_string(feed.size()) + " events from " +
                  std::to_string(records.size()) + " records (" + std::to_string(dropped) + " dropped)");
    return feed;
}

} // namespace floor_guard
