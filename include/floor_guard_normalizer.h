// floor_guard_normalizer.h
#pragma once

#include "floor_guard_event.h"
#include "floor_guard_walkability.h"
#include "floor_guard_world.h"

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace floor_guard {

/**
 * Per-record normalization settings.
 */
struct NormalizeOptions {
    std::string fallbackStoreId;                    // Empty means "s001"
    EventSource defaultSource = EventSource::UNKNOWN;
    int64_t nowMs = 0;                              // Reference clock, 0 = wall clock
};

/**
 * Feed normalization settings.
 */
struct FeedOptions : NormalizeOptions {
    int maxEvents = 600;                            // Clamped to 1..1000
};

/**
 * Point resolved by the coordinate cascade, before zone resolution and
 * walkability snapping.
 */
struct ResolvedPosition {
    double x = 0.0;
    double y = 0.0;
    bool hasWorld = false;      // World meters carried from the input
    double worldXMeters = 0.0;
    double worldZMeters = 0.0;
    std::string method;         // Which cascade step produced the point
};

/**
 * Converts loosely structured detection records into canonical events.
 *
 * Stateless apart from the shared immutable world, so concurrent calls are
 * safe. Malformed records are rejected (false / dropped), never thrown.
 */
class EventNormalizer {
public:
    explicit EventNormalizer(std::shared_ptr<const WorldConfig> world);

    /**
     * Normalize one record. Returns false when the record is not an object,
     * has no usable identity, no valid timestamp or no resolvable position.
     */
    bool adaptRawEvent(const nlohmann::json& record, const NormalizeOptions& options, Event& event) const;

    /**
     * Normalize an array of records: drop failures, keep the newest event per
     * id, sort newest first and truncate to maxEvents. Non-arrays yield an
     * empty feed.
     */
    std::vector<Event> normalizeEventFeed(const nlohmann::json& records, const FeedOptions& options) const;

    // Coordinate cascade only (exposed for diagnostics and tests)
    bool resolvePosition(const nlohmann::json& record, const std::string& cameraId, ResolvedPosition& position) const;

    // Owning zone for a resolved point
    std::string resolveZoneId(const nlohmann::json& record, double x, double y) const;

    const WorldConfig& world() const { return *m_world; }
    const WalkabilityResolver& resolver() const { return m_resolver; }

    static int clampMaxEvents(int maxEvents);

private:
    bool normalizedPosition(const nlohmann::json& record, ResolvedPosition& position) const;
    bool worldPosition(const nlohmann::json& record, ResolvedPosition& position) const;
    bool bboxPosition(const nlohmann::json& record, const std::string& cameraId,
                      bool allowFrameNormalization, ResolvedPosition& position) const;
    bool calibratedBBoxPoint(const std::string& cameraId, double centerX, double centerY,
                             double frameWidth, double frameHeight, bool hasInputFrame,
                             cv::Point2d& mapped) const;
    bool pairPosition(const nlohmann::json& record, ResolvedPosition& position) const;
    bool zoneCentroidPosition(const nlohmann::json& record, ResolvedPosition& position) const;

    std::shared_ptr<const WorldConfig> m_world;
    WalkabilityResolver m_resolver;
};

// Generic zone placeholders that never identify a real zone
bool isGenericZoneId(const std::string& zoneId);

// Free text plus "cause:" / "action:" chunks joined with " | "
std::string composeNote(const nlohmann::json& record);

} // namespace floor_guard
