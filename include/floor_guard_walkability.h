// floor_guard_walkability.h
#pragma once

#include "floor_guard_geometry.h"
#include "floor_guard_world.h"

#include <functional>
#include <memory>
#include <string>
#include <opencv2/core.hpp>

namespace floor_guard {

/**
 * Obstacle buffers in map-normalized units. `hole` grows every hole's
 * bounding box; `edge` shrinks the zone's outer bounding box (0 disables).
 */
struct WalkabilityPadding {
    double hole;
    double edge;
};

namespace padding {
    const WalkabilityPadding kEvent = {0.024, 0.012};   // Normalized event positions
    const WalkabilityPadding kRobot = {0.014, 0.004};   // Agent targets
    const WalkabilityPadding kMarker = {0.03, 0.016};   // Presentation markers
}

// Agent footprint radius checked around a candidate position
const double kRobotClearance = 0.007;

const double kSpiralStep = 0.003;
const int kSpiralMaxRings = 60;
const int kZoneSampleSteps = 24;

using WalkablePredicate = std::function<bool(double x, double y)>;

// Inside the outer polygon, clear of the edge margin, outside every hole
// polygon and every padded hole box
bool pointInZoneWalkable(const ZoneGeometry& zone, double x, double y, const WalkabilityPadding& padding);

// Outside every listed hole polygon and padded hole box
bool pointOffObstacles(const std::vector<Polygon>& holes,
                       const std::vector<Bounds>& holeBounds,
                       double x, double y, double holePadding);

/**
 * Expanding square ring search around (x0, y0). Ring r samples its four
 * edges at `step` spacing at distance r * step, clamps each sample to [0,1]
 * and keeps the walkable one closest to the origin. Stops at the first ring
 * that yields any walkable sample. Returns false when `maxRings` rings fail.
 */
bool spiralSnap(double x0, double y0, const WalkablePredicate& isWalkable, cv::Point2d& snapped,
                double step = kSpiralStep, int maxRings = kSpiralMaxRings);

/**
 * Bounded grid projection into a zone's walkable area: the clamped point when
 * already walkable, else the closest walkable point among the centroid and a
 * kZoneSampleSteps x kZoneSampleSteps grid over the outer bounds. Retries
 * once without edge padding; the zone centroid when nothing qualifies.
 */
cv::Point2d projectPointToWalkable(const ZoneGeometry& zone, double x, double y,
                                   const WalkabilityPadding& padding);

/**
 * Zone-aware walkability decisions over one WorldConfig.
 */
class WalkabilityResolver {
public:
    enum class SnapOutcome {
        UNCHANGED,   // Already walkable (after clamping)
        SNAPPED,     // Moved by the spiral search
        CENTROID,    // Replaced by the zone centroid
        CLAMPED      // Unknown zone and no escape found
    };

    explicit WalkabilityResolver(std::shared_ptr<const WorldConfig> world);

    /**
     * Place a normalized event position on walkable floor for `zoneId`.
     * Known zone: keep when walkable or exactly at the zone centroid, use the
     * centroid when outside the outer polygon, else spiral-snap (centroid on
     * failure). Unknown zone: keep off every known obstacle footprint.
     */
    cv::Point2d snapToFloor(double x, double y, const std::string& zoneId, SnapOutcome* outcome = nullptr) const;

    // Grid projection with agent paddings; clamped point for unknown zones
    cv::Point2d projectToWalkableTarget(double x, double y, const std::string& zoneId) const;

    // Grid projection with marker paddings; clamped point for unknown zones
    cv::Point2d projectToMarkerTarget(double x, double y, const std::string& zoneId) const;

    // Agent footprint check: outside the floor margins, or any clearance point
    // inside a hole polygon or padded hole box of any zone
    bool isBlockedPoint(double x, double y) const;

    const WorldConfig& world() const { return *m_world; }

private:
    std::shared_ptr<const WorldConfig> m_world;
};

std::string snapOutcomeToString(WalkabilityResolver::SnapOutcome outcome);

} // namespace floor_guard
