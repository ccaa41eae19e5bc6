// floor_guard_walkability.cpp
#include "floor_guard_walkability.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace floor_guard {

bool pointInZoneWalkable(const ZoneGeometry& zone, double x, double y, const WalkabilityPadding& padding) {
    if (!pointInPolygon(x, y, zone.outer)) {
        return false;
    }
    if (padding.edge > 0.0 && !pointInBounds(x, y, zone.outerBounds, -padding.edge)) {
        return false;
    }
    return !pointInHole(zone, x, y, padding.hole);
}

bool pointOffObstacles(const std::vector<Polygon>& holes,
                       const std::vector<Bounds>& holeBounds,
                       double x, double y, double holePadding) {
    for (const auto& hole : holes) {
        if (pointInPolygon(x, y, hole)) {
            return false;
        }
    }
    for (const auto& bounds : holeBounds) {
        if (pointInBounds(x, y, bounds, holePadding)) {
            return false;
        }
    }
    return true;
}

bool spiralSnap(double x0, double y0, const WalkablePredicate& isWalkable, cv::Point2d& snapped,
                double step, int maxRings) {
    for (int ring = 1; ring <= maxRings; ++ring) {
        const double ringStep = ring * step;
        double bestDist2 = std::numeric_limits<double>::infinity();
        cv::Point2d best;
        bool found = false;

        auto test = [&](double x, double y) {
            double cx = clamp01(x);
            double cy = clamp01(y);
            if (!isWalkable(cx, cy)) {
                return;
            }
            double dx = cx - x0;
            double dy = cy - y0;
            double dist2 = dx * dx + dy * dy;
            if (dist2 < bestDist2) {
                bestDist2 = dist2;
                best = cv::Point2d(cx, cy);
                found = true;
            }
        };

        // Top and bottom strips, corners included
        for (int i = -ring; i <= ring; ++i) {
            double x = x0 + i * step;
            test(x, y0 - ringStep);
            test(x, y0 + ringStep);
        }
        // Left and right strips
        for (int j = -ring + 1; j <= ring - 1; ++j) {
            double y = y0 + j * step;
            test(x0 - ringStep, y);
            test(x0 + ringStep, y);
        }

        if (found) {
            snapped = best;
            return true;
        }
    }
    return false;
}

cv::Point2d projectPointToWalkable(const ZoneGeometry& zone, double x0, double y0,
                                   const WalkabilityPadding& padding) {
    const double x = clamp01(x0);
    const double y = clamp01(y0);
    if (pointInZoneWalkable(zone, x, y, padding)) {
        return cv::Point2d(x, y);
    }

    cv::Point2d best = zone.centroid;
    double bestDist2 = std::numeric_limits<double>::infinity();

    auto tryCandidate = [&](double candidateX, double candidateY) {
        double nx = clamp01(candidateX);
        double ny = clamp01(candidateY);
        if (!pointInZoneWalkable(zone, nx, ny, padding)) {
            return;
        }
        double dx = nx - x;
        double dy = ny - y;
        double dist2 = dx * dx + dy * dy;
        if (dist2 < bestDist2) {
            bestDist2 = dist2;
            best = cv::Point2d(nx, ny);
        }
    };

    tryCandidate(zone.centroid.x, zone.centroid.y);

    const Bounds& bounds = zone.outerBounds;
    if (zone.outer.size() >= 3) {
        for (int yi = 0; yi < kZoneSampleSteps; ++yi) {
            double py = bounds.minY + ((yi + 0.5) / kZoneSampleSteps) * (bounds.maxY - bounds.minY);
            for (int xi = 0; xi < kZoneSampleSteps; ++xi) {
                double px = bounds.minX + ((xi + 0.5) / kZoneSampleSteps) * (bounds.maxX - bounds.minX);
                tryCandidate(px, py);
            }
        }
    }

    if (!std::isfinite(bestDist2) && padding.edge > 0.0) {
        WalkabilityPadding relaxed = padding;
        relaxed.edge = 0.0;
        return projectPointToWalkable(zone, x, y, relaxed);
    }
    return cv::Point2d(clamp01(best.x), clamp01(best.y));
}

WalkabilityResolver::WalkabilityResolver(std::shared_ptr<const WorldConfig> world)
    : m_world(std::move(world))
{
}

cv::Point2d WalkabilityResolver::snapToFloor(double x, double y, const std::string& zoneId,
                                             SnapOutcome* outcome) const {
    const double x0 = clamp01(x);
    const double y0 = clamp01(y);
    SnapOutcome result = SnapOutcome::UNCHANGED;
    cv::Point2d point(x0, y0);

    const ZoneGeometry* zone = m_world->findZone(zoneId);
    if (zone) {
        bool atCentroid = x0 == zone->centroid.x && y0 == zone->centroid.y;
        if (atCentroid || pointInZoneWalkable(*zone, x0, y0, padding::kEvent)) {
            result = SnapOutcome::UNCHANGED;
        } else if (!pointInOuter(*zone, x0, y0)) {
            // Not even inside the zone: likely a resolution error
            point = zone->centroid;
            result = SnapOutcome::CENTROID;
        } else {
            cv::Point2d snapped;
            auto walkable = [zone](double px, double py) {
                return pointInZoneWalkable(*zone, px, py, padding::kEvent);
            };
            if (spiralSnap(x0, y0, walkable, snapped)) {
                point = snapped;
                result = SnapOutcome::SNAPPED;
            } else {
                point = zone->centroid;
                result = SnapOutcome::CENTROID;
            }
        }
    } else {
        const WorldConfig& world = *m_world;
        auto walkable = [&world](double px, double py) {
            return pointOffObstacles(world.allHoles(), world.allHoleBounds(), px, py, padding::kEvent.hole);
        };
        if (!walkable(x0, y0)) {
            cv::Point2d snapped;
            if (spiralSnap(x0, y0, walkable, snapped)) {
                point = snapped;
                result = SnapOutcome::SNAPPED;
            } else {
                result = SnapOutcome::CLAMPED;
            }
        }
    }

    if (outcome) {
        *outcome = result;
    }
    return point;
}

cv::Point2d WalkabilityResolver::projectToWalkableTarget(double x, double y, const std::string& zoneId) const {
    const ZoneGeometry* zone = m_world->findZone(zoneId);
    if (!zone) {
        return cv::Point2d(clamp01(x), clamp01(y));
    }
    return projectPointToWalkable(*zone, x, y, padding::kRobot);
}

cv::Point2d WalkabilityResolver::projectToMarkerTarget(double x, double y, const std::string& zoneId) const {
    const ZoneGeometry* zone = m_world->findZone(zoneId);
    if (!zone) {
        return cv::Point2d(clamp01(x), clamp01(y));
    }
    return projectPointToWalkable(*zone, x, y, padding::kMarker);
}

bool WalkabilityResolver::isBlockedPoint(double x, double y) const {
    const double c = kRobotClearance;
    if (x < c || x > 1.0 - c || y < c || y > 1.0 - c) {
        return true;
    }

    const double d = c * 0.72;
    const double footprint[][2] = {
        {0.0, 0.0}, {c, 0.0}, {-c, 0.0}, {0.0, c}, {0.0, -c},
        {d, d}, {d, -d}, {-d, d}, {-d, -d}
    };
    for (const auto& offset : footprint) {
        if (!pointOffObstacles(m_world->allHoles(), m_world->allHoleBounds(),
                               clamp01(x + offset[0]), clamp01(y + offset[1]), padding::kRobot.hole)) {
            return true;
        }
    }
    return false;
}

std::string snapOutcomeToString(WalkabilityResolver::SnapOutcome outcome) {
    switch (outcome) {
        case WalkabilityResolver::SnapOutcome::UNCHANGED: return "unchanged";
        case WalkabilityResolver::SnapOutcome::SNAPPED: return "snapped";
        case WalkabilityResolver::SnapOutcome::CENTROID: return "centroid";
        case WalkabilityResolver::SnapOutcome::CLAMPED: return "clamped";
    }
    return "unchanged";
}

} // namespace floor_guard
