// floor_guard_geometry.h
#pragma once

#include <string>
#include <vector>
#include <random>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace floor_guard {

// Polygon in map-normalized coordinates (0.0-1.0)
using Polygon = std::vector<cv::Point2f>;

/**
 * Axis-aligned bounding box in map-normalized coordinates.
 * An empty polygon yields an inverted box that contains nothing.
 */
struct Bounds {
    double minX;
    double maxX;
    double minY;
    double maxY;
};

Bounds polygonBounds(const Polygon& polygon);

// Positive padding grows the box, negative padding shrinks it
bool pointInBounds(double x, double y, const Bounds& bounds, double padding = 0.0);

// Inside or on the boundary. Polygons with fewer than 3 vertices contain nothing.
bool pointInPolygon(double x, double y, const Polygon& polygon);

/**
 * Static description of one floor zone: an outer walkable boundary with
 * obstacle footprints ("holes") such as shelves and islands.
 */
struct ZoneGeometry {
    std::string zoneId;
    std::string name;
    Polygon outer;
    std::vector<Polygon> holes;
    Bounds outerBounds;
    std::vector<Bounds> holeBounds;
    cv::Point2d centroid;              // Normalized, clamped to [0,1]
    bool hasExplicitCentroid = false;  // False when defaulted to (0.5, 0.5)
};

// Outer polygon only; holes are ignored
bool pointInOuter(const ZoneGeometry& zone, double x, double y);

// Inside any hole polygon or any hole's bounds grown by `holePadding`
bool pointInHole(const ZoneGeometry& zone, double x, double y, double holePadding);

/**
 * Build zone geometries from the zone map "zones" array. Pixel coordinates
 * are divided by the map size. Entries that are not finite 2-tuples are
 * dropped; zones without an id are skipped.
 */
std::vector<ZoneGeometry> loadZones(const nlohmann::json& rawZoneDefs,
                                    double mapPixelWidth,
                                    double mapPixelHeight);

// Random point inside the zone's outer polygon (rejection sampled over its
// bounds). Falls back to the centroid when sampling does not hit the polygon.
cv::Point2d samplePointInZone(const ZoneGeometry& zone, std::mt19937& rng);

double clamp01(double value);
double clampRange(double value, double minValue, double maxValue);

} // namespace floor_guard
