// floor_guard_geometry.cpp
#include "floor_guard_geometry.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <opencv2/imgproc.hpp>

namespace floor_guard {

using json = nlohmann::json;

double clampRange(double value, double minValue, double maxValue) {
    return std::max(minValue, std::min(maxValue, value));
}

double clamp01(double value) {
    return clampRange(value, 0.0, 1.0);
}

Bounds polygonBounds(const Polygon& polygon) {
    Bounds bounds;
    bounds.minX = std::numeric_limits<double>::infinity();
    bounds.minY = std::numeric_limits<double>::infinity();
    bounds.maxX = -std::numeric_limits<double>::infinity();
    bounds.maxY = -std::numeric_limits<double>::infinity();

    for (const auto& point : polygon) {
        bounds.minX = std::min(bounds.minX, static_cast<double>(point.x));
        bounds.maxX = std::max(bounds.maxX, static_cast<double>(point.x));
        bounds.minY = std::min(bounds.minY, static_cast<double>(point.y));
        bounds.maxY = std::max(bounds.maxY, static_cast<double>(point.y));
    }
    return bounds;
}

bool pointInBounds(double x, double y, const Bounds& bounds, double padding) {
    return x >= bounds.minX - padding &&
           x <= bounds.maxX + padding &&
           y >= bounds.minY - padding &&
           y <= bounds.maxY + padding;
}

bool pointInPolygon(double x, double y, const Polygon& polygon) {
    if (polygon.size() < 3) {
        return false;
    }
    cv::Point2f point(static_cast<float>(x), static_cast<float>(y));
    return cv::pointPolygonTest(polygon, point, false) >= 0;
}

bool pointInOuter(const ZoneGeometry& zone, double x, double y) {
    return pointInPolygon(x, y, zone.outer);
}

bool pointInHole(const ZoneGeometry& zone, double x, double y, double holePadding) {
    for (const auto& hole : zone.holes) {
        if (pointInPolygon(x, y, hole)) {
            return true;
        }
    }
    for (const auto& bounds : zone.holeBounds) {
        if (pointInBounds(x, y, bounds, holePadding)) {
            return true;
        }
    }
    return false;
}

// Reads a finite [x, y] pair; anything else is rejected
static bool readPixelPair(const json& value, double& x, double& y) {
    if (!value.is_array() || value.size() < 2) {
        return false;
    }
    if (!value[0].is_number() || !value[1].is_number()) {
        return false;
    }
    x = value[0].get<double>();
    y = value[1].get<double>();
    return std::isfinite(x) && std::isfinite(y);
}

static Polygon normalizePolygon(const json& rawPolygon, double mapWidth, double mapHeight) {
    Polygon polygon;
    if (!rawPolygon.is_array()) {
        return polygon;
    }
    for (const auto& pair : rawPolygon) {
        double xPx = 0.0, yPx = 0.0;
        if (!readPixelPair(pair, xPx, yPx)) {
            continue;
        }
        polygon.emplace_back(static_cast<float>(xPx / mapWidth),
                             static_cast<float>(yPx / mapHeight));
    }
    return polygon;
}

std::vector<ZoneGeometry> loadZones(const json& rawZoneDefs, double mapPixelWidth, double mapPixelHeight) {
    std::vector<ZoneGeometry> zones;
    if (!rawZoneDefs.is_array() || mapPixelWidth <= 0.0 || mapPixelHeight <= 0.0) {
        return zones;
    }

    for (const auto& zoneJson : rawZoneDefs) {
        if (!zoneJson.is_object()) {
            continue;
        }
        auto idIt = zoneJson.find("zone_id");
        if (idIt == zoneJson.end() || !idIt->is_string() || idIt->get<std::string>().empty()) {
            Logger::warning("Geometry", "Skipping zone without zone_id");
            continue;
        }

        ZoneGeometry zone;
        zone.zoneId = idIt->get<std::string>();
        if (zoneJson.contains("name") && zoneJson["name"].is_string()) {
            zone.name = zoneJson["name"].get<std::string>();
        }

        if (zoneJson.contains("polygon")) {
            zone.outer = normalizePolygon(zoneJson["polygon"], mapPixelWidth, mapPixelHeight);
        }
        if (zone.outer.size() < 3) {
            Logger::warning("Geometry", "Zone " + zone.zoneId + " has fewer than 3 usable outer vertices");
        }

        if (zoneJson.contains("holes") && zoneJson["holes"].is_array()) {
            for (const auto& rawHole : zoneJson["holes"]) {
                Polygon hole = normalizePolygon(rawHole, mapPixelWidth, mapPixelHeight);
                if (!hole.empty()) {
                    zone.holes.push_back(hole);
                }
            }
        }

        zone.outerBounds = polygonBounds(zone.outer);
        for (const auto& hole : zone.holes) {
            zone.holeBounds.push_back(polygonBounds(hole));
        }

        zone.centroid = cv::Point2d(0.5, 0.5);
        if (zoneJson.contains("centroid")) {
            const json& centroid = zoneJson["centroid"];
            if (centroid.is_array() && centroid.size() >= 2) {
                double cx = centroid[0].is_number() ? centroid[0].get<double>() : NAN;
                double cy = centroid[1].is_number() ? centroid[1].get<double>() : NAN;
                zone.centroid.x = std::isfinite(cx) ? clamp01(cx / mapPixelWidth) : 0.5;
                zone.centroid.y = std::isfinite(cy) ? clamp01(cy / mapPixelHeight) : 0.5;
                zone.hasExplicitCentroid = true;
            }
        }

        zones.push_back(zone);
    }

    return zones;
}

cv::Point2d samplePointInZone(const ZoneGeometry& zone, std::mt19937& rng) {
    if (zone.outer.size() < 3) {
        return zone.centroid;
    }

    const Bounds& bounds = zone.outerBounds;
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (int attempt = 0; attempt < 64; ++attempt) {
        double x = bounds.minX + unit(rng) * (bounds.maxX - bounds.minX);
        double y = bounds.minY + unit(rng) * (bounds.maxY - bounds.minY);
        if (pointInPolygon(x, y, zone.outer)) {
            return cv::Point2d(x, y);
        }
    }
    return zone.centroid;
}

} // namespace floor_guard
