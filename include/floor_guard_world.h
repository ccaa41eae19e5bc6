// floor_guard_world.h
#pragma once

#include "floor_guard_geometry.h"
#include "floor_guard_transform.h"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

namespace floor_guard {

/**
 * Immutable description of one site: zone geometry, the map <-> world
 * transform and the camera homography registry. Built once at startup and
 * shared by the normalizer, the simulator and the session.
 */
class WorldConfig {
public:
    // Build from the parsed zone map and camera calibration documents.
    // Throws std::runtime_error when the zone map is unusable.
    static std::shared_ptr<const WorldConfig> fromJson(const nlohmann::json& zoneMap,
                                                       const nlohmann::json& cameraCalibration);

    // Same as fromJson, reading the documents from disk. An empty
    // calibration path means no cameras are calibrated.
    static std::shared_ptr<const WorldConfig> loadFromFiles(const std::string& zoneMapPath,
                                                            const std::string& calibrationPath);

    const std::string& storeId() const { return m_storeId; }
    double mapPixelWidth() const { return m_mapWidth; }
    double mapPixelHeight() const { return m_mapHeight; }
    const WorldFrame& worldFrame() const { return m_worldFrame; }
    const MapWorldTransform& transform() const { return m_transform; }

    // Zone lookup
    const std::vector<ZoneGeometry>& zones() const { return m_zones; }
    const ZoneGeometry* findZone(const std::string& zoneId) const;
    bool hasZone(const std::string& zoneId) const { return findZone(zoneId) != nullptr; }

    // First zone whose outer polygon contains the point (holes ignored)
    const ZoneGeometry* zoneContainingOuter(double x, double y) const;

    // Nearest zone by squared centroid distance among zones with a declared
    // centroid; the first zone when none declares one
    std::string nearestZoneByCentroid(double x, double y) const;

    // Obstacle footprints across every zone
    const std::vector<Polygon>& allHoles() const { return m_allHoles; }
    const std::vector<Bounds>& allHoleBounds() const { return m_allHoleBounds; }

    // Camera lookup by id (case-insensitive)
    const CameraCalibration* findCamera(const std::string& cameraId) const;
    size_t cameraCount() const { return m_cameras.size(); }

    // Map-normalized point -> world meters
    cv::Point2d mapNormToWorldMeters(double x, double y) const;

private:
    WorldConfig() = default;

    bool registerCameraRow(const nlohmann::json& row);

    std::string m_storeId;
    double m_mapWidth = 0.0;
    double m_mapHeight = 0.0;
    WorldFrame m_worldFrame;
    MapWorldTransform m_transform;

    std::vector<ZoneGeometry> m_zones;
    std::map<std::string, size_t> m_zoneIndex;
    std::vector<Polygon> m_allHoles;
    std::vector<Bounds> m_allHoleBounds;

    std::map<std::string, CameraCalibration> m_cameras;
};

} // namespace floor_guard
