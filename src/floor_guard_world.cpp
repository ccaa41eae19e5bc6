// floor_guard_world.cpp
#include "floor_guard_world.h"
#include "floor_guard_fields.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace floor_guard {

using json = nlohmann::json;

// Reads a finite number from an object member, accepting numeric strings
static bool readWorldNumber(const json& object, const char* key, double& value) {
    if (!object.is_object() || !object.contains(key)) {
        return false;
    }
    return fields::parseNumber(&object[key], value);
}

std::shared_ptr<const WorldConfig> WorldConfig::fromJson(const json& zoneMap, const json& cameraCalibration) {
    if (!zoneMap.is_object() || !zoneMap.contains("map") || !zoneMap["map"].is_object()) {
        throw std::runtime_error("zone map has no \"map\" section");
    }

    std::shared_ptr<WorldConfig> world(new WorldConfig());
    const json& map = zoneMap["map"];

    if (!readWorldNumber(map, "width", world->m_mapWidth) || world->m_mapWidth <= 0.0 ||
        !readWorldNumber(map, "height", world->m_mapHeight) || world->m_mapHeight <= 0.0) {
        throw std::runtime_error("zone map has invalid map.width / map.height");
    }

    if (zoneMap.contains("store_id") && zoneMap["store_id"].is_string()) {
        world->m_storeId = zoneMap["store_id"].get<std::string>();
    }

    // Physical footprint, defaults match the reference floor
    if (map.contains("world") && map["world"].is_object()) {
        const json& worldJson = map["world"];
        double value = 0.0;
        if (readWorldNumber(worldJson, "width_m", value)) {
            world->m_worldFrame.widthM = std::max(0.001, value);
        }
        if (readWorldNumber(worldJson, "depth_m", value)) {
            world->m_worldFrame.depthM = std::max(0.001, value);
        }
        if (readWorldNumber(worldJson, "offset_x_m", value)) {
            world->m_worldFrame.offsetXM = value;
        }
        if (readWorldNumber(worldJson, "offset_z_m", value)) {
            world->m_worldFrame.offsetZM = value;
        }
    }

    world->m_transform = MapWorldTransform(world->m_mapWidth, world->m_mapHeight,
                                           world->m_worldFrame.widthM, world->m_worldFrame.depthM);

    world->m_zones = loadZones(zoneMap.contains("zones") ? zoneMap["zones"] : json::array(),
                               world->m_mapWidth, world->m_mapHeight);
    if (world->m_zones.empty()) {
        throw std::runtime_error("zone map defines no usable zones");
    }

    for (size_t i = 0; i < world->m_zones.size(); ++i) {
        const ZoneGeometry& zone = world->m_zones[i];
        if (world->m_zoneIndex.count(zone.zoneId)) {
            Logger::warning("WorldConfig", "Duplicate zone id " + zone.zoneId + ", keeping the first");
            continue;
        }
        world->m_zoneIndex[zone.zoneId] = i;
        world->m_allHoles.insert(world->m_allHoles.end(), zone.holes.begin(), zone.holes.end());
        world->m_allHoleBounds.insert(world->m_allHoleBounds.end(),
                                      zone.holeBounds.begin(), zone.holeBounds.end());
    }

    size_t skipped = 0;
    if (cameraCalibration.is_object() && cameraCalibration.contains("cameras") &&
        cameraCalibration["cameras"].is_array()) {
        for (const auto& row : cameraCalibration["cameras"]) {
            if (!world->registerCameraRow(row)) {
                skipped++;
            }
        }
    }

    Logger::info("WorldConfig", "Loaded " + std::to_string(world->m_zones.size()) + " zones, " +
                 std::to_string(world->m_cameras.size()) + " calibrated cameras (" +
                 std::to_string(skipped) + " skipped)");

    return world;
}

static json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("cannot parse " + path + ": " + e.what());
    }
}

std::shared_ptr<const WorldConfig> WorldConfig::loadFromFiles(const std::string& zoneMapPath,
                                                              const std::string& calibrationPath) {
    json zoneMap = readJsonFile(zoneMapPath);
    json calibration = calibrationPath.empty() ? json::object() : readJsonFile(calibrationPath);
    return fromJson(zoneMap, calibration);
}

static std::vector<cv::Point2d> readCalibrationPoints(const json* value) {
    std::vector<cv::Point2d> points;
    if (!value || !value->is_array()) {
        return points;
    }
    for (const auto& item : *value) {
        if (!item.is_array() || item.size() < 2) {
            continue;
        }
        double x = 0.0, y = 0.0;
        if (fields::parseNumber(&item[0], x) && fields::parseNumber(&item[1], y)) {
            points.emplace_back(x, y);
        }
    }
    return points;
}

bool WorldConfig::registerCameraRow(const json& row) {
    if (!row.is_object()) {
        return false;
    }
    std::string cameraId;
    if (!fields::parseText(fields::pickValue(row, {"camera_id", "cameraId"}), cameraId)) {
        Logger::warning("WorldConfig", "Calibration row without camera_id skipped");
        return false;
    }
    if (row.contains("enabled") && row["enabled"].is_boolean() && !row["enabled"].get<bool>()) {
        Logger::warning("WorldConfig", "Camera " + cameraId + " is disabled, skipped");
        return false;
    }

    std::vector<cv::Point2d> src = readCalibrationPoints(fields::pickValue(row, {"image_points", "imagePoints"}));
    std::vector<cv::Point2d> dst = readCalibrationPoints(fields::pickValue(row, {"map_norm_points", "mapNormPoints"}));
    if (src.size() < 4 || dst.size() < 4) {
        Logger::warning("WorldConfig", "Camera " + cameraId + " has fewer than 4 correspondences, skipped");
        return false;
    }
    src.resize(4);
    dst.resize(4);

    CameraCalibration calibration;
    if (!computeHomography(src, dst, calibration.homography)) {
        Logger::warning("WorldConfig", "Camera " + cameraId + " has a singular homography, skipped");
        return false;
    }
    calibration.cameraKey = normalizeCameraKey(cameraId);

    if (row.contains("frame") && row["frame"].is_object()) {
        double width = 0.0, height = 0.0;
        if (readWorldNumber(row["frame"], "width", width) &&
            readWorldNumber(row["frame"], "height", height) &&
            width > 0.0 && height > 0.0) {
            calibration.hasFrame = true;
            calibration.frameWidth = width;
            calibration.frameHeight = height;
        }
    }

    m_cameras[calibration.cameraKey] = calibration;
    Logger::debug("WorldConfig", "Registered homography for camera " + calibration.cameraKey);
    return true;
}

const ZoneGeometry* WorldConfig::findZone(const std::string& zoneId) const {
    auto it = m_zoneIndex.find(zoneId);
    if (it == m_zoneIndex.end()) {
        return nullptr;
    }
    return &m_zones[it->second];
}

const ZoneGeometry* WorldConfig::zoneContainingOuter(double x, double y) const {
    for (const auto& zone : m_zones) {
        if (pointInOuter(zone, x, y)) {
            return &zone;
        }
    }
    return nullptr;
}

std::string WorldConfig::nearestZoneByCentroid(double x, double y) const {
    std::string nearestZoneId = m_zones.front().zoneId;
    double nearestDistance = std::numeric_limits<double>::infinity();

    for (const auto& zone : m_zones) {
        if (!zone.hasExplicitCentroid) {
            continue;
        }
        double dx = x - zone.centroid.x;
        double dy = y - zone.centroid.y;
        double distance = dx * dx + dy * dy;
        if (distance < nearestDistance) {
            nearestDistance = distance;
            nearestZoneId = zone.zoneId;
        }
    }
    return nearestZoneId;
}

const CameraCalibration* WorldConfig::findCamera(const std::string& cameraId) const {
    auto it = m_cameras.find(normalizeCameraKey(cameraId));
    if (it == m_cameras.end()) {
        return nullptr;
    }
    return &it->second;
}

cv::Point2d WorldConfig::mapNormToWorldMeters(double x, double y) const {
    cv::Point2d worldNorm = m_transform.mapNormToWorldNorm(x, y);
    return worldNormToWorldMeters(m_worldFrame, worldNorm.x, worldNorm.y);
}

} // namespace floor_guard
