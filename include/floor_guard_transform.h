// floor_guard_transform.h
#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace floor_guard {

/**
 * Physical footprint of the floor plan in meters.
 */
struct WorldFrame {
    double widthM = 9.0;
    double depthM = 4.8;
    double offsetXM = 0.0;
    double offsetZM = 0.0;
};

/**
 * Maps between map-normalized space (proportional to the floor-plan image)
 * and world-normalized space (proportional to the physical footprint).
 *
 * The map image is fitted inside the world footprint preserving its aspect:
 * one axis fills the footprint exactly, the other is scaled down and centered.
 * mapNorm = worldNorm * scale + offset, per axis.
 */
class MapWorldTransform {
public:
    MapWorldTransform();
    MapWorldTransform(double mapPixelWidth, double mapPixelHeight,
                      double worldWidthM, double worldDepthM);

    cv::Point2d mapNormToWorldNorm(double x, double y) const;
    cv::Point2d worldNormToMapNorm(double x, double y) const;

    double scaleX() const { return m_scaleX; }
    double scaleY() const { return m_scaleY; }
    double offsetX() const { return m_offsetX; }
    double offsetY() const { return m_offsetY; }

private:
    double m_scaleX;
    double m_scaleY;
    double m_offsetX;
    double m_offsetY;
};

// World meters -> world-normalized, clamped to [0,1]
cv::Point2d worldMetersToWorldNorm(const WorldFrame& frame, double xM, double zM);

// World-normalized -> world meters
cv::Point2d worldNormToWorldMeters(const WorldFrame& frame, double x, double y);

/**
 * Solve the planar projective transform taking each src[i] to dst[i]
 * (exactly 4 correspondences, h33 fixed to 1). Returns false when the
 * 8x8 system is singular or the solution is not finite.
 */
bool computeHomography(const std::vector<cv::Point2d>& src,
                       const std::vector<cv::Point2d>& dst,
                       cv::Matx33d& homography);

// Project a point. Returns false when the homogeneous divisor is ~0.
bool applyHomography(const cv::Matx33d& homography, double x, double y, cv::Point2d& mapped);

/**
 * Per-camera calibration: image pixels -> map-normalized coordinates.
 */
struct CameraCalibration {
    std::string cameraKey;     // Lower-cased, trimmed camera id
    cv::Matx33d homography;
    bool hasFrame = false;     // Declared calibration frame size present
    double frameWidth = 0.0;
    double frameHeight = 0.0;
};

// Registry key for a camera id
std::string normalizeCameraKey(const std::string& cameraId);

} // namespace floor_guard
