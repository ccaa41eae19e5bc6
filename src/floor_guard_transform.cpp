// floor_guard_transform.cpp
#include "floor_guard_transform.h"
#include "floor_guard_geometry.h"
#include "floor_guard_utils.h"

#include <cmath>

namespace floor_guard {

MapWorldTransform::MapWorldTransform()
    : m_scaleX(1.0), m_scaleY(1.0), m_offsetX(0.0), m_offsetY(0.0)
{
}

MapWorldTransform::MapWorldTransform(double mapPixelWidth, double mapPixelHeight,
                                     double worldWidthM, double worldDepthM)
    : MapWorldTransform()
{
    if (mapPixelWidth <= 0.0 || mapPixelHeight <= 0.0 || worldWidthM <= 0.0 || worldDepthM <= 0.0) {
        return;
    }

    double mapAspect = mapPixelWidth / mapPixelHeight;
    double worldAspect = worldWidthM / worldDepthM;

    if (mapAspect > worldAspect) {
        // Map is wider: it fills the world width, letterboxed vertically
        m_scaleY = mapAspect / worldAspect;
        m_offsetY = 0.5 - 0.5 * m_scaleY;
    } else if (mapAspect < worldAspect) {
        // Map is taller: it fills the world depth, letterboxed horizontally
        m_scaleX = worldAspect / mapAspect;
        m_offsetX = 0.5 - 0.5 * m_scaleX;
    }
}

cv::Point2d MapWorldTransform::mapNormToWorldNorm(double x, double y) const {
    return cv::Point2d((x - m_offsetX) / m_scaleX, (y - m_offsetY) / m_scaleY);
}

cv::Point2d MapWorldTransform::worldNormToMapNorm(double x, double y) const {
    return cv::Point2d(x * m_scaleX + m_offsetX, y * m_scaleY + m_offsetY);
}

cv::Point2d worldMetersToWorldNorm(const WorldFrame& frame, double xM, double zM) {
    return cv::Point2d(clamp01((xM - frame.offsetXM) / frame.widthM),
                       clamp01((zM - frame.offsetZM) / frame.depthM));
}

cv::Point2d worldNormToWorldMeters(const WorldFrame& frame, double x, double y) {
    return cv::Point2d(frame.offsetXM + x * frame.widthM,
                       frame.offsetZM + y * frame.depthM);
}

bool computeHomography(const std::vector<cv::Point2d>& src,
                       const std::vector<cv::Point2d>& dst,
                       cv::Matx33d& homography) {
    if (src.size() != 4 || dst.size() != 4) {
        return false;
    }

    cv::Mat A = cv::Mat::zeros(8, 8, CV_64F);
    cv::Mat b = cv::Mat::zeros(8, 1, CV_64F);

    for (int i = 0; i < 4; ++i) {
        const double x = src[i].x;
        const double y = src[i].y;
        const double u = dst[i].x;
        const double v = dst[i].y;

        double* rowU = A.ptr<double>(2 * i);
        rowU[0] = x;
        rowU[1] = y;
        rowU[2] = 1.0;
        rowU[6] = -x * u;
        rowU[7] = -y * u;
        b.at<double>(2 * i) = u;

        double* rowV = A.ptr<double>(2 * i + 1);
        rowV[3] = x;
        rowV[4] = y;
        rowV[5] = 1.0;
        rowV[6] = -x * v;
        rowV[7] = -y * v;
        b.at<double>(2 * i + 1) = v;
    }

    cv::Mat h;
    if (!cv::solve(A, b, h, cv::DECOMP_LU)) {
        return false;
    }

    for (int i = 0; i < 8; ++i) {
        if (!std::isfinite(h.at<double>(i))) {
            return false;
        }
    }

    homography = cv::Matx33d(h.at<double>(0), h.at<double>(1), h.at<double>(2),
                             h.at<double>(3), h.at<double>(4), h.at<double>(5),
                             h.at<double>(6), h.at<double>(7), 1.0);
    return true;
}

bool applyHomography(const cv::Matx33d& homography, double x, double y, cv::Point2d& mapped) {
    cv::Vec3d projected = homography * cv::Vec3d(x, y, 1.0);
    if (std::abs(projected[2]) < 1e-12) {
        return false;
    }
    mapped.x = projected[0] / projected[2];
    mapped.y = projected[1] / projected[2];
    return std::isfinite(mapped.x) && std::isfinite(mapped.y);
}

std::string normalizeCameraKey(const std::string& cameraId) {
    return StringUtils::toLower(StringUtils::trim(cameraId));
}

} // namespace floor_guard
