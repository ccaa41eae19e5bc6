// tests/floor_guard_test_support.h - Shared checks and fixtures for the test programs

#pragma once

#include "floor_guard_world.h"

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace test_support {

inline int& failureCount() {
    static int count = 0;
    return count;
}

inline int& checkCount() {
    static int count = 0;
    return count;
}

inline void recordCheck(bool passed, const char* file, int line, const std::string& what) {
    checkCount()++;
    if (!passed) {
        failureCount()++;
        std::cerr << "  FAILED " << file << ":" << line << ": " << what << std::endl;
    }
}

// Print the summary line and turn the failure count into an exit code
inline int finish(const std::string& suite) {
    std::cout << suite << ": " << (checkCount() - failureCount()) << "/" << checkCount()
              << " checks passed" << std::endl;
    return failureCount() == 0 ? 0 : 1;
}

// Base clock for scenarios: 2024-01-01T00:00:00Z
const int64_t kBaseMs = 1704067200000LL;

/**
 * Square 1000x1000 px floor over a 10 m x 10 m footprint, so map-normalized
 * and world-normalized coordinates coincide.
 *
 *   aisle-a  x 0.02..0.48, shelf hole x 0.15..0.35 y 0.30..0.50, centroid (0.25, 0.75)
 *   aisle-b  x 0.52..0.98, no holes, centroid (0.75, 0.20)
 */
inline nlohmann::json sampleZoneMap() {
    return nlohmann::json::parse(R"({
        "store_id": "s042",
        "map": {
            "width": 1000,
            "height": 1000,
            "world": {"width_m": 10.0, "depth_m": 10.0, "offset_x_m": 0.0, "offset_z_m": 0.0}
        },
        "zones": [
            {
                "zone_id": "aisle-a",
                "name": "Aisle A",
                "polygon": [[20, 20], [480, 20], [480, 980], [20, 980]],
                "holes": [[[150, 300], [350, 300], [350, 500], [150, 500]]],
                "centroid": [250, 750]
            },
            {
                "zone_id": "aisle-b",
                "name": "Aisle B",
                "polygon": [[520, 20], [980, 20], [980, 980], [520, 980]],
                "centroid": [750, 200]
            }
        ]
    })");
}

/**
 * cam-1 maps its 1000x1000 image straight onto the floor (pixel / 1000).
 * cam-flat has collinear correspondences and must be skipped.
 */
inline nlohmann::json sampleCalibration() {
    return nlohmann::json::parse(R"({
        "cameras": [
            {
                "camera_id": "cam-1",
                "image_points": [[0, 0], [1000, 0], [1000, 1000], [0, 1000]],
                "map_norm_points": [[0, 0], [1, 0], [1, 1], [0, 1]],
                "frame": {"width": 1000, "height": 1000}
            },
            {
                "camera_id": "cam-flat",
                "image_points": [[0, 0], [1, 1], [2, 2], [3, 3]],
                "map_norm_points": [[0, 0], [1, 0], [1, 1], [0, 1]]
            },
            {
                "camera_id": "cam-off",
                "enabled": false,
                "image_points": [[0, 0], [1000, 0], [1000, 1000], [0, 1000]],
                "map_norm_points": [[0, 0], [1, 0], [1, 1], [0, 1]]
            }
        ]
    })");
}

inline std::shared_ptr<const floor_guard::WorldConfig> sampleWorld() {
    return floor_guard::WorldConfig::fromJson(sampleZoneMap(), sampleCalibration());
}

} // namespace test_support

#define CHECK(cond) \
    test_support::recordCheck((cond), __FILE__, __LINE__, #cond)

#define CHECK_NEAR(actual, expected, tolerance) \
    test_support::recordCheck(std::fabs((actual) - (expected)) <= (tolerance), __FILE__, __LINE__, \
                              #actual " ~= " #expected)
