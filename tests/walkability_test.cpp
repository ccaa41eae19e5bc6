// tests/walkability_test.cpp - Spiral snap, grid projection and obstacle checks

#include "floor_guard_geometry.h"
#include "floor_guard_utils.h"
#include "floor_guard_walkability.h"
#include "floor_guard_test_support.h"

#include <cmath>
#include <iostream>
#include <string>

using namespace floor_guard;
using json = nlohmann::json;

namespace {

// Zone whose single hole covers its whole floor
std::shared_ptr<const WorldConfig> blockedWorld() {
    json zoneMap = json::parse(R"({
        "map": {"width": 100, "height": 100},
        "zones": [{
            "zone_id": "solid",
            "polygon": [[10, 10], [90, 10], [90, 90], [10, 90]],
            "holes": [[[10, 10], [90, 10], [90, 90], [10, 90]]],
            "centroid": [50, 50]
        }]
    })");
    return WorldConfig::fromJson(zoneMap, json::object());
}

// Corridor 0.02 wide, narrower than twice the marker edge margin
std::shared_ptr<const WorldConfig> stripWorld() {
    json zoneMap = json::parse(R"({
        "map": {"width": 1000, "height": 1000},
        "zones": [{
            "zone_id": "strip",
            "polygon": [[490, 100], [510, 100], [510, 900], [490, 900]],
            "centroid": [500, 500]
        }]
    })");
    return WorldConfig::fromJson(zoneMap, json::object());
}

} // namespace

void runSpiralSnapTest() {
    std::cout << "=== Running Spiral Snap Test ===" << std::endl;

    // Everything right of 0.6 is walkable
    WalkablePredicate rightSide = [](double x, double) { return x > 0.6; };
    cv::Point2d snapped;
    CHECK(spiralSnap(0.5, 0.5, rightSide, snapped));
    CHECK(snapped.x > 0.6);
    CHECK(rightSide(snapped.x, snapped.y));
    // First successful ring is the one just past the boundary
    CHECK(snapped.x - 0.5 <= 0.1 + kSpiralStep + 1e-9);
    CHECK_NEAR(snapped.y, 0.5, 1e-9);

    // Beyond the search radius
    WalkablePredicate farAway = [](double x, double) { return x > 0.95; };
    CHECK(!spiralSnap(0.5, 0.5, farAway, snapped));

    WalkablePredicate nothing = [](double, double) { return false; };
    CHECK(!spiralSnap(0.5, 0.5, nothing, snapped));

    // Samples are clamped into the unit square
    WalkablePredicate corner = [](double x, double y) { return x == 0.0 && y == 0.0; };
    CHECK(spiralSnap(0.002, 0.002, corner, snapped));
    CHECK(snapped.x == 0.0 && snapped.y == 0.0);
}

void runZoneWalkabilityTest() {
    std::cout << "=== Running Zone Walkability Test ===" << std::endl;

    auto world = test_support::sampleWorld();
    const ZoneGeometry* aisle = world->findZone("aisle-a");
    CHECK(aisle != nullptr);
    if (!aisle) {
        return;
    }

    CHECK(pointInZoneWalkable(*aisle, 0.25, 0.75, padding::kEvent));
    CHECK(!pointInZoneWalkable(*aisle, 0.25, 0.40, padding::kEvent));     // On the shelf
    CHECK(!pointInZoneWalkable(*aisle, 0.25, 0.52, padding::kEvent));     // Inside the shelf buffer
    CHECK(!pointInZoneWalkable(*aisle, 0.025, 0.75, padding::kEvent));    // Edge margin
    CHECK(pointInZoneWalkable(*aisle, 0.025, 0.75, {padding::kEvent.hole, 0.0}));
    CHECK(!pointInZoneWalkable(*aisle, 0.60, 0.75, padding::kEvent));     // Other aisle

    CHECK(!pointOffObstacles(world->allHoles(), world->allHoleBounds(), 0.36, 0.40, 0.024));
    CHECK(pointOffObstacles(world->allHoles(), world->allHoleBounds(), 0.36, 0.40, 0.0));

    // Grid projection
    cv::Point2d kept = projectPointToWalkable(*aisle, 0.2, 0.8, padding::kRobot);
    CHECK_NEAR(kept.x, 0.2, 1e-12);
    CHECK_NEAR(kept.y, 0.8, 1e-12);

    cv::Point2d moved = projectPointToWalkable(*aisle, 0.25, 0.40, padding::kRobot);
    CHECK(pointInZoneWalkable(*aisle, moved.x, moved.y, padding::kRobot));

    cv::Point2d outside = projectPointToWalkable(*aisle, 0.9, 0.9, padding::kMarker);
    CHECK(pointInZoneWalkable(*aisle, outside.x, outside.y, padding::kMarker));

    // Nothing walkable at all: centroid
    auto solid = blockedWorld();
    const ZoneGeometry* solidZone = solid->findZone("solid");
    cv::Point2d fallback = projectPointToWalkable(*solidZone, 0.3, 0.3, padding::kRobot);
    CHECK_NEAR(fallback.x, 0.5, 1e-12);
    CHECK_NEAR(fallback.y, 0.5, 1e-12);
}

void runNarrowZoneTest() {
    std::cout << "=== Running Narrow Zone Test ===" << std::endl;

    auto world = stripWorld();
    const ZoneGeometry* strip = world->findZone("strip");
    CHECK(strip != nullptr);
    if (!strip) {
        return;
    }

    // No point survives the full margin, not even the centroid
    CHECK(!pointInZoneWalkable(*strip, 0.5, 0.5, padding::kMarker));

    // Falls back to the nearest grid sample with the edge margin dropped
    cv::Point2d target = projectPointToWalkable(*strip, 0.3, 0.5, padding::kMarker);
    CHECK(pointInZoneWalkable(*strip, target.x, target.y, {padding::kMarker.hole, 0.0}));
    CHECK(!pointInZoneWalkable(*strip, target.x, target.y, padding::kMarker));
    CHECK(!(target.x == strip->centroid.x && target.y == strip->centroid.y));
    CHECK(target.x < 0.495);
    CHECK_NEAR(target.x, 0.49 + 0.02 / 48.0, 1e-9);
    CHECK(std::fabs(target.y - 0.5) < 0.02);

    WalkabilityResolver resolver(world);
    cv::Point2d marker = resolver.projectToMarkerTarget(0.3, 0.5, "strip");
    CHECK_NEAR(marker.x, target.x, 1e-12);
    CHECK_NEAR(marker.y, target.y, 1e-12);
}

void runResolverTest() {
    std::cout << "=== Running Resolver Test ===" << std::endl;

    auto world = test_support::sampleWorld();
    WalkabilityResolver resolver(world);
    WalkabilityResolver::SnapOutcome outcome = WalkabilityResolver::SnapOutcome::CLAMPED;

    cv::Point2d p = resolver.snapToFloor(0.2, 0.8, "aisle-a", &outcome);
    CHECK(outcome == WalkabilityResolver::SnapOutcome::UNCHANGED);
    CHECK(p.x == 0.2 && p.y == 0.8);

    // Outside the zone polygon: centroid
    p = resolver.snapToFloor(0.7, 0.7, "aisle-a", &outcome);
    CHECK(outcome == WalkabilityResolver::SnapOutcome::CENTROID);
    CHECK(p.x == 0.25 && p.y == 0.75);

    // On the shelf: nearest walkable floor, not the centroid
    p = resolver.snapToFloor(0.25, 0.40, "aisle-a", &outcome);
    CHECK(outcome == WalkabilityResolver::SnapOutcome::SNAPPED);
    CHECK(pointInZoneWalkable(*world->findZone("aisle-a"), p.x, p.y, padding::kEvent));
    CHECK(std::hypot(p.x - 0.25, p.y - 0.40) < 0.18);

    // The centroid itself is always accepted
    p = resolver.snapToFloor(0.25, 0.75, "aisle-a", &outcome);
    CHECK(outcome == WalkabilityResolver::SnapOutcome::UNCHANGED);

    // Unknown zone: kept off every known obstacle
    p = resolver.snapToFloor(0.30, 0.45, "dock", &outcome);
    CHECK(outcome == WalkabilityResolver::SnapOutcome::SNAPPED);
    CHECK(pointOffObstacles(world->allHoles(), world->allHoleBounds(), p.x, p.y, padding::kEvent.hole));

    p = resolver.snapToFloor(1.4, -0.2, "dock", &outcome);
    CHECK(outcome == WalkabilityResolver::SnapOutcome::UNCHANGED);
    CHECK(p.x == 1.0 && p.y == 0.0);

    // Agent footprint
    CHECK(resolver.isBlockedPoint(0.003, 0.5));          // Floor margin
    CHECK(resolver.isBlockedPoint(0.25, 0.40));          // Shelf
    CHECK(resolver.isBlockedPoint(0.36, 0.40));          // Within clearance of the shelf buffer
    CHECK(!resolver.isBlockedPoint(0.25, 0.75));

    cv::Point2d target = resolver.projectToWalkableTarget(0.25, 0.40, "aisle-a");
    CHECK(pointInZoneWalkable(*world->findZone("aisle-a"), target.x, target.y, padding::kRobot));

    cv::Point2d marker = resolver.projectToMarkerTarget(1.3, 0.5, "nowhere");
    CHECK(marker.x == 1.0 && marker.y == 0.5);

    CHECK(snapOutcomeToString(WalkabilityResolver::SnapOutcome::SNAPPED) == "snapped");
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    Logger::setLogLevel(Logger::Level::WARNING);

    try {
        runSpiralSnapTest();
        runZoneWalkabilityTest();
        runNarrowZoneTest();
        runResolverTest();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return test_support::finish("walkability_test");
}
