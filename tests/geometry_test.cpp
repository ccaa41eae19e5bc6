// tests/geometry_test.cpp - Zone geometry, map/world transform, homography and field parsing

#include "floor_guard_fields.h"
#include "floor_guard_geometry.h"
#include "floor_guard_transform.h"
#include "floor_guard_utils.h"
#include "floor_guard_world.h"
#include "floor_guard_test_support.h"

#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace floor_guard;
using json = nlohmann::json;

void runPolygonTest() {
    std::cout << "=== Running Polygon Test ===" << std::endl;

    Polygon square = {{0.2f, 0.2f}, {0.6f, 0.2f}, {0.6f, 0.6f}, {0.2f, 0.6f}};
    CHECK(pointInPolygon(0.4, 0.4, square));
    CHECK(pointInPolygon(0.2, 0.4, square));          // Boundary counts as inside
    CHECK(!pointInPolygon(0.7, 0.4, square));

    Polygon degenerate = {{0.1f, 0.1f}, {0.9f, 0.9f}};
    CHECK(!pointInPolygon(0.5, 0.5, degenerate));

    Bounds bounds = polygonBounds(square);
    CHECK_NEAR(bounds.minX, 0.2, 1e-6);
    CHECK_NEAR(bounds.maxY, 0.6, 1e-6);
    CHECK(!pointInBounds(0.65, 0.4, bounds));
    CHECK(pointInBounds(0.65, 0.4, bounds, 0.06));
    CHECK(!pointInBounds(0.25, 0.4, bounds, -0.06));

    Bounds empty = polygonBounds(Polygon());
    CHECK(!pointInBounds(0.5, 0.5, empty, 0.1));
}

void runZoneLoadingTest() {
    std::cout << "=== Running Zone Loading Test ===" << std::endl;

    json zones = json::parse(R"([
        {
            "zone_id": "z1",
            "polygon": [[100, 100], ["bad", 5], [900, 100], null, [900, 400], [100, 400]],
            "holes": [[[200, 200], [300, 200], [300, 300]], "not-a-hole"],
            "centroid": [500, 250]
        },
        {"name": "no id", "polygon": [[0, 0], [10, 0], [10, 10]]},
        {"zone_id": "z2", "polygon": [[0, 500], [1000, 500], [1000, 1000], [0, 1000]]}
    ])");

    std::vector<ZoneGeometry> loaded = loadZones(zones, 1000.0, 500.0);
    CHECK(loaded.size() == 2);
    if (loaded.size() != 2) {
        return;
    }

    const ZoneGeometry& z1 = loaded[0];
    CHECK(z1.zoneId == "z1");
    CHECK(z1.outer.size() == 4);
    CHECK(z1.holes.size() == 1);
    CHECK(z1.hasExplicitCentroid);
    CHECK_NEAR(z1.centroid.x, 0.5, 1e-9);
    CHECK_NEAR(z1.centroid.y, 0.5, 1e-9);
    CHECK_NEAR(z1.outerBounds.maxY, 0.8, 1e-6);

    const ZoneGeometry& z2 = loaded[1];
    CHECK(!z2.hasExplicitCentroid);
    CHECK_NEAR(z2.centroid.x, 0.5, 1e-9);

    // Rejection sampling stays inside the outer polygon
    std::mt19937 rng(7);
    for (int i = 0; i < 50; ++i) {
        cv::Point2d p = samplePointInZone(z1, rng);
        CHECK(pointInOuter(z1, p.x, p.y));
    }
}

void runTransformTest() {
    std::cout << "=== Running Transform Test ===" << std::endl;

    // Wide map inside a deeper footprint: letterboxed vertically
    MapWorldTransform wide(2000.0, 500.0, 9.0, 4.8);
    CHECK_NEAR(wide.scaleX(), 1.0, 1e-12);
    CHECK(wide.scaleY() > 1.0);

    // Tall map: letterboxed horizontally
    MapWorldTransform tall(500.0, 1000.0, 9.0, 4.8);
    CHECK(tall.scaleX() > 1.0);
    CHECK_NEAR(tall.scaleY(), 1.0, 1e-12);

    for (const MapWorldTransform* transform : {&wide, &tall}) {
        for (int i = 0; i <= 10; ++i) {
            for (int j = 0; j <= 10; ++j) {
                double x = i / 10.0;
                double y = j / 10.0;
                cv::Point2d world = transform->mapNormToWorldNorm(x, y);
                cv::Point2d back = transform->worldNormToMapNorm(world.x, world.y);
                CHECK_NEAR(back.x, x, 1e-9);
                CHECK_NEAR(back.y, y, 1e-9);
            }
        }
    }

    WorldFrame frame;
    frame.widthM = 9.0;
    frame.depthM = 4.8;
    frame.offsetXM = -1.0;
    frame.offsetZM = 2.0;
    cv::Point2d norm = worldMetersToWorldNorm(frame, 3.5, 4.4);
    CHECK_NEAR(norm.x, 0.5, 1e-12);
    CHECK_NEAR(norm.y, 0.5, 1e-12);
    cv::Point2d meters = worldNormToWorldMeters(frame, norm.x, norm.y);
    CHECK_NEAR(meters.x, 3.5, 1e-12);
    CHECK_NEAR(meters.y, 4.4, 1e-12);

    cv::Point2d clamped = worldMetersToWorldNorm(frame, 50.0, -20.0);
    CHECK(clamped.x == 1.0);
    CHECK(clamped.y == 0.0);
}

void runHomographyTest() {
    std::cout << "=== Running Homography Test ===" << std::endl;

    std::vector<cv::Point2d> src = {{120, 80}, {1800, 140}, {1650, 1000}, {200, 950}};
    std::vector<cv::Point2d> dst = {{0.1, 0.2}, {0.8, 0.15}, {0.75, 0.9}, {0.12, 0.85}};

    cv::Matx33d h;
    CHECK(computeHomography(src, dst, h));
    for (size_t i = 0; i < src.size(); ++i) {
        cv::Point2d mapped;
        CHECK(applyHomography(h, src[i].x, src[i].y, mapped));
        CHECK_NEAR(mapped.x, dst[i].x, 1e-6);
        CHECK_NEAR(mapped.y, dst[i].y, 1e-6);
    }

    std::vector<cv::Point2d> collinear = {{0, 0}, {1, 1}, {2, 2}, {3, 3}};
    cv::Matx33d singular;
    CHECK(!computeHomography(collinear, dst, singular));

    std::vector<cv::Point2d> tooFew = {{0, 0}, {1, 0}, {1, 1}};
    CHECK(!computeHomography(tooFew, dst, singular));
}

void runWorldConfigTest() {
    std::cout << "=== Running World Config Test ===" << std::endl;

    std::ostringstream captured;
    Logger::setOutputStream(&captured);
    auto world = test_support::sampleWorld();
    Logger::setOutputStream(nullptr);
    CHECK(captured.str().find("WARNING [WorldConfig] Camera cam-off is disabled, skipped") != std::string::npos);
    CHECK(captured.str().find("cam-flat has a singular homography") != std::string::npos);

    CHECK(world->storeId() == "s042");
    CHECK(world->zones().size() == 2);
    CHECK(world->hasZone("aisle-a"));
    CHECK(!world->hasZone("aisle-z"));

    // Only cam-1 survives: cam-flat is singular, cam-off disabled
    CHECK(world->cameraCount() == 1);
    CHECK(world->findCamera(" CAM-1 ") != nullptr);
    CHECK(world->findCamera("cam-flat") == nullptr);
    CHECK(world->findCamera("cam-off") == nullptr);

    const ZoneGeometry* hit = world->zoneContainingOuter(0.3, 0.4);   // On the shelf, still aisle-a
    CHECK(hit && hit->zoneId == "aisle-a");
    CHECK(world->zoneContainingOuter(0.5, 0.5) == nullptr);           // Gap between aisles
    CHECK(world->nearestZoneByCentroid(0.5, 0.5) == "aisle-a");
    CHECK(world->nearestZoneByCentroid(0.9, 0.1) == "aisle-b");

    CHECK(world->allHoles().size() == 1);
    cv::Point2d meters = world->mapNormToWorldMeters(0.25, 0.75);
    CHECK_NEAR(meters.x, 2.5, 1e-9);
    CHECK_NEAR(meters.y, 7.5, 1e-9);

    // Startup defects are thrown
    bool threw = false;
    try {
        WorldConfig::fromJson(json::parse(R"({"zones": []})"), json::object());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);

    threw = false;
    try {
        WorldConfig::fromJson(json::parse(R"({"map": {"width": 100, "height": 100}, "zones": [{"name": "x"}]})"),
                              json::object());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);

    threw = false;
    try {
        WorldConfig::loadFromFiles("/nonexistent/zone_map.json", "");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}

void runFieldParsingTest() {
    std::cout << "=== Running Field Parsing Test ===" << std::endl;

    json record = json::parse(R"({
        "payload": {"status": "open"},
        "camera": {"id": 12.0},
        "zone": null,
        "ts": "2024-01-01T00:00:00Z"
    })");

    const json* status = fields::readPath(record, "payload.status");
    CHECK(status && status->get<std::string>() == "open");
    CHECK(fields::readPath(record, "zone") == nullptr);
    CHECK(fields::readPath(record, "payload.status.deeper") == nullptr);

    std::string cameraId;
    CHECK(fields::parseId(fields::pickField(record, fields::Field::CameraId), cameraId));
    CHECK(cameraId == "12");

    double number = 0.0;
    json numericText = "  42.5 ";
    CHECK(fields::parseNumber(&numericText, number));
    CHECK_NEAR(number, 42.5, 1e-12);
    json notNumeric = "42abc";
    CHECK(!fields::parseNumber(&notNumeric, number));

    const int64_t now = test_support::kBaseMs;
    int64_t epochMs = 0;

    CHECK(fields::parseEpochMs(fields::pickField(record, fields::Field::DetectedAt), now, epochMs));
    CHECK(epochMs == test_support::kBaseMs);

    json seconds = 1704067200;
    CHECK(fields::parseEpochMs(&seconds, now, epochMs));
    CHECK(epochMs == test_support::kBaseMs);

    json millis = 1704067200123LL;
    CHECK(fields::parseEpochMs(&millis, now, epochMs));
    CHECK(epochMs == test_support::kBaseMs + 123);

    json secondsText = "1704067200";
    CHECK(fields::parseEpochMs(&secondsText, now, epochMs));
    CHECK(epochMs == test_support::kBaseMs);

    json tooOld = "1999-12-31T23:59:59Z";
    CHECK(!fields::parseEpochMs(&tooOld, now, epochMs));

    json tooFar = "2026-01-01T00:00:00Z";
    CHECK(!fields::parseEpochMs(&tooFar, now, epochMs));

    json garbage = "yesterday";
    CHECK(!fields::parseEpochMs(&garbage, now, epochMs));

    json httpDate = "Mon, 01 Jan 2024 00:00:00 GMT";
    CHECK(fields::parseEpochMs(&httpDate, now, epochMs));
    CHECK(epochMs == test_support::kBaseMs);

    // Other common spellings of the same instant
    const char* sameInstant[] = {
        "Monday, 01-Jan-24 00:00:00 GMT",
        "2024/01/01 00:00:00",
        "2024/1/1",
        "January 1, 2024 00:00:00 UTC",
        "Jan 1, 2024",
        "Mon, 01 Jan 2024 01:00:00 +0100",
        "Sun, 31 Dec 2023 23:00:00 GMT-0100",
        "2024-01-01 00:00:00.000Z"
    };
    for (const char* text : sameInstant) {
        int64_t parsed = 0;
        bool ok = TimeUtils::parseDateTimeMs(text, parsed);
        CHECK(ok);
        CHECK(parsed == test_support::kBaseMs);
        if (!ok || parsed != test_support::kBaseMs) {
            std::cerr << "  date text: " << text << std::endl;
        }
    }

    int64_t withMillis = 0;
    CHECK(TimeUtils::parseDateTimeMs("Mon, 01 Jan 2024 00:00:01 GMT", withMillis));
    CHECK(withMillis == test_support::kBaseMs + 1000);

    const char* malformed[] = {
        "Mon, 32 Jan 2024 00:00:00 GMT",
        "Mon, 01 Foo 2024 00:00:00 GMT",
        "Mon, 01 Jan 2024 00:00:00 PST",
        "Mon, 01 Jan 2024 25:00:00 GMT",
        "January 1 2024",
        "2024/01-01",
        "2024/13/01 00:00:00",
        "01-Jan-2"
    };
    for (const char* text : malformed) {
        int64_t parsed = 0;
        bool ok = TimeUtils::parseDateTimeMs(text, parsed);
        CHECK(!ok);
        if (ok) {
            std::cerr << "  date text: " << text << std::endl;
        }
    }
}

void runLoggerTest() {
    std::cout << "=== Running Logger Test ===" << std::endl;

    std::ostringstream sink;
    Logger::setOutputStream(&sink);
    Logger::warning("Sync", "payload rejected");
    Logger::info("Sync", "below the threshold");
    Logger::error("bare message");
    Logger::setOutputStream(nullptr);

    const std::string text = sink.str();
    CHECK(text.find("WARNING [Sync] payload rejected") != std::string::npos);
    CHECK(text.find("below the threshold") == std::string::npos);
    CHECK(text.find("ERROR bare message") != std::string::npos);

    // Restored stream: nothing more lands in the old sink
    Logger::warning("Sync", "after restore");
    CHECK(sink.str() == text);
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    Logger::setLogLevel(Logger::Level::WARNING);

    try {
        runPolygonTest();
        runZoneLoadingTest();
        runTransformTest();
        runHomographyTest();
        runWorldConfigTest();
        runFieldParsingTest();
        runLoggerTest();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return test_support::finish("geometry_test");
}
