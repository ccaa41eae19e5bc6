// tests/event_store_test.cpp - Sync payload decoding, event store merges and manual tags

#include "floor_guard_event_store.h"
#include "floor_guard_normalizer.h"
#include "floor_guard_utils.h"
#include "floor_guard_test_support.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace floor_guard;
using json = nlohmann::json;

namespace {

FeedOptions feedOptions() {
    FeedOptions options;
    options.nowMs = test_support::kBaseMs + 60000;
    return options;
}

json record(const std::string& id, int64_t offsetMs, double x, double y) {
    json r;
    r["id"] = id;
    r["detected_at"] = test_support::kBaseMs + offsetMs;
    r["x"] = x;
    r["y"] = y;
    return r;
}

bool hasId(const std::vector<Event>& events, const std::string& id) {
    return std::any_of(events.begin(), events.end(), [&id](const Event& e) { return e.id == id; });
}

bool hasRemoval(const SyncBatch& batch, const std::string& id) {
    return std::find(batch.removals.begin(), batch.removals.end(), id) != batch.removals.end();
}

} // namespace

void runSyncPayloadTest() {
    std::cout << "=== Running Sync Payload Test ===" << std::endl;

    EventNormalizer normalizer(test_support::sampleWorld());

    // Bare array
    json bare = json::array({record("a", 0, 0.3, 0.8), record("b", 10, 0.7, 0.6)});
    SyncBatch batch = parseSyncPayload(bare, normalizer, feedOptions());
    CHECK(batch.mode == SyncBatch::Mode::MERGE);
    CHECK(batch.upserts.size() == 2);
    CHECK(batch.removals.empty());

    // Envelope with explicit mode
    json envelope;
    envelope["mode"] = "replace";
    envelope["events"] = json::array({record("a", 0, 0.3, 0.8)});
    batch = parseSyncPayload(envelope, normalizer, feedOptions());
    CHECK(batch.mode == SyncBatch::Mode::REPLACE);
    CHECK(batch.upserts.size() == 1);

    // Boolean snapshot flag and alternate array key
    json snapshot;
    snapshot["snapshot"] = true;
    snapshot["data"] = json::array({record("c", 0, 0.3, 0.8)});
    batch = parseSyncPayload(snapshot, normalizer, feedOptions());
    CHECK(batch.mode == SyncBatch::Mode::REPLACE);
    CHECK(batch.upserts.size() == 1 && batch.upserts[0].id == "c");

    // Nested mode and records, per-record delete and id lists
    json nested = json::parse(R"({
        "sync": {"mode": "delta"},
        "payload": {
            "events": [
                {"id": "d", "detected_at": 1704067200000, "x": 0.3, "y": 0.8},
                {"id": "gone-1", "op": "DELETE"},
                {"camera_id": "cam1", "track_id": "9", "operation": "removed"}
            ],
            "deleted_ids": ["gone-2", 77]
        },
        "removed": [{"id": "gone-3"}]
    })");
    batch = parseSyncPayload(nested, normalizer, feedOptions());
    CHECK(batch.mode == SyncBatch::Mode::MERGE);
    CHECK(batch.upserts.size() == 1 && batch.upserts[0].id == "d");
    CHECK(hasRemoval(batch, "gone-1"));
    CHECK(hasRemoval(batch, "cam1:track-9"));
    CHECK(hasRemoval(batch, "gone-2"));
    CHECK(hasRemoval(batch, "77"));
    CHECK(hasRemoval(batch, "gone-3"));

    // Single record, wrapped and bare
    json wrapped;
    wrapped["event"] = record("e", 0, 0.3, 0.8);
    batch = parseSyncPayload(wrapped, normalizer, feedOptions());
    CHECK(batch.upserts.size() == 1 && batch.upserts[0].id == "e");

    batch = parseSyncPayload(record("f", 0, 0.3, 0.8), normalizer, feedOptions());
    CHECK(batch.upserts.size() == 1 && batch.upserts[0].id == "f");

    json deleteOne = json::parse(R"({"alert": {"alert_id": "g", "event_op": "clear"}})");
    batch = parseSyncPayload(deleteOne, normalizer, feedOptions());
    CHECK(batch.upserts.empty());
    CHECK(hasRemoval(batch, "g"));

    // Text payloads
    batch = parseSyncPayloadText("not json at all", normalizer, feedOptions());
    CHECK(batch.isNoop());
    batch = parseSyncPayloadText("   ", normalizer, feedOptions());
    CHECK(batch.isNoop());
    batch = parseSyncPayloadText(R"({"full_sync": "yes", "items": []})", normalizer, feedOptions());
    CHECK(batch.mode == SyncBatch::Mode::MERGE);    // "yes" names no mode
    batch = parseSyncPayloadText(R"({"sync_mode": "FULL", "items": []})", normalizer, feedOptions());
    CHECK(batch.mode == SyncBatch::Mode::REPLACE);
    CHECK(!batch.isNoop());

    batch = parseSyncPayload(json(42), normalizer, feedOptions());
    CHECK(batch.isNoop());
    CHECK(syncModeToString(SyncBatch::Mode::REPLACE) == "replace");
}

void runStoreApplyTest() {
    std::cout << "=== Running Store Apply Test ===" << std::endl;

    auto normalizer = std::make_shared<EventNormalizer>(test_support::sampleWorld());
    EventStore store(normalizer, 3, 99);

    int notifications = 0;
    SyncSummary lastNotified;
    store.setChangeCallback([&](const SyncSummary& summary) {
        notifications++;
        lastNotified = summary;
    });

    SyncSummary summary;
    CHECK(!store.apply(SyncBatch(), &summary));
    CHECK(notifications == 0);

    SyncBatch first = parseSyncPayload(json::array({record("a", 0, 0.3, 0.8), record("b", 10, 0.7, 0.6)}),
                                       *normalizer, feedOptions());
    CHECK(store.apply(first, &summary));
    CHECK(summary.upserted == 2 && summary.total == 2);
    CHECK(notifications == 1 && lastNotified.total == 2);

    std::shared_ptr<const std::vector<Event>> before = store.snapshot();

    // Older copy of "a" is ignored, newer copy of "b" replaces it
    json older = record("a", -50, 0.2, 0.9);
    json newer = record("b", 20, 0.3, 0.7);
    newer["note"] = "moved";
    SyncBatch second = parseSyncPayload(json::array({older, newer}), *normalizer, feedOptions());
    CHECK(store.apply(second, &summary));
    CHECK(summary.upserted == 1);

    std::shared_ptr<const std::vector<Event>> after = store.snapshot();
    CHECK(before->size() == 2);
    const Event& b = (*after)[0];
    CHECK(b.id == "b" && b.note == "moved");
    CHECK((*before)[0].note.empty());              // Earlier snapshot untouched

    // Removals apply after upserts
    SyncBatch removal;
    removal.upserts = parseSyncPayload(json::array({record("c", 30, 0.3, 0.8)}), *normalizer,
                                       feedOptions()).upserts;
    removal.removals = {"a", "c", "missing"};
    CHECK(store.apply(removal, &summary));
    CHECK(summary.removed == 2);
    CHECK(summary.total == 1);
    CHECK(hasId(*store.snapshot(), "b"));

    // Capacity keeps the newest events
    SyncBatch bulk = parseSyncPayload(json::array({record("m1", 100, 0.3, 0.8), record("m2", 200, 0.3, 0.8),
                                                   record("m3", 300, 0.3, 0.8), record("m4", 400, 0.3, 0.8)}),
                                      *normalizer, feedOptions());
    CHECK(store.apply(bulk, &summary));
    CHECK(summary.total == 3);
    std::shared_ptr<const std::vector<Event>> capped = store.snapshot();
    CHECK(capped->size() == 3 && (*capped)[0].id == "m4" && (*capped)[2].id == "m2");

    // Replace discards everything that came before
    SyncBatch replace = parseSyncPayload(json::parse(R"({"mode": "snapshot", "events": []})"),
                                         *normalizer, feedOptions());
    CHECK(store.apply(replace, &summary));
    CHECK(summary.mode == SyncBatch::Mode::REPLACE);
    CHECK(store.snapshot()->empty());
    CHECK(notifications == 5);
}

void runManualTagTest() {
    std::cout << "=== Running Manual Tag Test ===" << std::endl;

    auto normalizer = std::make_shared<EventNormalizer>(test_support::sampleWorld());
    EventStore store(normalizer, 600, 5);
    const int64_t now = test_support::kBaseMs;

    Event tag;
    CHECK(store.addManualTag(0.3, 0.8, EventStore::TagMode::NORM, "aisle-a", now, &tag));
    CHECK(StringUtils::startsWith(tag.id, "manual-tag-" + StringUtils::toBase36(static_cast<uint64_t>(now)) + "-"));
    CHECK(tag.id.size() == std::string("manual-tag-").size() + StringUtils::toBase36(now).size() + 7);
    CHECK(tag.x == 0.3 && tag.y == 0.8);
    CHECK(tag.zoneId == "aisle-a");
    CHECK(tag.severity == 2);
    CHECK_NEAR(tag.confidence, 0.99, 1e-12);
    CHECK(tag.source == EventSource::CAMERA);
    CHECK(tag.objectLabel == "tag");
    CHECK(tag.rawStatus == "manual_tag");
    CHECK(tag.storeId == "s042");
    CHECK(tag.detectedAt == now);

    // Percent input
    Event percent;
    CHECK(store.addManualTag(70, 60, EventStore::TagMode::NORM, "", now + 1, &percent));
    CHECK_NEAR(percent.x, 0.7, 1e-12);
    CHECK_NEAR(percent.y, 0.6, 1e-12);
    CHECK(percent.zoneId == "aisle-b");

    // Shelf position is snapped like any other event
    Event snapped;
    CHECK(store.addManualTag(0.25, 0.4, EventStore::TagMode::NORM, "aisle-a", now + 2, &snapped));
    CHECK(!(snapped.x == 0.25 && snapped.y == 0.4));

    // World meters go through the map/world transform
    Event world;
    CHECK(store.addManualTag(2.0, 8.0, EventStore::TagMode::WORLD, "aisle-a", now + 3, &world));
    CHECK_NEAR(world.x, 0.2, 1e-9);
    CHECK_NEAR(world.y, 0.8, 1e-9);
    CHECK(world.worldXMeters == 2.0 && world.worldZMeters == 8.0);

    CHECK(!store.addManualTag(150, 0.5, EventStore::TagMode::NORM, "aisle-a", now, nullptr));
    CHECK(!store.addManualTag(0.5, -1, EventStore::TagMode::NORM, "aisle-a", now, nullptr));

    // Regular events survive a clear
    SyncBatch regular = parseSyncPayload(json::array({record("keep", 0, 0.3, 0.8)}), *normalizer, feedOptions());
    CHECK(store.apply(regular));
    CHECK(store.snapshot()->size() == 5);

    CHECK(store.clearManualTags() == 4);
    CHECK(store.snapshot()->size() == 1);
    CHECK(hasId(*store.snapshot(), "keep"));
    CHECK(store.clearManualTags() == 0);
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    Logger::setLogLevel(Logger::Level::WARNING);

    try {
        runSyncPayloadTest();
        runStoreApplyTest();
        runManualTagTest();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return test_support::finish("event_store_test");
}
