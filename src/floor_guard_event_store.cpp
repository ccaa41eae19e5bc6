// floor_guard_event_store.cpp
#include "floor_guard_event_store.h"
#include "floor_guard_fields.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace floor_guard {

using json = nlohmann::json;

const char* const EventStore::kManualTagPrefix = "manual-tag";

namespace {

const std::vector<std::string>& syncModePaths() {
    static const std::vector<std::string> paths = {
        "sync_mode", "syncMode", "sync.mode", "sync.strategy", "payload.sync_mode", "payload.sync.mode",
        "meta.sync_mode", "meta.sync.mode", "payload.mode", "mode", "snapshot", "full_sync", "fullSync"
    };
    return paths;
}

const std::vector<std::string>& recordArrayPaths() {
    static const std::vector<std::string> paths = {
        "events", "data", "records", "results", "items", "alerts", "payload.events", "payload.records",
        "payload.items", "payload.alerts", "message.events", "message.items", "sync.events",
        "payload.sync.events"
    };
    return paths;
}

const std::vector<std::string>& singleRecordPaths() {
    static const std::vector<std::string> paths = {
        "event", "alert", "payload.event", "payload.alert", "payload.data", "message.event"
    };
    return paths;
}

const std::vector<std::string>& operationPaths() {
    static const std::vector<std::string> paths = {
        "op", "operation", "event_op", "event_operation", "sync.op", "sync.operation"
    };
    return paths;
}

// Id lists first, then the shorter deleted/removed aliases
const std::vector<std::string>& removalListPaths() {
    static const std::vector<std::string> paths = {
        "deleted_ids", "removed_ids", "delete_ids", "remove_ids",
        "payload.deleted_ids", "payload.removed_ids", "payload.delete_ids", "payload.remove_ids",
        "sync.deleted_ids", "sync.removed_ids", "payload.sync.deleted_ids", "payload.sync.removed_ids",
        "deleted", "removed", "payload.deleted", "payload.removed",
        "sync.deleted", "sync.removed", "payload.sync.deleted", "payload.sync.removed"
    };
    return paths;
}

bool parseSyncMode(const json* value, SyncBatch::Mode& mode) {
    if (!value) {
        return false;
    }
    if (value->is_boolean()) {
        mode = value->get<bool>() ? SyncBatch::Mode::REPLACE : SyncBatch::Mode::MERGE;
        return true;
    }
    std::string text;
    if (!fields::parseText(value, text)) {
        return false;
    }
    text = StringUtils::toLower(text);
    if (StringUtils::contains(text, "replace") || StringUtils::contains(text, "snapshot") ||
        StringUtils::contains(text, "full")) {
        mode = SyncBatch::Mode::REPLACE;
        return true;
    }
    if (StringUtils::contains(text, "merge") || StringUtils::contains(text, "upsert") ||
        StringUtils::contains(text, "delta")) {
        mode = SyncBatch::Mode::MERGE;
        return true;
    }
    return false;
}

bool isRemoveOperation(const json& record) {
    std::string op;
    if (!fields::parseText(fields::pickValue(record, operationPaths()), op)) {
        return false;
    }
    static const std::set<std::string> removeOps = {
        "delete", "deleted", "remove", "removed", "clear", "cleared"
    };
    return removeOps.count(StringUtils::toLower(op)) > 0;
}

// Explicit id (also nested under "payload"), else the camera/track id
bool recordEventId(const json& record, std::string& id) {
    static const std::vector<std::string> nestedIdPaths = {
        "payload.id", "payload.event_id", "payload.eventId"
    };
    if (fields::parseId(fields::pickField(record, fields::Field::EventId), id) ||
        fields::parseId(fields::pickValue(record, nestedIdPaths), id)) {
        return true;
    }
    std::string cameraId, trackId;
    if (!fields::parseId(fields::pickField(record, fields::Field::TrackId), trackId)) {
        return false;
    }
    if (!fields::parseId(fields::pickField(record, fields::Field::CameraId), cameraId)) {
        cameraId = "cam-unknown";
    }
    id = cameraId + ":track-" + trackId;
    return true;
}

void appendUnique(std::vector<std::string>& ids, const std::string& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

void collectIdList(const json* value, std::vector<std::string>& ids) {
    if (!value || !value->is_array()) {
        return;
    }
    for (const auto& item : *value) {
        std::string id;
        if (item.is_string() || item.is_number()) {
            if (fields::parseId(&item, id)) {
                appendUnique(ids, id);
            }
        } else if (item.is_object() && recordEventId(item, id)) {
            appendUnique(ids, id);
        }
    }
}

std::vector<std::string> collectRootRemovals(const json& envelope) {
    std::vector<std::string> ids;
    for (const auto& path : removalListPaths()) {
        collectIdList(fields::readPath(envelope, path), ids);
    }
    std::string id;
    if (isRemoveOperation(envelope) && recordEventId(envelope, id)) {
        appendUnique(ids, id);
    }
    return ids;
}

// Splits delete-marked rows from upserts and normalizes the upserts
void collectRecords(const json& rows, const EventNormalizer& normalizer, const FeedOptions& options,
                    SyncBatch& batch) {
    json upsertCandidates = json::array();
    for (const auto& row : rows) {
        if (row.is_object() && isRemoveOperation(row)) {
            std::string id;
            if (recordEventId(row, id)) {
                appendUnique(batch.removals, id);
            }
            continue;
        }
        upsertCandidates.push_back(row);
    }
    if (!upsertCandidates.empty()) {
        batch.upserts = normalizer.normalizeEventFeed(upsertCandidates, options);
    }
}

} // namespace

std::string syncModeToString(SyncBatch::Mode mode) {
    return mode == SyncBatch::Mode::REPLACE ? "replace" : "merge";
}

SyncBatch parseSyncPayload(const json& payload, const EventNormalizer& normalizer, const FeedOptions& options) {
    SyncBatch batch;

    if (payload.is_array()) {
        collectRecords(payload, normalizer, options, batch);
        return batch;
    }
    if (!payload.is_object()) {
        return batch;
    }

    SyncBatch::Mode mode = SyncBatch::Mode::MERGE;
    if (parseSyncMode(fields::pickValue(payload, syncModePaths()), mode)) {
        batch.mode = mode;
    }
    batch.removals = collectRootRemovals(payload);

    const json* records = fields::pickValue(payload, recordArrayPaths());
    if (records && records->is_array()) {
        collectRecords(*records, normalizer, options, batch);
        return batch;
    }

    const json* single = fields::pickValue(payload, singleRecordPaths());
    const json& record = single ? *single : payload;
    if (record.is_object() && isRemoveOperation(record)) {
        std::string id;
        if (recordEventId(record, id)) {
            appendUnique(batch.removals, id);
        }
        return batch;
    }

    Event event;
    if (normalizer.adaptRawEvent(record, options, event)) {
        batch.upserts.push_back(std::move(event));
    }
    return batch;
}

SyncBatch parseSyncPayloadText(const std::string& payloadText, const EventNormalizer& normalizer,
                               const FeedOptions& options) {
    const std::string trimmed = StringUtils::trim(payloadText);
    if (trimmed.empty()) {
        return SyncBatch();
    }

    json payload;
    try {
        payload = json::parse(trimmed);
    } catch (const json::parse_error& e) {
        Logger::warning("EventStore", std::string("Ignoring payload that is not JSON: ") + e.what());
        return SyncBatch();
    }
    return parseSyncPayload(payload, normalizer, options);
}

EventStore::EventStore(std::shared_ptr<const EventNormalizer> normalizer, int maxEvents, uint32_t randomSeed)
    : m_normalizer(std::move(normalizer)),
      m_maxEvents(EventNormalizer::clampMaxEvents(maxEvents)),
      m_events(std::make_shared<const std::vector<Event>>()),
      m_rng(randomSeed != 0 ? randomSeed : std::random_device{}())
{
}

std::shared_ptr<const std::vector<Event>> EventStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events;
}

void EventStore::setChangeCallback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

bool EventStore::apply(const SyncBatch& batch, SyncSummary* summary) {
    SyncSummary result;
    if (!commit(batch, result)) {
        return false;
    }
    if (summary) {
        *summary = result;
    }
    notifyChange(result);
    return true;
}

void EventStore::notifyChange(const SyncSummary& summary) {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callback = m_callback;
    }
    if (callback) {
        callback(summary);
    }
}

bool EventStore::commit(const SyncBatch& batch, SyncSummary& result) {
    if (batch.isNoop()) {
        return false;
    }

    result = SyncSummary();
    result.mode = batch.mode;

    std::unique_lock<std::mutex> lock(m_mutex);

    std::vector<Event> next;
    if (batch.mode == SyncBatch::Mode::MERGE) {
        next = *m_events;
    }

    std::map<std::string, size_t> indexById;
    for (size_t i = 0; i < next.size(); ++i) {
        indexById[next[i].id] = i;
    }

    for (const auto& event : batch.upserts) {
        auto it = indexById.find(event.id);
        if (it == indexById.end()) {
            indexById[event.id] = next.size();
            next.push_back(event);
            result.upserted++;
        } else if (isNewerEvent(event, next[it->second])) {
            next[it->second] = event;
            result.upserted++;
        }
    }

    if (!batch.removals.empty()) {
        std::set<std::string> removeSet(batch.removals.begin(), batch.removals.end());
        size_t before = next.size();
        next.erase(std::remove_if(next.begin(), next.end(),
                                  [&removeSet](const Event& event) { return removeSet.count(event.id) > 0; }),
                   next.end());
        result.removed = before - next.size();
    }

    sortEventFeed(next);
    if (next.size() > static_cast<size_t>(m_maxEvents)) {
        next.resize(static_cast<size_t>(m_maxEvents));
    }
    result.total = next.size();

    m_events = std::make_shared<const std::vector<Event>>(std::move(next));
    lock.unlock();

    Logger::info("EventStore", "Applied " + syncModeToString(result.mode) + " batch: upsert " +
                 std::to_string(result.upserted) + ", remove " + std::to_string(result.removed) +
                 ", total " + std::to_string(result.total));
    return true;
}

std::string EventStore::makeTagId(int64_t nowMs) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> pick(0, 35);

    std::string suffix;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (int i = 0; i < 6; ++i) {
            suffix.push_back(digits[pick(m_rng)]);
        }
    }
    return std::string(kManualTagPrefix) + "-" + StringUtils::toBase36(static_cast<uint64_t>(nowMs)) + "-" + suffix;
}

bool EventStore::addManualTag(double x, double y, TagMode mode, const std::string& zoneId, int64_t nowMs,
                              Event* created) {
    const WorldConfig& world = m_normalizer->world();
    const WorldFrame& frame = world.worldFrame();

    double normX = 0.0, normY = 0.0;
    double worldX = 0.0, worldZ = 0.0;
    std::string note;

    if (mode == TagMode::WORLD) {
        worldX = x;
        worldZ = y;
        cv::Point2d worldNorm = worldMetersToWorldNorm(frame, worldX, worldZ);
        cv::Point2d mapNorm = world.transform().worldNormToMapNorm(worldNorm.x, worldNorm.y);
        normX = clamp01(mapNorm.x);
        normY = clamp01(mapNorm.y);
        note = "manual world (" + StringUtils::formatDouble(worldX, 2) + ", " +
               StringUtils::formatDouble(worldZ, 2) + ")";
    } else {
        auto toNorm = [](double value, double& norm) {
            if (value >= 0.0 && value <= 1.0) {
                norm = value;
                return true;
            }
            if (value >= 0.0 && value <= 100.0) {
                norm = value / 100.0;
                return true;
            }
            return false;
        };
        if (!toNorm(x, normX) || !toNorm(y, normY)) {
            Logger::warning("EventStore", "Manual tag coordinates must be within 0..1 or 0..100");
            return false;
        }
        cv::Point2d meters = world.mapNormToWorldMeters(normX, normY);
        worldX = meters.x;
        worldZ = meters.y;
        note = "manual norm (" + StringUtils::formatDouble(normX, 3) + ", " +
               StringUtils::formatDouble(normY, 3) + ")";
    }

    const std::string tagId = makeTagId(nowMs);

    json payload;
    payload["eventId"] = tagId;
    payload["timestamp"] = nowMs;
    payload["eventType"] = "unknown";
    payload["severity"] = 2;
    payload["confidence"] = 0.99;
    payload["zone_id"] = zoneId;
    payload["source"] = "camera";
    payload["label"] = "manual-tag";
    payload["status"] = "manual_tag";
    payload["x_norm"] = normX;
    payload["y_norm"] = normY;
    payload["world"] = {{"x", worldX}, {"z", worldZ}};
    payload["note"] = note;

    NormalizeOptions options;
    options.fallbackStoreId = world.storeId();
    options.defaultSource = EventSource::CAMERA;
    options.nowMs = nowMs;

    Event event;
    if (!m_normalizer->adaptRawEvent(payload, options, event)) {
        Logger::warning("EventStore", "Manual tag could not be normalized");
        return false;
    }
    event.id = tagId;
    if (!zoneId.empty()) {
        event.zoneId = zoneId;
    }
    event.objectLabel = "tag";
    event.rawStatus = "manual_tag";
    if (mode == TagMode::WORLD) {
        event.worldXMeters = worldX;
        event.worldZMeters = worldZ;
    }

    SyncBatch batch;
    batch.upserts.push_back(event);
    apply(batch);

    Logger::info("EventStore", "Added manual tag " + tagId + " at (" + StringUtils::formatDouble(event.x, 3) +
                 ", " + StringUtils::formatDouble(event.y, 3) + ") in zone " + event.zoneId);
    if (created) {
        *created = event;
    }
    return true;
}

size_t EventStore::clearManualTags() {
    SyncBatch batch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& event : *m_events) {
            if (StringUtils::startsWith(event.id, kManualTagPrefix)) {
                batch.removals.push_back(event.id);
            }
        }
    }
    if (batch.removals.empty()) {
        return 0;
    }

    SyncSummary summary;
    apply(batch, &summary);
    return summary.removed;
}

} // namespace floor_guard
