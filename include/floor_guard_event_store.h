// floor_guard_event_store.h
#pragma once

#include "floor_guard_event.h"
#include "floor_guard_normalizer.h"

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <mutex>
#include <random>
#include <nlohmann/json.hpp>

namespace floor_guard {

/**
 * One synchronization step decoded from an external payload.
 */
struct SyncBatch {
    enum class Mode {
        MERGE,      // Upsert into the current set
        REPLACE     // Discard the current set first
    };

    Mode mode = Mode::MERGE;
    std::vector<Event> upserts;
    std::vector<std::string> removals;    // Applied after upserts

    // Merge with nothing to upsert or remove
    bool isNoop() const { return mode == Mode::MERGE && upserts.empty() && removals.empty(); }
};

std::string syncModeToString(SyncBatch::Mode mode);

/**
 * Decode a synchronization payload: a bare record array, an envelope object
 * with a mode, a record array and removal lists, or a single record.
 * Never throws; unusable payloads yield an empty merge batch.
 */
SyncBatch parseSyncPayload(const nlohmann::json& payload, const EventNormalizer& normalizer,
                           const FeedOptions& options);

// JSON text variant; text that is not JSON yields an empty merge batch
SyncBatch parseSyncPayloadText(const std::string& payloadText, const EventNormalizer& normalizer,
                               const FeedOptions& options);

/**
 * Result of applying a batch to the store.
 */
struct SyncSummary {
    SyncBatch::Mode mode = SyncBatch::Mode::MERGE;
    size_t upserted = 0;        // Inserted or replaced by a newer record
    size_t removed = 0;
    size_t total = 0;           // Events in the new snapshot
};

/**
 * Canonical event set. Readers take an immutable snapshot; writers build the
 * next set off to the side and publish it with a single pointer swap.
 */
class EventStore {
public:
    enum class TagMode {
        WORLD,      // x/z in meters
        NORM        // Normalized 0..1 or percentage 0..100
    };

    using ChangeCallback = std::function<void(const SyncSummary&)>;

    EventStore(std::shared_ptr<const EventNormalizer> normalizer, int maxEvents, uint32_t randomSeed = 0);

    // Apply a batch. Returns false (nothing published) for a no-op batch.
    bool apply(const SyncBatch& batch, SyncSummary* summary = nullptr);

    // First half of apply(): publish the next set without notifying, so a
    // caller holding its own lock can notify after releasing it
    bool commit(const SyncBatch& batch, SyncSummary& summary);

    // Run the change callback, outside any store lock
    void notifyChange(const SyncSummary& summary);

    std::shared_ptr<const std::vector<Event>> snapshot() const;

    void setChangeCallback(ChangeCallback callback);

    /**
     * Add an operator-placed tag at (x, y) in `zoneId`. The tag goes through
     * the normalizer like any record, so its position is snapped to walkable
     * floor. Returns false for out-of-range normalized input or a failed
     * normalization.
     */
    bool addManualTag(double x, double y, TagMode mode, const std::string& zoneId, int64_t nowMs,
                      Event* created = nullptr);

    // Remove every manual tag; returns how many were removed
    size_t clearManualTags();

    int maxEvents() const { return m_maxEvents; }

    static const char* const kManualTagPrefix;

private:
    std::shared_ptr<const EventNormalizer> m_normalizer;
    int m_maxEvents;

    mutable std::mutex m_mutex;             // Guards m_events, m_callback, m_rng
    std::shared_ptr<const std::vector<Event>> m_events;
    ChangeCallback m_callback;
    std::mt19937 m_rng;

    std::string makeTagId(int64_t nowMs);
};

} // namespace floor_guard
