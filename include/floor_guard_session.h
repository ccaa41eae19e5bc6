// floor_guard_session.h - Patrol session wiring feed, store and fleet

#pragma once

#include "floor_guard_config.h"
#include "floor_guard_event_store.h"
#include "floor_guard_normalizer.h"
#include "floor_guard_simulator.h"
#include "floor_guard_world.h"

#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>
#include <nlohmann/json.hpp>

namespace floor_guard {

/**
 * Owns one site's running state: the event store fed by sync payloads and
 * the patrol fleet ticking against it. After stop() no tick or ingest
 * mutates state.
 */
class PatrolSession {
public:
    using TickListener = std::function<void(const std::vector<Agent>& agents, int64_t nowMs)>;

    PatrolSession(std::shared_ptr<const WorldConfig> world, const RuntimeConfig& config);
    ~PatrolSession();

    // Start/stop the background tick loop
    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Decode and apply a sync payload. Returns false when nothing was applied
    // or the session has been stopped.
    bool ingestText(const std::string& payloadText, SyncSummary* summary = nullptr);
    bool ingest(const nlohmann::json& payload, SyncSummary* summary = nullptr);

    // One simulator tick against the current event snapshot
    void tickOnce(int64_t nowMs);

    void setTickListener(TickListener listener);

    std::vector<Agent> agents() const;
    std::shared_ptr<const std::vector<Event>> events() const { return m_store->snapshot(); }

    EventStore& store() { return *m_store; }
    const EventNormalizer& normalizer() const { return *m_normalizer; }
    const RuntimeConfig& config() const { return m_config; }

    // Human-readable status report
    std::string getStatusReport() const;

private:
    FeedOptions feedOptions() const;
    bool applyBatch(const SyncBatch& batch, SyncSummary* summary);
    void tickFunction();

    std::shared_ptr<const WorldConfig> m_world;
    RuntimeConfig m_config;
    std::shared_ptr<const EventNormalizer> m_normalizer;
    std::shared_ptr<EventStore> m_store;

    mutable std::mutex m_simMutex;      // Guards m_simulator, m_tickListener
    FleetSimulator m_simulator;
    TickListener m_tickListener;
    int64_t m_tickCount;

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopped;
    std::mutex m_ingestMutex;           // Orders ingest against stop()
    std::thread m_tickThread;
};

} // namespace floor_guard
