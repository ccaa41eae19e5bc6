// floor_guard_session.cpp - Patrol session implementation

#include "floor_guard_session.h"
#include "floor_guard_utils.h"

#include <chrono>
#include <sstream>

namespace floor_guard {

using json = nlohmann::json;

namespace {

SimulatorOptions simulatorOptionsFrom(const RuntimeConfig& config) {
    SimulatorOptions options;
    options.robotCount = config.robotCount;
    options.tickMs = config.tickMs;
    options.liveWindowMs = config.liveWindowMs;
    options.seed = config.randomSeed;
    return options;
}

} // namespace

PatrolSession::PatrolSession(std::shared_ptr<const WorldConfig> world, const RuntimeConfig& config)
    : m_world(world),
      m_config(config),
      m_normalizer(std::make_shared<EventNormalizer>(world)),
      m_store(std::make_shared<EventStore>(m_normalizer, config.maxEvents, config.randomSeed)),
      m_simulator(world, simulatorOptionsFrom(config)),
      m_tickCount(0),
      m_running(false),
      m_stopped(false)
{
    m_simulator.initialize();
    Logger::info("PatrolSession", "Session ready for store " + m_world->storeId() + " with " +
                 std::to_string(m_world->zones().size()) + " zones");
}

PatrolSession::~PatrolSession() {
    stop();
}

void PatrolSession::start() {
    if (m_running || m_stopped) {
        return;
    }

    m_running = true;

    // Start background tick thread
    m_tickThread = std::thread(&PatrolSession::tickFunction, this);

    Logger::info("PatrolSession", "Session started, tick " + std::to_string(m_config.tickMs) + " ms");
}

void PatrolSession::stop() {
    {
        // Ingests already past the check finish first; later ones are discarded
        std::lock_guard<std::mutex> lock(m_ingestMutex);
        m_stopped = true;
    }
    {
        // A tick already inside the simulator completes; later ones see the flag
        std::lock_guard<std::mutex> lock(m_simMutex);
        m_stopped = true;
    }

    if (!m_running) {
        return;
    }

    m_running = false;

    // Stop tick thread
    if (m_tickThread.joinable()) {
        m_tickThread.join();
    }

    Logger::info("PatrolSession", "Session stopped after " + std::to_string(m_tickCount) + " ticks");
}

FeedOptions PatrolSession::feedOptions() const {
    FeedOptions options;
    options.fallbackStoreId = m_config.fallbackStoreId;
    options.defaultSource = m_config.defaultSource;
    options.maxEvents = m_config.maxEvents;
    return options;
}

bool PatrolSession::ingestText(const std::string& payloadText, SyncSummary* summary) {
    if (m_stopped) {
        Logger::debug("PatrolSession", "Ingest after stop discarded");
        return false;
    }
    // Decoding is pure; it runs before the store is touched
    SyncBatch batch = parseSyncPayloadText(payloadText, *m_normalizer, feedOptions());
    return applyBatch(batch, summary);
}

bool PatrolSession::ingest(const json& payload, SyncSummary* summary) {
    if (m_stopped) {
        Logger::debug("PatrolSession", "Ingest after stop discarded");
        return false;
    }
    SyncBatch batch = parseSyncPayload(payload, *m_normalizer, feedOptions());
    return applyBatch(batch, summary);
}

bool PatrolSession::applyBatch(const SyncBatch& batch, SyncSummary* summary) {
    SyncSummary result;
    {
        std::lock_guard<std::mutex> lock(m_ingestMutex);
        if (m_stopped) {
            Logger::debug("PatrolSession", "Batch decoded during stop discarded");
            return false;
        }
        if (!m_store->commit(batch, result)) {
            return false;
        }
    }

    // Store observers may ingest again, so they run without m_ingestMutex
    if (summary) {
        *summary = result;
    }
    m_store->notifyChange(result);
    return true;
}

void PatrolSession::tickOnce(int64_t nowMs) {
    if (m_stopped) {
        return;
    }
    std::shared_ptr<const std::vector<Event>> events = m_store->snapshot();

    std::vector<Agent> agents;
    TickListener listener;
    {
        std::lock_guard<std::mutex> lock(m_simMutex);
        if (m_stopped) {
            return;
        }
        m_simulator.tick(*events, nowMs);
        ++m_tickCount;

        if (m_tickListener) {
            agents = m_simulator.agents();
            listener = m_tickListener;
        }
    }

    // Called unlocked so the listener may query the session
    if (listener) {
        listener(agents, nowMs);
    }
}

void PatrolSession::setTickListener(TickListener listener) {
    std::lock_guard<std::mutex> lock(m_simMutex);
    m_tickListener = listener;
}

std::vector<Agent> PatrolSession::agents() const {
    std::lock_guard<std::mutex> lock(m_simMutex);
    return m_simulator.agents();
}

std::string PatrolSession::getStatusReport() const {
    std::ostringstream report;

    report << "Floor Guard Session Status\n";
    report << "==========================\n\n";

    report << "Time: " << TimeUtils::formatTimestampMs(TimeUtils::nowMs()) << "\n";
    report << "Store: " << m_world->storeId() << "\n";
    report << "State: " << (m_running ? "running" : (m_stopped ? "stopped" : "idle")) << "\n\n";

    std::shared_ptr<const std::vector<Event>> events = m_store->snapshot();
    int64_t now = TimeUtils::nowMs();
    size_t live = 0;
    for (const auto& event : *events) {
        if (FleetSimulator::isReactiveEvent(event, now, m_config.liveWindowMs)) {
            ++live;
        }
    }
    report << "Events: " << events->size() << " (" << live << " live incidents)\n\n";

    report << "Agents:\n";
    {
        std::lock_guard<std::mutex> lock(m_simMutex);
        for (const auto& agent : m_simulator.agents()) {
            report << "- " << agent.label << " [" << agentModeToString(agent.mode) << "] zone "
                   << agent.zoneId;
            if (!agent.assignedEventId.empty()) {
                report << " -> " << agent.assignedEventId;
            }
            report << "\n";
        }
        report << "\nTicks: " << m_tickCount << "\n";
    }

    return report.str();
}

void PatrolSession::tickFunction() {
    const auto interval = std::chrono::milliseconds(m_config.tickMs);
    while (m_running) {
        auto started = std::chrono::steady_clock::now();
        tickOnce(TimeUtils::nowMs());
        std::this_thread::sleep_until(started + interval);
    }
}

} // namespace floor_guard
