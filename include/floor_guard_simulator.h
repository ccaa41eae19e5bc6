// floor_guard_simulator.h
#pragma once

#include "floor_guard_event.h"
#include "floor_guard_walkability.h"
#include "floor_guard_world.h"

#include <string>
#include <vector>
#include <memory>
#include <random>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

namespace floor_guard {

enum class AgentMode {
    PATROL,
    RESPONDING
};

std::string agentModeToString(AgentMode mode);

/**
 * One simulated patrol robot. Positions are map-normalized.
 */
struct Agent {
    std::string id;                 // "robot-N"
    std::string label;              // "RN"
    std::string zoneId;
    cv::Point2d position;
    cv::Point2d target;
    double headingRad = 0.0;
    double speed = 0.0;             // Normalized units per second
    double baseSpeed = 0.0;
    AgentMode mode = AgentMode::PATROL;
    std::string assignedEventId;    // Empty while patrolling
    int stuckTicks = 0;

    // Closest approach to the current target; negative until the first move
    double bestTargetDistance = -1.0;

    nlohmann::json toJson() const;
};

nlohmann::json agentsToJson(const std::vector<Agent>& agents);

struct SimulatorOptions {
    int robotCount = 4;
    int tickMs = 80;
    int64_t liveWindowMs = 600000;
    uint32_t seed = 0;              // 0 = seed from the clock
};

/**
 * Tick-driven patrol fleet. Each tick reads one event snapshot, retargets
 * agents toward nearby live incidents and advances them around obstacles.
 *
 * A tick counts toward the stuck threshold when the agent moves less than
 * kStuckDisplacement, and also when it ends no closer to its current target
 * than the best distance it reached since that target was set. The second
 * test catches agents sliding back and forth along a wall; detour ticks
 * count too. kStuckTicks in a row trigger a rescue to patrol.
 *
 * Not thread-safe; the owner serializes calls.
 */
class FleetSimulator {
public:
    static const double kReactionRadius;
    static const double kSeverityWeight;
    static const double kResponseSpeedFactor;
    static const double kResponseSpeedMin;
    static const double kArrivalTolerance;
    static const double kDetourDistance;
    static const double kDetourHeading;
    static const double kZoneChangeProbability;
    static const double kStuckDisplacement;
    static const int kStuckTicks;

    FleetSimulator(std::shared_ptr<const WorldConfig> world, const SimulatorOptions& options);

    // Place robotCount agents at walkable points of random zones
    void initialize();

    // Advance every agent by one tick against `events` at time `nowMs`
    void tick(const std::vector<Event>& events, int64_t nowMs);

    const std::vector<Agent>& agents() const { return m_agents; }

    // Replace the fleet, e.g. to restore or stage a scenario
    void resetAgents(std::vector<Agent> agents);

    const SimulatorOptions& options() const { return m_options; }

    // Live and worth reacting to: severity >= 2, not resolved, detected
    // within the live window
    static bool isReactiveEvent(const Event& event, int64_t nowMs, int64_t liveWindowMs);

private:
    struct ReactiveEvent {
        std::string id;
        std::string zoneId;
        int severity;
        cv::Point2d point;          // Projected onto agent-walkable floor
    };

    std::vector<ReactiveEvent> collectReactiveEvents(const std::vector<Event>& events, int64_t nowMs) const;
    const ReactiveEvent* pickResponse(const Agent& agent, const std::vector<ReactiveEvent>& reactive) const;

    void stepAgent(Agent& agent, const std::vector<ReactiveEvent>& reactive);
    bool steer(const Agent& agent, double step, cv::Point2d& next, double& heading) const;

    void beginPatrol(Agent& agent, const ZoneGeometry& zone);
    void rescue(Agent& agent, const ZoneGeometry& zone);

    const ZoneGeometry& zoneOrRandom(const std::string& zoneId);
    const ZoneGeometry& randomZone();
    cv::Point2d samplePatrolPoint(const ZoneGeometry& zone);
    double uniform();

    std::shared_ptr<const WorldConfig> m_world;
    WalkabilityResolver m_resolver;
    SimulatorOptions m_options;
    std::mt19937 m_rng;
    std::vector<Agent> m_agents;
};

} // namespace floor_guard
