// floor_guard_simulator.cpp
#include "floor_guard_simulator.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace floor_guard {

using json = nlohmann::json;

const double FleetSimulator::kReactionRadius = 0.22;
const double FleetSimulator::kSeverityWeight = 0.03;
const double FleetSimulator::kResponseSpeedFactor = 1.16;
const double FleetSimulator::kResponseSpeedMin = 0.03;
const double FleetSimulator::kArrivalTolerance = 0.003;
const double FleetSimulator::kDetourDistance = 0.08;
const double FleetSimulator::kDetourHeading = 0.92;
const double FleetSimulator::kZoneChangeProbability = 0.3;
const double FleetSimulator::kStuckDisplacement = 0.0006;
const int FleetSimulator::kStuckTicks = 18;

namespace {

// Straight first, then alternating offsets of growing magnitude
const double kSteerOffsets[] = {0.0, 0.32, -0.32, 0.64, -0.64, 0.96, -0.96, 1.26, -1.26};

double distanceBetween(const cv::Point2d& a, const cv::Point2d& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

double headingTowards(const cv::Point2d& from, const cv::Point2d& to) {
    return std::atan2(to.y - from.y, to.x - from.x);
}

std::string formatPoint(const cv::Point2d& p) {
    return "(" + StringUtils::formatDouble(p.x, 4) + ", " + StringUtils::formatDouble(p.y, 4) + ")";
}

} // namespace

std::string agentModeToString(AgentMode mode) {
    switch (mode) {
        case AgentMode::PATROL: return "patrol";
        case AgentMode::RESPONDING: return "responding";
        default: return "patrol";
    }
}

json Agent::toJson() const {
    json j;
    j["id"] = id;
    j["label"] = label;
    j["zone_id"] = zoneId;
    j["x"] = position.x;
    j["y"] = position.y;
    j["target_x"] = target.x;
    j["target_y"] = target.y;
    j["heading_rad"] = headingRad;
    j["speed"] = speed;
    j["mode"] = agentModeToString(mode);
    if (!assignedEventId.empty()) {
        j["assigned_event_id"] = assignedEventId;
    }
    j["stuck_ticks"] = stuckTicks;
    return j;
}

json agentsToJson(const std::vector<Agent>& agents) {
    json array = json::array();
    for (const auto& agent : agents) {
        array.push_back(agent.toJson());
    }
    return array;
}

FleetSimulator::FleetSimulator(std::shared_ptr<const WorldConfig> world, const SimulatorOptions& options)
    : m_world(world),
      m_resolver(world),
      m_options(options),
      m_rng(options.seed != 0 ? options.seed : std::random_device{}())
{
    if (!m_world || m_world->zones().empty()) {
        throw std::invalid_argument("FleetSimulator requires a world with at least one zone");
    }
    m_options.robotCount = std::max(0, m_options.robotCount);
    m_options.tickMs = std::max(1, m_options.tickMs);
}

void FleetSimulator::initialize() {
    m_agents.clear();
    m_agents.reserve(m_options.robotCount);

    for (int i = 0; i < m_options.robotCount; ++i) {
        const ZoneGeometry& zone = randomZone();
        Agent agent;
        agent.id = "robot-" + std::to_string(i + 1);
        agent.label = "R" + std::to_string(i + 1);
        agent.zoneId = zone.zoneId;
        agent.position = samplePatrolPoint(zone);
        agent.target = samplePatrolPoint(zone);
        agent.headingRad = headingTowards(agent.position, agent.target);
        agent.baseSpeed = 0.026 + uniform() * 0.012;
        agent.speed = agent.baseSpeed;
        m_agents.push_back(agent);
    }

    Logger::info("FleetSimulator", "Initialized " + std::to_string(m_agents.size()) + " agents");
}

void FleetSimulator::resetAgents(std::vector<Agent> agents) {
    m_agents = std::move(agents);
}

bool FleetSimulator::isReactiveEvent(const Event& event, int64_t nowMs, int64_t liveWindowMs) {
    if (event.severity < 2 || event.incidentStatus == IncidentStatus::RESOLVED) {
        return false;
    }
    return nowMs - event.detectedAt <= liveWindowMs;
}

void FleetSimulator::tick(const std::vector<Event>& events, int64_t nowMs) {
    TIME_SCOPE("FleetSimulator::tick");

    std::vector<ReactiveEvent> reactive = collectReactiveEvents(events, nowMs);
    for (auto& agent : m_agents) {
        stepAgent(agent, reactive);
    }
}

std::vector<FleetSimulator::ReactiveEvent> FleetSimulator::collectReactiveEvents(
    const std::vector<Event>& events, int64_t nowMs) const {
    std::vector<ReactiveEvent> reactive;
    for (const auto& event : events) {
        if (!isReactiveEvent(event, nowMs, m_options.liveWindowMs)) {
            continue;
        }
        ReactiveEvent item;
        item.id = event.id;
        item.zoneId = event.zoneId;
        item.severity = event.severity;
        item.point = m_resolver.projectToWalkableTarget(event.x, event.y, event.zoneId);
        reactive.push_back(item);
    }
    return reactive;
}

const FleetSimulator::ReactiveEvent* FleetSimulator::pickResponse(
    const Agent& agent, const std::vector<ReactiveEvent>& reactive) const {
    // Keep the current assignment while it still qualifies
    if (!agent.assignedEventId.empty()) {
        for (const auto& item : reactive) {
            if (item.id == agent.assignedEventId) {
                if (distanceBetween(agent.position, item.point) <= kReactionRadius) {
                    return &item;
                }
                break;
            }
        }
    }

    const ReactiveEvent* best = nullptr;
    double bestScore = std::numeric_limits<double>::infinity();
    for (const auto& item : reactive) {
        double distance = distanceBetween(agent.position, item.point);
        if (distance > kReactionRadius) {
            continue;
        }
        double score = distance - item.severity * kSeverityWeight;
        if (score < bestScore) {
            best = &item;
            bestScore = score;
        }
    }
    return best;
}

void FleetSimulator::stepAgent(Agent& agent, const std::vector<ReactiveEvent>& reactive) {
    const ZoneGeometry& currentZone = zoneOrRandom(agent.zoneId);
    const cv::Point2d previousTarget = agent.target;

    const ReactiveEvent* response = pickResponse(agent, reactive);
    if (response) {
        if (agent.mode != AgentMode::RESPONDING || agent.assignedEventId != response->id) {
            Logger::debug("FleetSimulator", agent.id + " responding to " + response->id);
        }
        agent.zoneId = response->zoneId;
        agent.target = response->point;
        agent.speed = std::max(agent.baseSpeed * kResponseSpeedFactor, kResponseSpeedMin);
        agent.mode = AgentMode::RESPONDING;
        agent.assignedEventId = response->id;
    } else if (agent.mode == AgentMode::RESPONDING) {
        Logger::debug("FleetSimulator", agent.id + " lost " + agent.assignedEventId + ", back to patrol");
        beginPatrol(agent, zoneOrRandom(agent.zoneId));
    }

    if (agent.target != previousTarget) {
        agent.bestTargetDistance = -1.0;
    }

    const double distance = distanceBetween(agent.position, agent.target);
    const double step = agent.speed * (m_options.tickMs / 1000.0);

    // Arrival
    if (distance <= std::max(step, kArrivalTolerance)) {
        agent.position = agent.target;
        if (agent.mode == AgentMode::RESPONDING) {
            Logger::debug("FleetSimulator", agent.id + " reached " + agent.assignedEventId);
            beginPatrol(agent, zoneOrRandom(agent.zoneId));
        } else {
            const ZoneGeometry& nextZone = uniform() < kZoneChangeProbability ? randomZone() : currentZone;
            agent.zoneId = nextZone.zoneId;
            agent.target = samplePatrolPoint(nextZone);
            agent.bestTargetDistance = -1.0;
            agent.stuckTicks = 0;
        }
        agent.headingRad = headingTowards(agent.position, agent.target);
        return;
    }

    cv::Point2d next;
    double heading = 0.0;
    if (!steer(agent, step, next, heading)) {
        double detourHeading = agent.headingRad + (uniform() < 0.5 ? kDetourHeading : -kDetourHeading);
        double detourX = clamp01(agent.position.x + std::cos(detourHeading) * kDetourDistance);
        double detourY = clamp01(agent.position.y + std::sin(detourHeading) * kDetourDistance);
        cv::Point2d detour = m_resolver.projectToWalkableTarget(detourX, detourY, agent.zoneId);

        if (!m_resolver.isBlockedPoint(detour.x, detour.y)) {
            agent.target = detour;
            agent.headingRad = detourHeading;
            agent.bestTargetDistance = -1.0;
            agent.stuckTicks += 1;
            Logger::debug("FleetSimulator", agent.id + " detour to " + formatPoint(detour));
            if (agent.stuckTicks >= kStuckTicks) {
                rescue(agent, zoneOrRandom(agent.zoneId));
            }
            return;
        }

        // Nowhere to go: teleport onto fresh floor and resume patrol
        const ZoneGeometry& fallbackZone = zoneOrRandom(agent.zoneId);
        cv::Point2d fallback = samplePatrolPoint(fallbackZone);
        Logger::debug("FleetSimulator", agent.id + " teleported to " + formatPoint(fallback));
        agent.zoneId = fallbackZone.zoneId;
        agent.position = fallback;
        agent.target = fallback;
        agent.speed = agent.baseSpeed;
        agent.mode = AgentMode::PATROL;
        agent.assignedEventId.clear();
        agent.headingRad = detourHeading;
        agent.bestTargetDistance = -1.0;
        agent.stuckTicks = 0;
        return;
    }

    // A tick counts as stuck when the agent barely moves or gets no closer
    // than it has already been to this target
    const double moved = distanceBetween(agent.position, next);
    const double remaining = distanceBetween(next, agent.target);
    const double baseline = agent.bestTargetDistance < 0.0 ? distance : agent.bestTargetDistance;
    const bool stuck = moved < kStuckDisplacement || remaining >= baseline;

    agent.stuckTicks = stuck ? agent.stuckTicks + 1 : 0;
    if (agent.stuckTicks >= kStuckTicks) {
        rescue(agent, zoneOrRandom(agent.zoneId));
        return;
    }

    agent.position = next;
    agent.headingRad = heading;
    agent.bestTargetDistance = std::min(baseline, remaining);
}

bool FleetSimulator::steer(const Agent& agent, double step, cv::Point2d& next, double& heading) const {
    const double baseHeading = headingTowards(agent.position, agent.target);
    for (double offset : kSteerOffsets) {
        double candidateHeading = baseHeading + offset;
        double x = agent.position.x + std::cos(candidateHeading) * step;
        double y = agent.position.y + std::sin(candidateHeading) * step;
        if (!m_resolver.isBlockedPoint(x, y)) {
            next = cv::Point2d(x, y);
            heading = candidateHeading;
            return true;
        }
    }
    return false;
}

void FleetSimulator::beginPatrol(Agent& agent, const ZoneGeometry& zone) {
    agent.zoneId = zone.zoneId;
    agent.target = samplePatrolPoint(zone);
    agent.speed = agent.baseSpeed;
    agent.mode = AgentMode::PATROL;
    agent.assignedEventId.clear();
    agent.bestTargetDistance = -1.0;
    agent.stuckTicks = 0;
}

void FleetSimulator::rescue(Agent& agent, const ZoneGeometry& zone) {
    Logger::debug("FleetSimulator", agent.id + " stuck for " + std::to_string(agent.stuckTicks) +
                  " ticks, rescued to patrol");
    beginPatrol(agent, zone);
}

const ZoneGeometry& FleetSimulator::zoneOrRandom(const std::string& zoneId) {
    const ZoneGeometry* zone = m_world->findZone(zoneId);
    return zone ? *zone : randomZone();
}

const ZoneGeometry& FleetSimulator::randomZone() {
    const auto& zones = m_world->zones();
    std::uniform_int_distribution<size_t> pick(0, zones.size() - 1);
    return zones[pick(m_rng)];
}

cv::Point2d FleetSimulator::samplePatrolPoint(const ZoneGeometry& zone) {
    cv::Point2d raw = samplePointInZone(zone, m_rng);
    return m_resolver.projectToWalkableTarget(raw.x, raw.y, zone.zoneId);
}

double FleetSimulator::uniform() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_rng);
}

} // namespace floor_guard
