// floor_guard_main.cpp - Command line driver for a patrol session

#include "floor_guard_config.h"
#include "floor_guard_session.h"
#include "floor_guard_utils.h"
#include "floor_guard_walkability.h"
#include "floor_guard_world.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

using namespace floor_guard;

namespace {

struct CommandLine {
    std::string zonesPath;
    std::string camerasPath;
    std::string configPath;
    std::string eventsPath;
    int ticks = 50;
    double realtimeSeconds = 0.0;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " --zones <zone_map.json> [--cameras <calibration.json>]\n"
              << "       [--config <runtime.json>] [--events <payload.json>]\n"
              << "       [--ticks N] [--realtime SECONDS]" << std::endl;
}

bool parseCommandLine(int argc, char** argv, CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--zones") {
            cmd.zonesPath = value;
        } else if (arg == "--cameras") {
            cmd.camerasPath = value;
        } else if (arg == "--config") {
            cmd.configPath = value;
        } else if (arg == "--events") {
            cmd.eventsPath = value;
        } else if (arg == "--ticks") {
            cmd.ticks = std::max(0, std::atoi(value.c_str()));
        } else if (arg == "--realtime") {
            cmd.realtimeSeconds = std::max(0.0, std::atof(value.c_str()));
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            return false;
        }
    }
    return !cmd.zonesPath.empty();
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries only the JSON result
    Logger::setOutputStream(&std::cerr);

    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }

    // Startup configuration must load completely
    RuntimeConfig config;
    std::shared_ptr<const WorldConfig> world;
    try {
        if (!cmd.configPath.empty()) {
            config.loadFromFile(cmd.configPath);
        }
        Logger::setLogLevel(Logger::levelFromInt(config.logLevel));
        world = WorldConfig::loadFromFiles(cmd.zonesPath, cmd.camerasPath);
    } catch (const std::exception& e) {
        Logger::error("main", std::string("Startup failed: ") + e.what());
        return 1;
    }

    PatrolSession session(world, config);

    if (!cmd.eventsPath.empty()) {
        try {
            SyncSummary summary;
            if (session.ingestText(readFile(cmd.eventsPath), &summary)) {
                Logger::info("main", "Loaded " + std::to_string(summary.total) + " events from " + cmd.eventsPath);
            } else {
                Logger::warning("main", "No events applied from " + cmd.eventsPath);
            }
        } catch (const std::exception& e) {
            Logger::error("main", std::string("Cannot load events: ") + e.what());
            return 1;
        }
    }

    if (cmd.realtimeSeconds > 0.0) {
        session.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int64_t>(cmd.realtimeSeconds * 1000.0)));
        session.stop();
    } else {
        // Deterministic ticks on a virtual clock
        int64_t nowMs = TimeUtils::nowMs();
        for (int i = 0; i < cmd.ticks; ++i) {
            session.tickOnce(nowMs);
            nowMs += config.tickMs;
        }
        session.stop();
    }

    // Events carry a marker position for map overlays
    WalkabilityResolver markers(world);
    nlohmann::json events = eventsToJson(*session.events());
    for (auto& record : events) {
        cv::Point2d marker = markers.projectToMarkerTarget(record["x"].get<double>(), record["y"].get<double>(),
                                                           record.value("zone_id", std::string()));
        record["marker_x"] = marker.x;
        record["marker_y"] = marker.y;
    }

    nlohmann::json output;
    output["events"] = events;
    output["agents"] = agentsToJson(session.agents());
    std::cout << output.dump(4) << std::endl;

    std::cerr << session.getStatusReport();
    return 0;
}
