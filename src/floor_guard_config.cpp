// floor_guard_config.cpp
#include "floor_guard_config.h"
#include "floor_guard_utils.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace floor_guard {

using json = nlohmann::json;

bool RuntimeConfig::loadFromJson(const std::string& jsonStr) {
    // Fields land in a copy so a type error part-way leaves *this unchanged
    RuntimeConfig loaded = *this;
    try {
        json j = json::parse(jsonStr);

        // Fleet settings
        loaded.robotCount = std::max(0, j.value("robotCount", robotCount));
        loaded.tickMs = std::max(1, j.value("tickMs", tickMs));
        loaded.liveWindowMs = std::max<int64_t>(0, j.value("liveWindowMs", liveWindowMs));

        // Feed settings
        loaded.maxEvents = std::max(1, std::min(1000, j.value("maxEvents", maxEvents)));
        loaded.fallbackStoreId = j.value("fallbackStoreId", fallbackStoreId);
        if (j.contains("defaultSource") && j["defaultSource"].is_string()) {
            EventSource source = defaultSource;
            if (eventSourceFromString(StringUtils::toLower(j["defaultSource"].get<std::string>()), source)) {
                loaded.defaultSource = source;
            } else {
                std::cerr << "[RuntimeConfig] Unknown defaultSource, keeping "
                          << eventSourceToString(defaultSource) << std::endl;
            }
        }

        loaded.randomSeed = j.value("randomSeed", randomSeed);
        loaded.logLevel = std::max(0, std::min(4, j.value("logLevel", logLevel)));
    } catch (const std::exception& e) {
        std::cerr << "[RuntimeConfig] Error parsing JSON: " << e.what() << std::endl;
        return false;
    }

    *this = loaded;
    return true;
}

void RuntimeConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    std::string jsonStr((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!loadFromJson(jsonStr)) {
        throw std::runtime_error("cannot parse " + path);
    }
}

std::string RuntimeConfig::toJson() const {
    json j;

    // Fleet settings
    j["robotCount"] = robotCount;
    j["tickMs"] = tickMs;
    j["liveWindowMs"] = liveWindowMs;

    // Feed settings
    j["maxEvents"] = maxEvents;
    j["fallbackStoreId"] = fallbackStoreId;
    j["defaultSource"] = eventSourceToString(defaultSource);

    j["randomSeed"] = randomSeed;
    j["logLevel"] = logLevel;

    return j.dump(4); // Pretty print with 4-space indent
}

} // namespace floor_guard
