// floor_guard_config.h
#pragma once

#include "floor_guard_event.h"

#include <string>
#include <cstdint>

namespace floor_guard {

/**
 * Runtime settings for a patrol session.
 */
class RuntimeConfig {
public:
    RuntimeConfig() = default;

    // Fleet settings
    int robotCount = 4;
    int tickMs = 80;                     // Simulator tick period
    int64_t liveWindowMs = 600000;       // Events older than this are not reacted to

    // Feed settings
    int maxEvents = 600;                 // Clamped to 1..1000
    std::string fallbackStoreId = "s001";
    EventSource defaultSource = EventSource::API;

    uint32_t randomSeed = 0;             // 0 = seed from the clock
    int logLevel = 2;                    // 0=error, 1=warn, 2=info, 3=debug, 4=trace

    // Load settings from JSON string; missing keys keep their values
    bool loadFromJson(const std::string& jsonStr);

    // Same, reading a file. Throws std::runtime_error when it cannot be read
    // or parsed.
    void loadFromFile(const std::string& path);

    // Serialize to JSON string
    std::string toJson() const;
};

} // namespace floor_guard
