// floor_guard_utils.h
#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <iosfwd>

namespace floor_guard {

/**
 * Logging utilities with severity levels
 */
class Logger {
public:
    enum class Level {
        ERROR = 0,
        WARNING = 1,
        INFO = 2,
        DEBUG = 3,
        TRACE = 4
    };

    static void setLogLevel(Level level);
    static Level getLogLevel();

    // Maps a numeric diagnostic level (0=error .. 4=trace), clamped
    static Level levelFromInt(int level);

    // Where log lines go; std::cout until set. nullptr restores std::cout.
    static void setOutputStream(std::ostream* stream);

    static void error(const std::string& message);
    static void warning(const std::string& message);
    static void info(const std::string& message);
    static void debug(const std::string& message);
    static void trace(const std::string& message);

    // Log with context (e.g., component name)
    static void error(const std::string& context, const std::string& message);
    static void warning(const std::string& context, const std::string& message);
    static void info(const std::string& context, const std::string& message);
    static void debug(const std::string& context, const std::string& message);
    static void trace(const std::string& context, const std::string& message);

    static bool isEnabled(Level level) { return level <= s_logLevel; }

private:
    static Level s_logLevel;
    static std::ostream* s_output;
    static void log(Level level, const std::string& context, const std::string& message);
};

/**
 * Time and date utilities. All timestamps are epoch milliseconds (UTC).
 */
namespace TimeUtils {
    // Get current wall-clock time in epoch milliseconds
    int64_t nowMs();

    // Format epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ"
    std::string formatTimestampMs(int64_t epochMs);

    // Parse a date/time string. Accepts ISO-8601 ("YYYY-MM-DD",
    // "YYYY-MM-DD[T| ]HH:MM[:SS[.fff]]" with an optional "Z" or "+HH:MM" /
    // "-HHMM" suffix), slash dates ("YYYY/MM/DD HH:MM:SS"), RFC 1123 and
    // RFC 850 dates ("Mon, 01 Jan 2024 00:00:00 GMT", "Monday, 01-Jan-24 ...")
    // and "January 1, 2024 00:00:00 UTC". Strings without a zone are read as UTC.
    bool parseDateTimeMs(const std::string& text, int64_t& epochMs);

    // Epoch milliseconds for a UTC calendar date
    int64_t utcEpochMs(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
}

/**
 * String utilities
 */
namespace StringUtils {
    // Split string by delimiter
    std::vector<std::string> split(const std::string& input, char delimiter);

    // Trim whitespace from start and end of string
    std::string trim(const std::string& input);

    std::string toLower(const std::string& input);

    bool startsWith(const std::string& input, const std::string& prefix);
    bool contains(const std::string& input, const std::string& needle);

    // Lower-case base-36 rendering of a non-negative integer
    std::string toBase36(uint64_t value);

    // Fixed-precision decimal formatting
    std::string formatDouble(double value, int precision);
}

/**
 * Performance measurement utilities
 */
class ScopedTimer {
public:
    ScopedTimer(const std::string& operationName);
    ~ScopedTimer();

private:
    std::string m_operationName;
    std::chrono::steady_clock::time_point m_startTime;
};

// Macro for easy timing of code blocks
#define TIME_SCOPE(name) ScopedTimer scopedTimer(name)

} // namespace floor_guard
