// floor_guard_utils.cpp
#include "floor_guard_utils.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdlib>
#include <mutex>

namespace floor_guard {

//
// Logger implementation
//
Logger::Level Logger::s_logLevel = Logger::Level::INFO;
std::ostream* Logger::s_output = &std::cout;

namespace {
std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

void Logger::setLogLevel(Level level) {
    s_logLevel = level;
}

void Logger::setOutputStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(logMutex());
    s_output = stream ? stream : &std::cout;
}

Logger::Level Logger::getLogLevel() {
    return s_logLevel;
}

Logger::Level Logger::levelFromInt(int level) {
    if (level <= 0) return Level::ERROR;
    if (level == 1) return Level::WARNING;
    if (level == 2) return Level::INFO;
    if (level == 3) return Level::DEBUG;
    return Level::TRACE;
}

void Logger::error(const std::string& message) {
    log(Level::ERROR, "", message);
}

void Logger::warning(const std::string& message) {
    log(Level::WARNING, "", message);
}

void Logger::info(const std::string& message) {
    log(Level::INFO, "", message);
}

void Logger::debug(const std::string& message) {
    log(Level::DEBUG, "", message);
}

void Logger::trace(const std::string& message) {
    log(Level::TRACE, "", message);
}

void Logger::error(const std::string& context, const std::string& message) {
    log(Level::ERROR, context, message);
}

void Logger::warning(const std::string& context, const std::string& message) {
    log(Level::WARNING, context, message);
}

void Logger::info(const std::string& context, const std::string& message) {
    log(Level::INFO, context, message);
}

void Logger::debug(const std::string& context, const std::string& message) {
    log(Level::DEBUG, context, message);
}

void Logger::trace(const std::string& context, const std::string& message) {
    log(Level::TRACE, context, message);
}

void Logger::log(Level level, const std::string& context, const std::string& message) {
    if (level > s_logLevel) {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex());

    // Get current time
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream timestamp;
    timestamp << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
              << '.' << std::setfill('0') << std::setw(3) << ms.count();

    std::string levelStr;
    switch (level) {
        case Level::ERROR:
            levelStr = "ERROR";
            break;
        case Level::WARNING:
            levelStr = "WARNING";
            break;
        case Level::INFO:
            levelStr = "INFO";
            break;
        case Level::DEBUG:
            levelStr = "DEBUG";
            break;
        case Level::TRACE:
            levelStr = "TRACE";
            break;
    }

    std::string contextStr = context.empty() ? "" : "[" + context + "] ";

    *s_output << timestamp.str() << " " << levelStr << " " << contextStr << message << std::endl;
}

//
// TimeUtils implementation
//
namespace TimeUtils {

int64_t nowMs() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// Days since 1970-01-01 for a proleptic Gregorian date
static int64_t daysFromCivil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t utcEpochMs(int year, int month, int day, int hour, int minute, int second) {
    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return seconds * 1000;
}

std::string formatTimestampMs(int64_t epochMs) {
    time_t seconds = static_cast<time_t>(epochMs / 1000);
    int milliseconds = static_cast<int>(epochMs % 1000);
    if (milliseconds < 0) {
        milliseconds += 1000;
        seconds -= 1;
    }

    std::tm timeInfo{};
#ifdef _WIN32
    gmtime_s(&timeInfo, &seconds);
#else
    gmtime_r(&seconds, &timeInfo);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &timeInfo);

    std::stringstream result;
    result << buffer << "." << std::setfill('0') << std::setw(3) << milliseconds << "Z";
    return result.str();
}

// Reads exactly `count` digits starting at `pos`
static bool readDigits(const std::string& text, size_t& pos, size_t count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

static bool expect(const std::string& text, size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

static bool isDigitAt(const std::string& text, size_t pos) {
    return pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]));
}

static void skipSpaces(const std::string& text, size_t& pos) {
    while (pos < text.size() && text[pos] == ' ') {
        ++pos;
    }
}

// Reads one to `maxCount` digits; `count` receives how many were read
static bool readNumber(const std::string& text, size_t& pos, size_t maxCount, int& value,
                       size_t* count = nullptr) {
    size_t read = 0;
    value = 0;
    while (read < maxCount && isDigitAt(text, pos)) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
        ++read;
    }
    if (count) {
        *count = read;
    }
    return read > 0;
}

// Reads a run of letters, lower-cased
static std::string readWord(const std::string& text, size_t& pos) {
    std::string word;
    while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
        word += static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
        ++pos;
    }
    return word;
}

// Index (1-based) of the name `word` abbreviates to at least three letters, or 0
static int matchName(const std::string& word, const char* const* names, int nameCount) {
    if (word.size() < 3) {
        return 0;
    }
    for (int i = 0; i < nameCount; ++i) {
        if (std::string(names[i]).compare(0, word.size(), word) == 0) {
            return i + 1;
        }
    }
    return 0;
}

static int monthFromName(const std::string& word) {
    static const char* const kMonths[] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };
    return matchName(word, kMonths, 12);
}

static bool isWeekdayName(const std::string& word) {
    static const char* const kDays[] = {
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
    };
    return matchName(word, kDays, 7) != 0;
}

namespace {

struct DateTimeParts {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    int64_t offsetMinutes = 0;
};

} // namespace

// HH:MM[:SS[.fff]]
static bool readClock(const std::string& text, size_t& pos, DateTimeParts& parts) {
    if (!readDigits(text, pos, 2, parts.hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, parts.minute)) {
        return false;
    }
    if (expect(text, pos, ':')) {
        if (!readDigits(text, pos, 2, parts.second)) {
            return false;
        }
        if (expect(text, pos, '.') || expect(text, pos, ',')) {
            // Fractional seconds: keep millisecond precision
            int digits = 0;
            while (isDigitAt(text, pos)) {
                if (digits < 3) {
                    parts.millis = parts.millis * 10 + (text[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return false;
            }
            for (int i = digits; i < 3; ++i) {
                parts.millis *= 10;
            }
        }
    }
    return parts.hour <= 23 && parts.minute <= 59 && parts.second <= 60;
}

// "Z", "GMT", "UTC", "UT" or a numeric "+HH[:]MM" offset, which may also
// follow a zone name ("GMT+0100"). An empty remainder is UTC.
static bool readZone(const std::string& text, size_t& pos, DateTimeParts& parts) {
    parts.offsetMinutes = 0;
    if (pos >= text.size()) {
        return true;
    }
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
        return true;
    }
    if (std::isalpha(static_cast<unsigned char>(zone))) {
        std::string name = readWord(text, pos);
        if (name != "gmt" && name != "utc" && name != "ut") {
            return false;
        }
        if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-')) {
            return true;
        }
        zone = text[pos];
    }
    if (zone != '+' && zone != '-') {
        return false;
    }
    ++pos;
    int offHours = 0, offMinutes = 0;
    if (!readDigits(text, pos, 2, offHours)) {
        return false;
    }
    expect(text, pos, ':');
    if (isDigitAt(text, pos) && !readDigits(text, pos, 2, offMinutes)) {
        return false;
    }
    if (offMinutes > 59) {
        return false;
    }
    parts.offsetMinutes = offHours * 60 + offMinutes;
    if (zone == '-') {
        parts.offsetMinutes = -parts.offsetMinutes;
    }
    return true;
}

// Clock and zone after the date; both optional
static bool readTimeTail(const std::string& text, size_t& pos, DateTimeParts& parts) {
    skipSpaces(text, pos);
    if (isDigitAt(text, pos)) {
        if (!readClock(text, pos, parts)) {
            return false;
        }
        skipSpaces(text, pos);
    }
    if (!readZone(text, pos, parts)) {
        return false;
    }
    skipSpaces(text, pos);
    return pos == text.size();
}

// "YYYY-MM-DD[T| ]HH:MM[:SS[.fff]][zone]" or "YYYY/M/D[ HH:MM[:SS]][ zone]"
static bool parseNumericDate(const std::string& text, DateTimeParts& parts) {
    size_t pos = 0;
    if (!readDigits(text, pos, 4, parts.year) || pos >= text.size()) {
        return false;
    }
    const char separator = text[pos++];
    if (separator == '-') {
        if (!readDigits(text, pos, 2, parts.month) || !expect(text, pos, '-') ||
            !readDigits(text, pos, 2, parts.day)) {
            return false;
        }
    } else if (separator == '/') {
        if (!readNumber(text, pos, 2, parts.month) || !expect(text, pos, '/') ||
            !readNumber(text, pos, 2, parts.day)) {
            return false;
        }
    } else {
        return false;
    }

    if (pos == text.size()) {
        return true;
    }
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
        return false;
    }
    ++pos;
    if (!readClock(text, pos, parts)) {
        return false;
    }
    return readTimeTail(text, pos, parts);
}

// Month-name forms, with an optional leading weekday:
//   "Mon, 01 Jan 2024 00:00:00 GMT"     (RFC 1123)
//   "Monday, 01-Jan-24 00:00:00 GMT"    (RFC 850, two-digit year)
//   "January 1, 2024 00:00:00 UTC"
static bool parseNamedDate(const std::string& text, DateTimeParts& parts) {
    size_t pos = 0;
    const size_t wordStart = pos;
    if (isWeekdayName(readWord(text, pos))) {
        expect(text, pos, ',');
        skipSpaces(text, pos);
    } else {
        pos = wordStart;
    }

    size_t yearDigits = 0;
    if (isDigitAt(text, pos)) {
        if (!readNumber(text, pos, 2, parts.day)) {
            return false;
        }
        const bool dashed = expect(text, pos, '-');
        if (!dashed) {
            skipSpaces(text, pos);
        }
        parts.month = monthFromName(readWord(text, pos));
        if (dashed) {
            if (!expect(text, pos, '-')) {
                return false;
            }
        } else {
            skipSpaces(text, pos);
        }
        if (!readNumber(text, pos, 4, parts.year, &yearDigits)) {
            return false;
        }
        if (yearDigits == 2) {
            parts.year += parts.year < 50 ? 2000 : 1900;
            yearDigits = 4;
        }
    } else {
        parts.month = monthFromName(readWord(text, pos));
        skipSpaces(text, pos);
        if (!readNumber(text, pos, 2, parts.day) || !expect(text, pos, ',')) {
            return false;
        }
        skipSpaces(text, pos);
        if (!readNumber(text, pos, 4, parts.year, &yearDigits)) {
            return false;
        }
    }
    if (parts.month == 0 || yearDigits != 4) {
        return false;
    }
    return readTimeTail(text, pos, parts);
}

bool parseDateTimeMs(const std::string& input, int64_t& epochMs) {
    const std::string text = StringUtils::trim(input);
    if (text.empty()) {
        return false;
    }

    DateTimeParts parts;
    const bool numeric = text.size() > 4 && isDigitAt(text, 0) && (text[4] == '-' || text[4] == '/');
    if (!(numeric ? parseNumericDate(text, parts) : parseNamedDate(text, parts))) {
        return false;
    }
    if (parts.month < 1 || parts.month > 12 || parts.day < 1 || parts.day > 31) {
        return false;
    }

    epochMs = utcEpochMs(parts.year, parts.month, parts.day, parts.hour, parts.minute, parts.second)
              + parts.millis - parts.offsetMinutes * 60 * 1000;
    return true;
}

} // namespace TimeUtils

//
// StringUtils implementation
//
namespace StringUtils {

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(input);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string trim(const std::string& input) {
    auto start = input.begin();
    while (start != input.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    auto end = input.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }

    return std::string(start, end);
}

std::string toLower(const std::string& input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool startsWith(const std::string& input, const std::string& prefix) {
    return input.size() >= prefix.size() && input.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& input, const std::string& needle) {
    return input.find(needle) != std::string::npos;
}

std::string toBase36(uint64_t value) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string result;
    while (value > 0) {
        result.push_back(digits[value % 36]);
        value /= 36;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::string formatDouble(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace StringUtils

//
// ScopedTimer implementation
//
ScopedTimer::ScopedTimer(const std::string& operationName)
    : m_operationName(operationName),
      m_startTime(std::chrono::steady_clock::now())
{
}

ScopedTimer::~ScopedTimer() {
    if (!Logger::isEnabled(Logger::Level::DEBUG)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_startTime);
    Logger::debug("Timer", m_operationName + " took " + std::to_string(elapsed.count()) + " us");
}

} // namespace floor_guard
