#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <chrono>

enum class EventLevel {
    Info,
    Warning,
    Error
};

const char* eventLevelName(EventLevel level);

struct Event {
    std::string timestamp;   // ISO-8601 UTC, millisecond precision
    EventLevel level;
    std::string message;
};

// Bounded operator-facing event log. Entries are kept most recent first and
// the oldest entry is dropped once capacity is reached. Every entry is also
// echoed to stdout (stderr for errors).
class EventLog {
private:
    size_t capacity;
    bool echo;
    mutable std::mutex log_mutex;
    std::deque<Event> events;

public:
    explicit EventLog(size_t capacity = 100, bool echo = true);

    void record(EventLevel level, const std::string& message);
    void info(const std::string& message) { record(EventLevel::Info, message); }
    void warning(const std::string& message) { record(EventLevel::Warning, message); }
    void error(const std::string& message) { record(EventLevel::Error, message); }

    // Snapshot, most recent first. limit == 0 returns everything retained.
    std::vector<Event> recent(size_t limit = 0) const;

    size_t size() const;
    size_t getCapacity() const { return capacity; }
};

std::string formatTimestamp(std::chrono::system_clock::time_point tp);

// "[<timestamp>] [<LEVEL>] <message>\n", the echoed form of an event.
std::string formatEventLine(const Event& event);
