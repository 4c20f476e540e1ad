#include "event_log.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

const char* eventLevelName(EventLevel level) {
    switch (level) {
        case EventLevel::Info:    return "INFO";
        case EventLevel::Warning: return "WARNING";
        case EventLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

EventLog::EventLog(size_t capacity, bool echo) : capacity(capacity), echo(echo) {
    if (capacity == 0) {
        this->capacity = 1;
    }
}

std::string formatEventLine(const Event& event) {
    return "[" + event.timestamp + "] [" + eventLevelName(event.level) + "] " + event.message + "\n";
}

void EventLog::record(EventLevel level, const std::string& message) {
    Event event{formatTimestamp(std::chrono::system_clock::now()), level, message};
    std::string line = echo ? formatEventLine(event) : std::string();

    std::lock_guard<std::mutex> lock(log_mutex);
    events.push_front(event);
    while (events.size() > capacity) {
        events.pop_back();
    }

    if (echo) {
        std::ostream& out = (level == EventLevel::Error) ? std::cerr : std::cout;
        out << line;
    }
}

std::vector<Event> EventLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(log_mutex);
    size_t count = (limit == 0 || limit > events.size()) ? events.size() : limit;
    return std::vector<Event>(events.begin(), events.begin() + count);
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return events.size();
}
