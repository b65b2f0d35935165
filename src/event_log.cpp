#include "event_log.hpp"
#include <ctime>
#include <iostream>
#include <utility>

namespace {

std::string current_time() {
    time_t now = time(0);
    struct tm *ltm = localtime(&now);
    char buffer[16];
    if (!ltm || strftime(buffer, sizeof(buffer), "%H:%M:%S", ltm) == 0) {
        return "--:--:--";
    }
    return buffer;
}

} // namespace

EventLog::EventLog(std::size_t capacity, bool echo_to_console)
    : max_entries(capacity == 0 ? 1 : capacity), echo(echo_to_console) {}

void EventLog::info(const std::string& message) {
    append(LogLevel::Info, message);
}

void EventLog::warning(const std::string& message) {
    append(LogLevel::Warning, message);
}

void EventLog::error(const std::string& message) {
    append(LogLevel::Error, message);
}

void EventLog::append(LogLevel level, const std::string& message) {
    LogEntry entry{current_time(), level, message};

    if (echo) {
        if (level == LogLevel::Info) {
            std::cout << "[" << entry.timestamp << "] " << message << std::endl;
        } else {
            std::cerr << "[" << entry.timestamp << "] " << message << std::endl;
        }
    }

    entries.push_back(std::move(entry));
    while (entries.size() > max_entries) {
        entries.pop_front();
    }
}

std::vector<LogEntry> EventLog::recent() const {
    return std::vector<LogEntry>(entries.begin(), entries.end());
}

void EventLog::clear() {
    entries.clear();
}
