#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

/// @brief Severity of a log entry.
enum class LogLevel {
    Info,
    Warning,
    Error
};

/**
 * @struct LogEntry
 * @brief One timestamped line of the log panel.
 */
struct LogEntry {
    std::string timestamp; ///< Local time, HH:MM:SS
    LogLevel level;
    std::string message;
};

/**
 * @class EventLog
 * @brief Keeps the most recent grid messages for display and echoes them to the console.
 *
 * Info lines go to stdout, warnings and errors to stderr. Only the last
 * `capacity` entries are retained.
 */
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 8, bool echo_to_console = true);

    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    /// @brief Retained entries, oldest first.
    std::vector<LogEntry> recent() const;

    std::size_t capacity() const { return max_entries; }
    void setEchoToConsole(bool enabled) { echo = enabled; }
    void clear();

private:
    void append(LogLevel level, const std::string& message);

    std::deque<LogEntry> entries;
    std::size_t max_entries;
    bool echo;
};

#endif // EVENT_LOG_H
