#ifndef LOGGING_MANAGER_H
#define LOGGING_MANAGER_H

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "infra/log_sink.h"

struct LogEntry {
    uint64_t timestamp = 0;  // seconds since epoch
    infra::LogLevel level = infra::LogLevel::Info;
    std::string message;
    uint32_t sequence = 0;
};

class LoggingManager {
public:
    static LoggingManager& instance();

    // console may be nullptr; logFilePath may be empty to disable file output.
    void begin(std::FILE* console, const std::string& logFilePath = std::string(),
               size_t bufferCapacity = 500, size_t startupCapacity = 100);
    void end();
    // Switches file output without resetting the buffers. Empty path closes it.
    bool setLogFile(const std::string& logFilePath);
    void setMinimumLevel(infra::LogLevel level);
    void enableConsoleForwarding(bool enabled);

    void registerListener(const std::function<void(const LogEntry&)>& listener);

    void getEntriesSince(uint32_t lastSequence, std::vector<LogEntry>& out) const;
    void getStartupEntries(std::vector<LogEntry>& out) const;
    uint32_t latestSequence() const;
    size_t entryCount() const;
    size_t bufferCapacity() const;
    size_t startupCount() const;

    void log(infra::LogLevel level, const char* tag, const char* fmt, ...);

    static const char* levelName(infra::LogLevel level);

private:
    LoggingManager();
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    void pushLine(infra::LogLevel level, const std::string& line, uint64_t timestamp);
    static std::string formatTimestamp(uint64_t timestamp);

    std::FILE* m_console;
    std::FILE* m_logFile;
    bool m_consoleForwardingEnabled;
    bool m_initialized;
    infra::LogLevel m_minimumLevel;

    size_t m_capacity;
    size_t m_startupCapacity;
    size_t m_count;
    size_t m_head;
    uint32_t m_sequence;

    std::vector<LogEntry> m_entries;
    std::vector<LogEntry> m_startupEntries;
    std::vector<std::function<void(const LogEntry&)>> m_listeners;

    mutable std::mutex m_bufferMutex;
};

#define LOG_VERBOSE(tag, fmt, ...) do { infra::emitLog(infra::LogLevel::Verbose, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_DEBUG(tag, fmt, ...)   do { infra::emitLog(infra::LogLevel::Debug, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_INFO(tag, fmt, ...)    do { infra::emitLog(infra::LogLevel::Info, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_WARN(tag, fmt, ...)    do { infra::emitLog(infra::LogLevel::Warn, tag, fmt, ##__VA_ARGS__); } while (0)
#define LOG_ERROR(tag, fmt, ...)   do { infra::emitLog(infra::LogLevel::Error, tag, fmt, ##__VA_ARGS__); } while (0)

#endif // LOGGING_MANAGER_H
