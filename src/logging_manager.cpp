#include "logging_manager.h"

#include <ctime>

static constexpr const char* TAG = "LoggingManager";

LoggingManager& LoggingManager::instance() {
    static LoggingManager s_instance;
    return s_instance;
}

LoggingManager::LoggingManager()
    : m_console(nullptr),
      m_logFile(nullptr),
      m_consoleForwardingEnabled(true),
      m_initialized(false),
      m_minimumLevel(infra::LogLevel::Info),
      m_capacity(0),
      m_startupCapacity(0),
      m_count(0),
      m_head(0),
      m_sequence(0) {}

LoggingManager::~LoggingManager() {
    end();
}

void LoggingManager::begin(std::FILE* console, const std::string& logFilePath, size_t bufferCapacity,
                           size_t startupCapacity) {
    bool fileFailed = false;
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        if (m_logFile) {
            std::fclose(m_logFile);
            m_logFile = nullptr;
        }
        m_console = console;
        if (!logFilePath.empty()) {
            m_logFile = std::fopen(logFilePath.c_str(), "a");
            fileFailed = (m_logFile == nullptr);
        }
        m_capacity = bufferCapacity;
        m_startupCapacity = startupCapacity;
        m_entries.clear();
        m_entries.resize(bufferCapacity);
        m_startupEntries.clear();
        m_startupEntries.reserve(startupCapacity);
        m_listeners.clear();
        m_count = 0;
        m_head = 0;
        m_sequence = 0;
        m_initialized = true;
    }

    if (fileFailed) {
        // Console logging continues without the file.
        log(infra::LogLevel::Warn, TAG, "Could not open log file %s", logFilePath.c_str());
    }
    log(infra::LogLevel::Debug, TAG, "LoggingManager initialized (capacity=%u, startup=%u)",
        static_cast<unsigned>(bufferCapacity), static_cast<unsigned>(startupCapacity));
}

void LoggingManager::end() {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    if (m_logFile) {
        std::fclose(m_logFile);
        m_logFile = nullptr;
    }
    m_console = nullptr;
    m_initialized = false;
}

bool LoggingManager::setLogFile(const std::string& logFilePath) {
    bool opened = true;
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        if (m_logFile) {
            std::fclose(m_logFile);
            m_logFile = nullptr;
        }
        if (!logFilePath.empty()) {
            m_logFile = std::fopen(logFilePath.c_str(), "a");
            opened = (m_logFile != nullptr);
        }
    }
    if (!opened) {
        log(infra::LogLevel::Warn, TAG, "Could not open log file %s", logFilePath.c_str());
    }
    return opened;
}

void LoggingManager::setMinimumLevel(infra::LogLevel level) {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_minimumLevel = level;
}

void LoggingManager::enableConsoleForwarding(bool enabled) {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_consoleForwardingEnabled = enabled;
}

void LoggingManager::registerListener(const std::function<void(const LogEntry&)>& listener) {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    m_listeners.push_back(listener);
}

void LoggingManager::getEntriesSince(uint32_t lastSequence, std::vector<LogEntry>& out) const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    if (m_count == 0) {
        return;
    }

    size_t startIndex = (m_head + m_capacity - m_count) % m_capacity;
    for (size_t i = 0; i < m_count; ++i) {
        const LogEntry& entry = m_entries[(startIndex + i) % m_capacity];
        if (entry.sequence > lastSequence && entry.sequence != 0) {
            out.push_back(entry);
        }
    }
}

void LoggingManager::getStartupEntries(std::vector<LogEntry>& out) const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    out.insert(out.end(), m_startupEntries.begin(), m_startupEntries.end());
}

uint32_t LoggingManager::latestSequence() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_sequence;
}

size_t LoggingManager::entryCount() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_count;
}

size_t LoggingManager::bufferCapacity() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_capacity;
}

size_t LoggingManager::startupCount() const {
    std::lock_guard<std::mutex> lock(m_bufferMutex);
    return m_startupEntries.size();
}

void LoggingManager::log(infra::LogLevel level, const char* tag, const char* fmt, ...) {
    if (!m_initialized || !fmt) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int needed = vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);

    if (needed < 0) {
        va_end(args);
        return;
    }

    std::vector<char> buffer(static_cast<size_t>(needed) + 1);
    vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    std::string body(buffer.data());
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }

    uint64_t now = static_cast<uint64_t>(std::time(nullptr));
    std::string line = formatTimestamp(now) + " - " + (tag ? tag : "") + " - " + levelName(level) + " - " + body;
    pushLine(level, line, now);
}

void LoggingManager::pushLine(infra::LogLevel level, const std::string& line, uint64_t timestamp) {
    LogEntry entry;
    entry.timestamp = timestamp;
    entry.level = level;
    entry.message = line;

    std::vector<std::function<void(const LogEntry&)>> listeners;
    {
        std::lock_guard<std::mutex> lock(m_bufferMutex);
        entry.sequence = ++m_sequence;

        // The file receives everything; the console only what passes the threshold.
        if (m_logFile) {
            std::fprintf(m_logFile, "%s\n", line.c_str());
            std::fflush(m_logFile);
        }
        if (m_consoleForwardingEnabled && m_console && level >= m_minimumLevel) {
            std::fprintf(m_console, "%s\n", line.c_str());
            std::fflush(m_console);
        }

        if (m_capacity > 0) {
            m_entries[m_head] = entry;
            m_head = (m_head + 1) % m_capacity;
            if (m_count < m_capacity) {
                ++m_count;
            }
        }

        if (m_startupEntries.size() < m_startupCapacity) {
            m_startupEntries.push_back(entry);
        }

        listeners = m_listeners;
    }

    for (auto& listener : listeners) {
        if (listener) {
            listener(entry);
        }
    }
}

std::string LoggingManager::formatTimestamp(uint64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    struct tm local;
    localtime_r(&t, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

const char* LoggingManager::levelName(infra::LogLevel level) {
    switch (level) {
        case infra::LogLevel::Verbose: return "VERBOSE";
        case infra::LogLevel::Debug:   return "DEBUG";
        case infra::LogLevel::Info:    return "INFO";
        case infra::LogLevel::Warn:    return "WARNING";
        case infra::LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}
