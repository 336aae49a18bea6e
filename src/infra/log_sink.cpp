#include "log_sink.h"
#include <cstdarg>
#include <cstdio>
#include "logging_manager.h"

namespace infra {

static ILogSink *g_sink = nullptr;

void setLogSink(ILogSink *sink) {
    g_sink = sink;
}

ILogSink *getLogSink() {
    return g_sink;
}

bool parseLogLevel(const std::string &name, LogLevel &out) {
    static const struct {
        const char *name;
        LogLevel level;
    } kLevels[] = {
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
    };
    for (const auto &entry : kLevels) {
        if (name == entry.name) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

void emitLogV(LogLevel level, const char *tag, const char *fmt, va_list args) {
    if (!fmt) {
        return;
    }
    char buffer[512];
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (g_sink) {
        g_sink->log(level, tag ? tag : "", buffer);
        return;
    }
    LoggingManager::instance().log(level, tag ? tag : "", "%s", buffer);
}

void emitLog(LogLevel level, const char *tag, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emitLogV(level, tag, fmt, args);
    va_end(args);
}

} // namespace infra
