#ifndef INFRA_LOG_SINK_H
#define INFRA_LOG_SINK_H

#include <cstdarg>
#include <string>

namespace infra {

enum class LogLevel : unsigned char {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error
};

// Names accepted in settings: debug, info, warning, error.
bool parseLogLevel(const std::string &name, LogLevel &out);

// Receives every message emitted through the LOG_* macros while installed.
// Installing a sink diverts output away from LoggingManager.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const char *tag, const char *message) = 0;
};

void setLogSink(ILogSink *sink);
ILogSink *getLogSink();
void emitLog(LogLevel level, const char *tag, const char *fmt, ...);
void emitLogV(LogLevel level, const char *tag, const char *fmt, va_list args);

} // namespace infra

#endif // INFRA_LOG_SINK_H
