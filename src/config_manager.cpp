#include "config_manager.h"
#include "hardware_config.h"
#include "infra/filesystem.h"
#include "infra/log_sink.h"
#include "runtime/module_options.h"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#ifndef UNIT_TEST
#include "infra/posix_filesystem.h"
#endif

static constexpr const char* TAG = "ConfigManager";

namespace
{

struct EnvironmentOverride
{
    const char *variable;
    const char *key;
};

const EnvironmentOverride kEnvironmentOverrides[] = {
    {"BIND_HOST", "bind_host"},
    {"BIND_PORT", "bind_port"},
    {"RADIO_PLAY_CMD", "radio_play_cmd"},
    {"RADIO_STATE_FILE", "state_file"},
    {"RADIO_HARDWARE_CONFIG", "hardware_config"},
    {"RADIO_STATIONS_CONFIG", "stations_config"},
    {"RADIO_HARDWARE_VARIANT", "hardware_variant"},
    {"RADIO_LOG_FILE", "log_file"},
    {"RADIO_LOG_LEVEL", "log_level"},
    {"RADIO_COMMAND_TIMEOUT_MS", "command_timeout_ms"},
};

constexpr int kDefaultBindPort = 8080;
constexpr unsigned long kDefaultCommandTimeoutMs = 10000;
constexpr unsigned long kMinCommandTimeoutMs = 100;
constexpr unsigned long kMaxCommandTimeoutMs = 600000;

std::string trim(const std::string &text)
{
    const char *whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos)
    {
        return std::string();
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

// Whole-string decimal parse; false on trailing garbage or overflow.
bool parseLong(const std::string &text, long &out)
{
    if (text.empty())
    {
        return false;
    }
    char *end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (!end || *end != '\0')
    {
        return false;
    }
    out = value;
    return true;
}

bool isKnownVariant(const std::string &name)
{
    HardwareVariant ignored;
    return parseHardwareVariant(name, ignored);
}

}  // namespace

ConfigManager::ConfigManager()
    : m_fileSystem(nullptr),
      m_logSink(nullptr),
      m_environment([](const char *name) -> const char * { return std::getenv(name); })
{
}

ConfigManager &ConfigManager::getInstance()
{
    static ConfigManager instance;
    return instance;
}

void ConfigManager::setFileSystem(infra::IFileSystem *fileSystem)
{
    m_fileSystem = fileSystem;
}

void ConfigManager::setLogSink(infra::ILogSink *sink)
{
    m_logSink = sink;
}

void ConfigManager::setEnvironmentProvider(EnvironmentProvider provider)
{
    m_environment = provider;
}

bool ConfigManager::loadConfig(const std::string &path)
{
    infra::IFileSystem *fs = m_fileSystem;
#ifndef UNIT_TEST
    infra::PosixFileSystem defaultFilesystem;
    if (!fs)
    {
        fs = &defaultFilesystem;
    }
#else
    if (!fs)
    {
        log(infra::LogLevel::Error, "No filesystem provided for ConfigManager under UNIT_TEST");
        return false;
    }
#endif

    m_config.clear();
    m_settingsPath = path;

    if (!fs->exists(path.c_str()))
    {
        log(infra::LogLevel::Info, "Settings file %s not found; using defaults", path.c_str());
    }
    else
    {
        auto settingsFile = fs->open(path.c_str(), infra::kFileRead);
        if (!settingsFile)
        {
            log(infra::LogLevel::Error, "Failed to open settings file %s", path.c_str());
            return false;
        }

        log(infra::LogLevel::Info, "Reading settings file %s", path.c_str());
        while (settingsFile->available())
        {
            std::string line = trim(settingsFile->readStringUntil('\n'));
            if (!line.empty() && line[0] != '#')
            {
                parseConfigLine(line);
            }
        }
        settingsFile->close();
    }

    applyEnvironmentOverrides();

    for (const auto &pair : m_config)
    {
        log(infra::LogLevel::Debug, "  %s: %s", pair.first.c_str(), pair.second.c_str());
    }

    // Getters fall back to defaults on invalid values; only warn here.
    validateSettings();
    return true;
}

void ConfigManager::parseConfigLine(const std::string &line)
{
    size_t separatorIndex = line.find('=');
    if (separatorIndex == std::string::npos)
    {
        log(infra::LogLevel::Warn, "Ignoring settings line without '=': %s", line.c_str());
        return;
    }
    std::string key = trim(line.substr(0, separatorIndex));
    std::string value = trim(line.substr(separatorIndex + 1));
    if (key.empty())
    {
        return;
    }
    m_config[key] = value;
}

void ConfigManager::applyEnvironmentOverrides()
{
    if (!m_environment)
    {
        return;
    }
    for (const auto &entry : kEnvironmentOverrides)
    {
        const char *value = m_environment(entry.variable);
        if (value)
        {
            m_config[entry.key] = value;
            log(infra::LogLevel::Debug, "%s overridden by %s", entry.key, entry.variable);
        }
    }
}

void ConfigManager::validateSettings() const
{
    long port = 0;
    std::string portText = getValue("bind_port");
    if (!portText.empty() && (!parseLong(portText, port) || port < 1 || port > 65535))
    {
        log(infra::LogLevel::Warn, "Invalid bind_port '%s' (1-65535 expected). Using %d.", portText.c_str(),
            kDefaultBindPort);
    }

    long timeout = 0;
    std::string timeoutText = getValue("command_timeout_ms");
    if (!timeoutText.empty() &&
        (!parseLong(timeoutText, timeout) || timeout < static_cast<long>(kMinCommandTimeoutMs) ||
         timeout > static_cast<long>(kMaxCommandTimeoutMs)))
    {
        log(infra::LogLevel::Warn, "Invalid command_timeout_ms '%s' (%lu-%lu expected). Using %lu.",
            timeoutText.c_str(), kMinCommandTimeoutMs, kMaxCommandTimeoutMs, kDefaultCommandTimeoutMs);
    }

    std::string variant = getValue("hardware_variant");
    if (!variant.empty() && !isKnownVariant(variant))
    {
        log(infra::LogLevel::Warn, "Unknown hardware_variant '%s'. Hardware validation will reject it.",
            variant.c_str());
    }

    if (getValue("radio_play_cmd", "x").empty())
    {
        log(infra::LogLevel::Warn, "Empty radio_play_cmd. Using radio-play.");
    }

    std::string level = getValue("log_level");
    infra::LogLevel parsedLevel;
    if (!level.empty() && !infra::parseLogLevel(level, parsedLevel))
    {
        log(infra::LogLevel::Warn, "Unknown log_level '%s'. Using info.", level.c_str());
    }
}

void ConfigManager::log(infra::LogLevel level, const char *fmt, ...) const
{
    char buffer[256]{0};
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (m_logSink)
    {
        m_logSink->log(level, TAG, buffer);
        return;
    }
    infra::emitLog(level, TAG, "%s", buffer);
}

std::string ConfigManager::getValue(const std::string &key, const std::string &defaultValue) const
{
    auto it = m_config.find(key);
    return (it != m_config.end()) ? it->second : defaultValue;
}

void ConfigManager::printConfig() const
{
    log(infra::LogLevel::Info, "Settings file: %s", m_settingsPath.c_str());
    log(infra::LogLevel::Info, "Bind: %s:%d", getBindHost().c_str(), getBindPort());
    log(infra::LogLevel::Info, "radio-play command: %s", getRadioPlayCommand().c_str());
    log(infra::LogLevel::Info, "Command timeout: %lu ms", getCommandTimeoutMs());
    log(infra::LogLevel::Info, "State file: %s", getStateFile().c_str());
    log(infra::LogLevel::Info, "Hardware config: %s (%s)", getHardwareConfigPath().c_str(),
        getHardwareVariant().c_str());
    log(infra::LogLevel::Info, "Stations config: %s", getStationsConfigPath().c_str());
}

std::string ConfigManager::getBindHost() const
{
    std::string host = getValue("bind_host", "0.0.0.0");
    return host.empty() ? "0.0.0.0" : host;
}

int ConfigManager::getBindPort() const
{
    long port = 0;
    if (!parseLong(getValue("bind_port"), port) || port < 1 || port > 65535)
    {
        return kDefaultBindPort;
    }
    return static_cast<int>(port);
}

std::string ConfigManager::getRadioPlayCommand() const
{
    std::string command = getValue("radio_play_cmd", "radio-play");
    return command.empty() ? "radio-play" : command;
}

unsigned long ConfigManager::getCommandTimeoutMs() const
{
    long timeout = 0;
    if (!parseLong(getValue("command_timeout_ms"), timeout) ||
        timeout < static_cast<long>(kMinCommandTimeoutMs) || timeout > static_cast<long>(kMaxCommandTimeoutMs))
    {
        return kDefaultCommandTimeoutMs;
    }
    return static_cast<unsigned long>(timeout);
}

std::string ConfigManager::getStateFile() const
{
    return getValue("state_file", "/home/radio/.radio-state");
}

std::string ConfigManager::getHardwareConfigPath() const
{
    return getValue("hardware_config", "/home/radio/hardware-config.json");
}

std::string ConfigManager::getStationsConfigPath() const
{
    return getValue("stations_config", "/home/radio/stations.json");
}

std::string ConfigManager::getLogFile() const
{
    return getValue("log_file", "");
}

std::string ConfigManager::getHardwareVariant() const
{
    std::string variant = getValue("hardware_variant");
    return variant.empty() ? RADIO_DEFAULT_HARDWARE_VARIANT : variant;
}

infra::LogLevel ConfigManager::getLogLevel() const
{
    infra::LogLevel level = infra::LogLevel::Info;
    if (!infra::parseLogLevel(getValue("log_level", "info"), level))
    {
        return infra::LogLevel::Info;
    }
    return level;
}
