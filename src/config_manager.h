#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <functional>
#include <map>
#include <string>

namespace infra {
class IFileSystem;
class ILogSink;
enum class LogLevel : unsigned char;
}

// Runtime settings for the control plane: file locations, the backend bind
// address, the radio-play alias and timeouts. Read from a key=value file,
// then overridden by environment variables.
class ConfigManager {
public:
    using EnvironmentProvider = std::function<const char *(const char *)>;

    static constexpr const char *kDefaultSettingsPath = "/etc/radio/radio.conf";

    static ConfigManager &getInstance();

    void setFileSystem(infra::IFileSystem *fileSystem);
    void setLogSink(infra::ILogSink *sink);
    // Defaults to getenv; tests inject a map-backed lookup.
    void setEnvironmentProvider(EnvironmentProvider provider);

    // A missing settings file is not an error. Returns false only when the
    // file exists but cannot be opened.
    bool loadConfig(const std::string &path = kDefaultSettingsPath);

    std::string getValue(const std::string &key, const std::string &defaultValue = "") const;
    void printConfig() const;
    const std::map<std::string, std::string> &values() const { return m_config; }
    const std::string &settingsPath() const { return m_settingsPath; }

    // Backend
    std::string getBindHost() const;
    int getBindPort() const;
    std::string getRadioPlayCommand() const;
    unsigned long getCommandTimeoutMs() const;

    // Files
    std::string getStateFile() const;
    std::string getHardwareConfigPath() const;
    std::string getStationsConfigPath() const;
    std::string getLogFile() const;

    // Hardware
    // The configured name, unchecked; empty falls back to the build default.
    std::string getHardwareVariant() const;

    // Logging threshold for the console ("debug", "info", "warning", "error").
    infra::LogLevel getLogLevel() const;

private:
    ConfigManager();

    void parseConfigLine(const std::string &line);
    void applyEnvironmentOverrides();
    void validateSettings() const;
    void log(infra::LogLevel level, const char *fmt, ...) const;

    infra::IFileSystem *m_fileSystem;
    infra::ILogSink *m_logSink;
    EnvironmentProvider m_environment;
    std::string m_settingsPath;
    std::map<std::string, std::string> m_config;
};

#endif // CONFIG_MANAGER_H
