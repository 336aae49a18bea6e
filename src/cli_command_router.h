#ifndef CLI_COMMAND_ROUTER_H
#define CLI_COMMAND_ROUTER_H

#include <string>
#include <vector>

class BackendRouter;
class CommandAuthorizer;
class ConfigLoader;
class ConfigManager;
class StateStore;

namespace infra {
class IProcessRunner;
}

class CliCommandRouter {
public:
    class IPrinter {
    public:
        virtual ~IPrinter() = default;
        virtual void print(const std::string &value) = 0;
        virtual void println(const std::string &value) = 0;
        virtual void println() = 0;
        virtual void printf(const char *fmt, ...) = 0;
    };

    struct Dependencies {
        ConfigManager *config = nullptr;
        IPrinter *printer = nullptr;
        ConfigLoader *configLoader = nullptr;
        StateStore *stateStore = nullptr;
        const CommandAuthorizer *authorizer = nullptr;
        infra::IProcessRunner *runner = nullptr;
        BackendRouter *backend = nullptr;
    };

    explicit CliCommandRouter(const Dependencies &deps);

    // Returns true when the command succeeded; radioctl maps that to its
    // exit status.
    bool handleCommand(const std::string &line);
    bool handleArgs(const std::vector<std::string> &args);

private:
    void printHelp();
    void printConfig();
    bool handleValidate(const std::vector<std::string> &args);
    bool validateHardware(const std::string &path, const std::string &variant);
    bool validateStations(const std::string &path);
    bool listStations(const std::string &path);
    bool handleState(const std::vector<std::string> &args);
    bool handleAllow(const std::string &command);
    bool handleRun(const std::string &command);
    bool handleStatus();
    bool handleI2C(const std::string &value);
    bool handleSourceUrl(const std::vector<std::string> &args);

    std::string hardwareConfigPath() const;
    std::string stationsConfigPath() const;
    std::string stateFilePath() const;
    std::string hardwareVariant() const;
    unsigned long commandTimeoutMs() const;

    Dependencies m_deps;
};

#endif  // CLI_COMMAND_ROUTER_H
