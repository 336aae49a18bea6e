#ifndef APP_CONTROLLER_H
#define APP_CONTROLLER_H

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "cli_command_router.h"
#include "runtime/module_options.h"

class BackendRouter;
class CliService;
class CommandAuthorizer;
class ConfigLoader;
class StateStore;

namespace infra {
class IFileSystem;
class ILogSink;
class IProcessRunner;
}  // namespace infra

// Wires settings, logging and the control-plane services together for
// radioctl (one-shot commands or the interactive shell).
class AppController {
public:
    struct ModuleOptions {
        bool enableCli = RADIO_ENABLE_CLI;
        bool allowShutdownCommand = RADIO_ENABLE_SHUTDOWN_COMMAND != 0;

        static ModuleOptions DefaultsFromBuildFlags();
    };

    // Anything left null is created with the POSIX implementation.
    struct ModuleProviders {
        infra::IFileSystem* fileSystem = nullptr;
        infra::IProcessRunner* processRunner = nullptr;
        CliCommandRouter::IPrinter* printer = nullptr;
    };

    AppController(infra::ILogSink* logSink, ModuleOptions options, ModuleProviders providers);
    ~AppController();

    bool setup(const std::string& settingsPath);

    // Exit status for radioctl: 0 on success, 1 on failure.
    int runCommand(const std::vector<std::string>& args);
    int runInteractive(std::FILE* input);

    bool isInitialized() const { return m_initialized; }
    BackendRouter* backend() const { return m_backend.get(); }

private:
    class StreamPrinter;

    void setupLogging();
    bool loadConfiguration(const std::string& settingsPath);
    void initializeServices();
    void configureCliRouter();

    ModuleOptions m_options;
    ModuleProviders m_providers;
    infra::ILogSink* m_logSink;

    bool m_initialized = false;

    std::unique_ptr<infra::IFileSystem> m_fileSystemOwned;
    infra::IFileSystem* m_fileSystem = nullptr;

    std::unique_ptr<infra::IProcessRunner> m_processRunnerOwned;
    infra::IProcessRunner* m_processRunner = nullptr;

    std::unique_ptr<StreamPrinter> m_printerOwned;
    CliCommandRouter::IPrinter* m_printer = nullptr;

    std::unique_ptr<ConfigLoader> m_configLoader;
    std::unique_ptr<StateStore> m_stateStore;
    std::unique_ptr<CommandAuthorizer> m_authorizer;
    std::unique_ptr<BackendRouter> m_backend;
    std::unique_ptr<CliCommandRouter> m_cliRouter;
};

#endif  // APP_CONTROLLER_H
