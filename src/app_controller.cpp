#include "app_controller.h"

#include <cstdarg>
#include <memory>

#include "backend_router.h"
#include "cli_service.h"
#include "command_authorizer.h"
#include "config_loader.h"
#include "config_manager.h"
#include "infra/log_sink.h"
#include "infra/posix_filesystem.h"
#include "infra/posix_process_runner.h"
#include "logging_manager.h"
#include "state_store.h"

static constexpr const char* TAG = "App";

class AppController::StreamPrinter : public CliCommandRouter::IPrinter {
public:
    explicit StreamPrinter(std::FILE* stream) : m_stream(stream) {}

    void print(const std::string& value) override {
        std::fputs(value.c_str(), m_stream);
    }

    void println(const std::string& value) override {
        std::fputs(value.c_str(), m_stream);
        std::fputc('\n', m_stream);
    }

    void println() override {
        std::fputc('\n', m_stream);
    }

    void printf(const char* fmt, ...) override {
        if (!fmt) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        std::vfprintf(m_stream, fmt, args);
        va_end(args);
    }

private:
    std::FILE* m_stream;
};

AppController::ModuleOptions AppController::ModuleOptions::DefaultsFromBuildFlags() {
    return ModuleOptions();
}

AppController::AppController(infra::ILogSink* logSink, ModuleOptions options, ModuleProviders providers)
    : m_options(options),
      m_providers(providers),
      m_logSink(logSink) {}

AppController::~AppController() {
    if (m_logSink && infra::getLogSink() == m_logSink) {
        infra::setLogSink(nullptr);
    }
}

bool AppController::setup(const std::string& settingsPath) {
    setupLogging();

    if (m_providers.fileSystem) {
        m_fileSystem = m_providers.fileSystem;
    } else {
        m_fileSystemOwned = std::make_unique<infra::PosixFileSystem>();
        m_fileSystem = m_fileSystemOwned.get();
    }

    if (!loadConfiguration(settingsPath)) {
        LOG_ERROR(TAG, "Settings could not be loaded from %s", settingsPath.c_str());
        return false;
    }

    initializeServices();
    configureCliRouter();

    m_initialized = true;
    LOG_DEBUG(TAG, "Control plane ready");
    return true;
}

void AppController::setupLogging() {
    if (m_logSink) {
        infra::setLogSink(m_logSink);
    }
    LoggingManager::instance().begin(stderr);
    LoggingManager::instance().setMinimumLevel(infra::LogLevel::Warn);
}

bool AppController::loadConfiguration(const std::string& settingsPath) {
    ConfigManager& config = ConfigManager::getInstance();
    config.setFileSystem(m_fileSystem);
    if (!config.loadConfig(settingsPath)) {
        return false;
    }

    LoggingManager& logging = LoggingManager::instance();
    logging.setMinimumLevel(config.getLogLevel());
    if (!config.getLogFile().empty()) {
        logging.setLogFile(config.getLogFile());
    }
    return true;
}

void AppController::initializeServices() {
    ConfigManager& config = ConfigManager::getInstance();

    if (m_providers.processRunner) {
        m_processRunner = m_providers.processRunner;
    } else {
        m_processRunnerOwned = std::make_unique<infra::PosixProcessRunner>();
        m_processRunner = m_processRunnerOwned.get();
    }

    CommandAuthorizer::Options authOptions;
    authOptions.allowShutdown = m_options.allowShutdownCommand;
    authOptions.radioPlayCommand = config.getRadioPlayCommand();
    m_authorizer = std::make_unique<CommandAuthorizer>(authOptions);
    LOG_DEBUG(TAG, "Command whitelist has %u pattern(s)", static_cast<unsigned>(m_authorizer->patternCount()));

    m_configLoader = std::make_unique<ConfigLoader>(*m_fileSystem);
    m_stateStore = std::make_unique<StateStore>(*m_fileSystem);

    BackendRouter::Dependencies backendDeps;
    backendDeps.authorizer = m_authorizer.get();
    backendDeps.runner = m_processRunner;
    backendDeps.stateStore = m_stateStore.get();
    backendDeps.configLoader = m_configLoader.get();
    backendDeps.settings.bindHost = config.getBindHost();
    backendDeps.settings.bindPort = config.getBindPort();
    backendDeps.settings.radioPlayCommand = config.getRadioPlayCommand();
    backendDeps.settings.stateFile = config.getStateFile();
    backendDeps.settings.hardwareConfigPath = config.getHardwareConfigPath();
    backendDeps.settings.commandTimeoutMs = config.getCommandTimeoutMs();
    m_backend = std::make_unique<BackendRouter>(backendDeps);
}

void AppController::configureCliRouter() {
    if (m_providers.printer) {
        m_printer = m_providers.printer;
    } else {
        m_printerOwned = std::make_unique<StreamPrinter>(stdout);
        m_printer = m_printerOwned.get();
    }

    CliCommandRouter::Dependencies deps;
    deps.config = &ConfigManager::getInstance();
    deps.printer = m_printer;
    deps.configLoader = m_configLoader.get();
    deps.stateStore = m_stateStore.get();
    deps.authorizer = m_authorizer.get();
    deps.runner = m_processRunner;
    deps.backend = m_backend.get();
    m_cliRouter = std::make_unique<CliCommandRouter>(deps);
}

int AppController::runCommand(const std::vector<std::string>& args) {
    if (!m_initialized) {
        LOG_ERROR(TAG, "runCommand called before setup");
        return 1;
    }
    return m_cliRouter->handleArgs(args) ? 0 : 1;
}

int AppController::runInteractive(std::FILE* input) {
    if (!m_initialized) {
        LOG_ERROR(TAG, "runInteractive called before setup");
        return 1;
    }
    if (!m_options.enableCli) {
        m_printer->println(">>> Interactive shell disabled in this build\n");
        return 1;
    }

    bool lastOk = true;
    CliService service(input, [this, &lastOk](const std::string& line) {
        lastOk = m_cliRouter->handleCommand(line);
    });
    m_printer->println("radioctl shell. Type 'help' for commands, Ctrl-D to exit.");
    while (service.poll()) {
    }
    return lastOk ? 0 : 1;
}
