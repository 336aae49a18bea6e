#include "cli_command_router.h"

#include <cctype>

#include "backend_router.h"
#include "command_authorizer.h"
#include "config_loader.h"
#include "config_manager.h"
#include "hardware_config_validator.h"
#include "i2c_address.h"
#include "infra/process_runner.h"
#include "runtime/module_options.h"
#include "state_store.h"
#include "stations_validator.h"

namespace {

class NullPrinter : public CliCommandRouter::IPrinter {
public:
    void print(const std::string &) override {}
    void println(const std::string &) override {}
    void println() override {}
    void printf(const char *, ...) override {}
};

std::string toLower(std::string text)
{
    for (auto &c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

std::string joinFrom(const std::vector<std::string> &args, size_t first)
{
    std::string out;
    for (size_t i = first; i < args.size(); ++i) {
        if (!out.empty()) {
            out += ' ';
        }
        out += args[i];
    }
    return out;
}

std::string trimmed(const std::string &text)
{
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::string();
    }
    return text.substr(start, text.find_last_not_of(" \t\r\n") - start + 1);
}

}  // namespace

CliCommandRouter::CliCommandRouter(const Dependencies &deps)
    : m_deps(deps) {
    if (!m_deps.printer) {
        static NullPrinter nullPrinter;
        m_deps.printer = &nullPrinter;
    }
}

bool CliCommandRouter::handleCommand(const std::string &line) {
    std::vector<std::string> args;
    if (!CommandAuthorizer::splitCommandLine(line, args)) {
        m_deps.printer->println(">>> ERROR: Unbalanced quotes or trailing backslash\n");
        return false;
    }
    return handleArgs(args);
}

bool CliCommandRouter::handleArgs(const std::vector<std::string> &args) {
    if (args.empty()) {
        return true;
    }

    const std::string cmd = toLower(args[0]);

    if (cmd == "help" || cmd == "?") {
        printHelp();
        return true;
    }

    if (cmd == "config" || cmd == "settings") {
        printConfig();
        return true;
    }

    if (cmd == "validate") {
        return handleValidate(args);
    }

    if (cmd == "stations") {
        return listStations(args.size() > 1 ? args[1] : stationsConfigPath());
    }

    if (cmd == "state") {
        return handleState(args);
    }

    if (cmd == "allow") {
        return handleAllow(joinFrom(args, 1));
    }

    if (cmd == "run") {
        return handleRun(joinFrom(args, 1));
    }

    if (cmd == "status") {
        return handleStatus();
    }

    if (cmd == "i2c") {
        if (args.size() != 2) {
            m_deps.printer->println(">>> ERROR: Usage i2c <address>\n");
            return false;
        }
        return handleI2C(args[1]);
    }

    if (cmd == "source-url") {
        return handleSourceUrl(args);
    }

    m_deps.printer->print(">>> Unknown command: ");
    m_deps.printer->println(args[0] + ". Type 'help' for commands.\n");
    return false;
}

void CliCommandRouter::printHelp() {
    m_deps.printer->println("\n=== RADIOCTL COMMANDS ===");
    m_deps.printer->println("help | ?                          - Show this help message");
    m_deps.printer->println("config                            - Show runtime settings");
    m_deps.printer->println("validate hardware [file] [variant] - Validate hardware config");
    m_deps.printer->println("validate stations [file]          - Validate stations directory");
    m_deps.printer->println("stations [file]                   - List banks and stations");
    m_deps.printer->println("state                             - Show persisted playback state");
    m_deps.printer->println("state set <key=value>...          - Update playback state");
    m_deps.printer->println("allow <command>                   - Check a command against the whitelist");
    m_deps.printer->println("run <command>                     - Run a whitelisted command");
    m_deps.printer->println("status                            - Player status as JSON");
    m_deps.printer->println("i2c <address>                     - Parse an I2C address");
    m_deps.printer->println("source-url [url]                  - Show or set the stations source URL");
    m_deps.printer->println();
}

void CliCommandRouter::printConfig() {
    if (!m_deps.config) {
        m_deps.printer->println(">>> ERROR: Settings unavailable\n");
        return;
    }
    const ConfigManager &config = *m_deps.config;
    m_deps.printer->println("\n=== SETTINGS ===");
    m_deps.printer->printf("Settings file:    %s\n", config.settingsPath().c_str());
    m_deps.printer->printf("Bind:             %s:%d\n", config.getBindHost().c_str(), config.getBindPort());
    m_deps.printer->printf("radio-play:       %s\n", config.getRadioPlayCommand().c_str());
    m_deps.printer->printf("Command timeout:  %lu ms\n", config.getCommandTimeoutMs());
    m_deps.printer->printf("State file:       %s\n", config.getStateFile().c_str());
    m_deps.printer->printf("Hardware config:  %s\n", config.getHardwareConfigPath().c_str());
    m_deps.printer->printf("Hardware variant: %s\n", config.getHardwareVariant().c_str());
    m_deps.printer->printf("Stations config:  %s\n", config.getStationsConfigPath().c_str());
    m_deps.printer->printf("Log file:         %s\n\n",
                           config.getLogFile().empty() ? "(none)" : config.getLogFile().c_str());
}

bool CliCommandRouter::handleValidate(const std::vector<std::string> &args) {
    const std::string target = args.size() > 1 ? toLower(args[1]) : std::string();
    if (target == "hardware") {
        return validateHardware(args.size() > 2 ? args[2] : hardwareConfigPath(),
                                args.size() > 3 ? args[3] : hardwareVariant());
    }
    if (target == "stations") {
        return validateStations(args.size() > 2 ? args[2] : stationsConfigPath());
    }
    m_deps.printer->println(">>> ERROR: Usage validate hardware|stations [file]\n");
    return false;
}

bool CliCommandRouter::validateHardware(const std::string &path, const std::string &variant) {
    if (!m_deps.configLoader) {
        m_deps.printer->println(">>> ERROR: Config loader unavailable\n");
        return false;
    }
    ConfigValue tree;
    if (!m_deps.configLoader->load(path, tree)) {
        m_deps.printer->printf(">>> ERROR: %s\n\n", m_deps.configLoader->lastError().c_str());
        return false;
    }

    std::vector<ValidationError> errors = validateHardwareConfig(tree, variant);
    if (!errors.empty()) {
        m_deps.printer->printf(">>> %s: %u problem(s) for variant %s\n", path.c_str(),
                               static_cast<unsigned>(errors.size()), variant.c_str());
        for (const auto &error : errors) {
            m_deps.printer->println("  - " + error.message);
        }
        m_deps.printer->println();
        return false;
    }
    m_deps.printer->printf(">>> %s: hardware config valid (%s)\n\n", path.c_str(), variant.c_str());
    return true;
}

bool CliCommandRouter::validateStations(const std::string &path) {
    if (!m_deps.configLoader) {
        m_deps.printer->println(">>> ERROR: Config loader unavailable\n");
        return false;
    }
    ConfigValue tree;
    if (!m_deps.configLoader->load(path, tree)) {
        m_deps.printer->printf(">>> ERROR: %s\n\n", m_deps.configLoader->lastError().c_str());
        return false;
    }

    std::vector<ValidationError> errors = validateStationsConfig(tree);
    if (!errors.empty()) {
        m_deps.printer->printf(">>> %s: %u problem(s)\n", path.c_str(), static_cast<unsigned>(errors.size()));
        for (const auto &error : errors) {
            m_deps.printer->println("  - " + error.message);
        }
        m_deps.printer->println();
        return false;
    }
    m_deps.printer->printf(">>> %s: stations directory valid\n\n", path.c_str());
    return true;
}

bool CliCommandRouter::listStations(const std::string &path) {
    if (!m_deps.configLoader) {
        m_deps.printer->println(">>> ERROR: Config loader unavailable\n");
        return false;
    }
    ConfigValue tree;
    if (!m_deps.configLoader->load(path, tree)) {
        m_deps.printer->printf(">>> ERROR: %s\n\n", m_deps.configLoader->lastError().c_str());
        return false;
    }
    StationsDirectory directory;
    if (!buildStationsDirectory(tree, directory)) {
        m_deps.printer->printf(">>> ERROR: %s is not a valid stations directory (try 'validate stations')\n\n",
                               path.c_str());
        return false;
    }

    m_deps.printer->println("\n=== STATIONS ===");
    for (const auto &bank : directory.banks) {
        m_deps.printer->printf("Bank %d: %s\n", bank.first, bank.second.name.c_str());
        for (const auto &station : bank.second.stations) {
            m_deps.printer->printf("  %2d  %s  %s\n", station.first, station.second.name.c_str(),
                                   station.second.url.c_str());
        }
    }
    m_deps.printer->printf("%u bank(s), %u station(s)\n\n", static_cast<unsigned>(directory.banks.size()),
                           static_cast<unsigned>(directory.stationCount()));
    return true;
}

bool CliCommandRouter::handleState(const std::vector<std::string> &args) {
    if (!m_deps.stateStore) {
        m_deps.printer->println(">>> ERROR: State store unavailable\n");
        return false;
    }
    const std::string path = stateFilePath();

    if (args.size() == 1) {
        StateRecord record;
        StateReadStatus status = m_deps.stateStore->load(path, record);
        if (status == StateReadStatus::IoError) {
            m_deps.printer->printf(">>> ERROR: Failed to read %s\n\n", path.c_str());
            return false;
        }
        if (status == StateReadStatus::NotFound) {
            m_deps.printer->printf(">>> No state file at %s\n\n", path.c_str());
            return true;
        }
        for (const auto &entry : record) {
            m_deps.printer->println(entry.first + "=" + entry.second);
        }
        return true;
    }

    if (toLower(args[1]) != "set" || args.size() < 3) {
        m_deps.printer->println(">>> ERROR: Usage state | state set <key=value>...\n");
        return false;
    }

    StateUpdate update;
    for (size_t i = 2; i < args.size(); ++i) {
        size_t separator = args[i].find('=');
        if (separator == std::string::npos || separator == 0) {
            m_deps.printer->printf(">>> ERROR: Expected key=value, got '%s'\n\n", args[i].c_str());
            return false;
        }
        update.set(args[i].substr(0, separator), args[i].substr(separator + 1));
    }
    if (!m_deps.stateStore->write(path, update)) {
        m_deps.printer->printf(">>> ERROR: Failed to update %s\n\n", path.c_str());
        return false;
    }
    m_deps.printer->printf(">>> Updated %u key(s) in %s\n\n", static_cast<unsigned>(update.values().size()),
                           path.c_str());
    return true;
}

bool CliCommandRouter::handleAllow(const std::string &command) {
    if (!m_deps.authorizer) {
        m_deps.printer->println(">>> ERROR: Command authorizer unavailable\n");
        return false;
    }
    bool allowed = m_deps.authorizer->isAllowed(command);
    m_deps.printer->printf("%s: %s\n", allowed ? "ALLOWED" : "FORBIDDEN", command.c_str());
    return allowed;
}

bool CliCommandRouter::handleRun(const std::string &command) {
    if (!m_deps.authorizer || !m_deps.runner) {
        m_deps.printer->println(">>> ERROR: Command execution unavailable\n");
        return false;
    }

    std::vector<std::string> argv;
    CommandDecision decision = m_deps.authorizer->prepare(command, argv);
    if (decision != CommandDecision::Allowed) {
        m_deps.printer->printf(">>> ERROR: Command not allowed (%s): %s\n\n", commandDecisionName(decision),
                               command.c_str());
        return false;
    }

    infra::ProcessResult result = m_deps.runner->run(argv, commandTimeoutMs());
    if (result.status != infra::ProcessStatus::Exited) {
        m_deps.printer->printf(">>> ERROR: %s: %s\n\n", argv[0].c_str(), infra::processStatusName(result.status));
        return false;
    }

    std::string output = trimmed(result.stdoutText);
    if (!output.empty()) {
        m_deps.printer->println(output);
    }
    if (result.exitCode != 0) {
        std::string errorText = trimmed(result.stderrText);
        m_deps.printer->printf(">>> ERROR: exit code %d%s%s\n\n", result.exitCode, errorText.empty() ? "" : ": ",
                               errorText.c_str());
        return false;
    }
    return true;
}

bool CliCommandRouter::handleStatus() {
    if (!m_deps.backend) {
        m_deps.printer->println(">>> ERROR: Backend unavailable\n");
        return false;
    }
    BackendResponse response = m_deps.backend->handle("POST", "/status", std::string());
    m_deps.printer->println(response.body);
    return response.status == HttpStatus::OK;
}

bool CliCommandRouter::handleI2C(const std::string &value) {
    I2CAddressResult result = parseI2CAddressText(value);
    if (!result.ok()) {
        m_deps.printer->printf(">>> ERROR: '%s': %s (%s)\n\n", value.c_str(), i2cAddressStatusName(result.status),
                               result.detail.c_str());
        return false;
    }
    m_deps.printer->printf("0x%02llX (%lld)\n", static_cast<unsigned long long>(result.address), result.address);
    return true;
}

bool CliCommandRouter::handleSourceUrl(const std::vector<std::string> &args) {
    if (!m_deps.configLoader) {
        m_deps.printer->println(">>> ERROR: Config loader unavailable\n");
        return false;
    }
    const std::string path = hardwareConfigPath();

    if (args.size() == 1) {
        ConfigValue tree;
        if (!m_deps.configLoader->load(path, tree)) {
            m_deps.printer->printf(">>> ERROR: %s\n\n", m_deps.configLoader->lastError().c_str());
            return false;
        }
        const ConfigValue *url = ConfigLoader::lookup(tree, "sources.stations_url");
        m_deps.printer->println(url && url->isString() ? url->asString() : std::string("(not set)"));
        return true;
    }

    const std::string &url = args[1];
    if (args.size() > 2 || !BackendRouter::isValidSourceUrl(url)) {
        m_deps.printer->println(">>> ERROR: URL must start with http:// or https://\n");
        return false;
    }
    if (!m_deps.configLoader->updateValue(path, "sources.stations_url", ConfigValue::makeString(url))) {
        m_deps.printer->printf(">>> ERROR: %s\n\n", m_deps.configLoader->lastError().c_str());
        return false;
    }
    m_deps.printer->printf(">>> Stations source set to %s\n\n", url.c_str());
    return true;
}

std::string CliCommandRouter::hardwareConfigPath() const {
    return m_deps.config ? m_deps.config->getHardwareConfigPath() : std::string("/home/radio/hardware-config.json");
}

std::string CliCommandRouter::stationsConfigPath() const {
    return m_deps.config ? m_deps.config->getStationsConfigPath() : std::string("/home/radio/stations.json");
}

std::string CliCommandRouter::stateFilePath() const {
    return m_deps.config ? m_deps.config->getStateFile() : std::string("/home/radio/.radio-state");
}

std::string CliCommandRouter::hardwareVariant() const {
    return m_deps.config ? m_deps.config->getHardwareVariant() : std::string(RADIO_DEFAULT_HARDWARE_VARIANT);
}

unsigned long CliCommandRouter::commandTimeoutMs() const {
    return m_deps.config ? m_deps.config->getCommandTimeoutMs() : 10000;
}
