#include "backend_router.h"

#include <ArduinoJson.h>
#include <regex>
#include <vector>

#include "command_authorizer.h"
#include "config_loader.h"
#include "infra/process_runner.h"
#include "logging_manager.h"
#include "state_store.h"

static constexpr const char* TAG = "Backend";

namespace {

constexpr const char* SOURCE_URL_KEY = "sources.stations_url";

std::string trim(const std::string &text)
{
    const char *whitespace = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

BackendResponse sendJson(int status, const JsonDocument &doc)
{
    BackendResponse response;
    response.status = status;
    serializeJson(doc, response.body);
    return response;
}

// errorType may be null for soft failures that carry only a message.
BackendResponse sendError(int status, const std::string &message, const char *errorType)
{
    JsonDocument doc;
    doc["success"] = false;
    doc["error"] = message;
    if (errorType) {
        doc["error_type"] = errorType;
    }
    return sendJson(status, doc);
}

// Empty bodies count as {} on every route that takes one.
bool readJsonBody(const std::string &body, JsonDocument &doc, BackendResponse &error)
{
    if (trim(body).empty()) {
        doc.to<JsonObject>();
        return true;
    }
    DeserializationError result = deserializeJson(doc, body);
    if (result || !doc.is<JsonObject>()) {
        LOG_WARN(TAG, "Rejected request body (%s)", result ? result.c_str() : "not an object");
        error = sendError(HttpStatus::BAD_REQUEST, "Invalid request format", ErrorTypes::INVALID_REQUEST);
        return false;
    }
    return true;
}

// Maps runner failures other than a clean exit to the route's error response.
BackendResponse sendProcessFailure(const infra::ProcessResult &result, const std::string &what,
                                   const char *timeoutMessage)
{
    switch (result.status) {
        case infra::ProcessStatus::TimedOut:
            return sendError(HttpStatus::GATEWAY_TIMEOUT, timeoutMessage, ErrorTypes::TIMEOUT);
        case infra::ProcessStatus::NotFound:
            return sendError(HttpStatus::INTERNAL_ERROR, "Command not found: " + what, ErrorTypes::COMMAND_NOT_FOUND);
        case infra::ProcessStatus::SpawnFailed:
        case infra::ProcessStatus::Exited:
            break;
    }
    std::string detail = trim(result.stderrText);
    return sendError(HttpStatus::INTERNAL_ERROR,
                     "Failed to start " + what + (detail.empty() ? std::string() : ": " + detail),
                     ErrorTypes::SPAWN_FAILED);
}

int parseIntOr(const std::string &text, int fallback)
{
    long long value = 0;
    if (!ConfigValue::parseIntegerKey(text, value)) {
        return fallback;
    }
    return static_cast<int>(value);
}

}  // namespace

BackendRouter::BackendRouter(const Dependencies &deps)
    : m_deps(deps)
{
}

BackendResponse BackendRouter::handle(const std::string &method, const std::string &path, const std::string &body)
{
    LOG_DEBUG(TAG, "%s %s", method.c_str(), path.c_str());

    if (method == "GET") {
        if (path == "/config") {
            return handleConfig();
        }
        if (path == "/source-url") {
            return handleGetSourceUrl();
        }
    } else if (method == "POST") {
        if (path == "/command") {
            return handleCommand(body);
        }
        if (path == "/status") {
            return handleStatus(body);
        }
        if (path == "/state") {
            return handleState(body);
        }
        if (path == "/source-url") {
            return handleSetSourceUrl(body);
        }
    }

    LOG_INFO(TAG, "No route for %s %s", method.c_str(), path.c_str());
    return sendError(HttpStatus::NOT_FOUND, "Not found: " + path, ErrorTypes::NOT_FOUND);
}

BackendResponse BackendRouter::handleCommand(const std::string &body)
{
    JsonDocument request;
    BackendResponse error;
    if (!readJsonBody(body, request, error)) {
        return error;
    }

    JsonVariantConst field = request.as<JsonObjectConst>()["command"];
    if (!field.isNull() && !field.is<const char*>()) {
        return sendError(HttpStatus::BAD_REQUEST, "Invalid request format", ErrorTypes::INVALID_REQUEST);
    }
    const std::string command = field.isNull() ? std::string() : field.as<const char*>();

    std::vector<std::string> argv;
    CommandDecision decision = m_deps.authorizer ? m_deps.authorizer->prepare(command, argv)
                                                 : CommandDecision::Forbidden;
    if (decision == CommandDecision::Forbidden) {
        return sendError(HttpStatus::FORBIDDEN, "Command not allowed: " + command, ErrorTypes::FORBIDDEN_COMMAND);
    }
    if (decision == CommandDecision::LexFailure || argv.empty()) {
        return sendError(HttpStatus::BAD_REQUEST, "Command could not be parsed: " + command,
                         ErrorTypes::INVALID_REQUEST);
    }
    if (!m_deps.runner) {
        LOG_ERROR(TAG, "No process runner configured");
        return sendError(HttpStatus::INTERNAL_ERROR, "Failed to start " + argv[0], ErrorTypes::SPAWN_FAILED);
    }

    infra::ProcessResult result = m_deps.runner->run(argv, m_deps.settings.commandTimeoutMs);
    if (result.status != infra::ProcessStatus::Exited) {
        LOG_WARN(TAG, "Command '%s' did not run: %s", command.c_str(), infra::processStatusName(result.status));
        return sendProcessFailure(result, argv[0], "Command timed out");
    }

    JsonDocument doc;
    if (result.exitCode == 0) {
        doc["success"] = true;
        doc["output"] = trim(result.stdoutText);
        doc["command"] = command;
        LOG_INFO(TAG, "Ran '%s'", command.c_str());
    } else {
        std::string stderrText = trim(result.stderrText);
        doc["success"] = false;
        doc["error"] = stderrText.empty() ? std::string("Command failed") : stderrText;
        doc["error_type"] = ErrorTypes::COMMAND_FAILED;
        doc["exit_code"] = result.exitCode;
        LOG_WARN(TAG, "'%s' exited with %d", command.c_str(), result.exitCode);
    }
    return sendJson(HttpStatus::OK, doc);
}

BackendResponse BackendRouter::handleStatus(const std::string &body)
{
    JsonDocument request;
    BackendResponse error;
    if (!readJsonBody(body, request, error)) {
        return error;
    }
    if (!m_deps.runner) {
        LOG_ERROR(TAG, "No process runner configured");
        return sendError(HttpStatus::INTERNAL_ERROR, "Failed to start mpc", ErrorTypes::SPAWN_FAILED);
    }

    const unsigned long timeoutMs = m_deps.settings.commandTimeoutMs;
    infra::ProcessResult current = m_deps.runner->run({"mpc", "current"}, timeoutMs);
    if (current.status != infra::ProcessStatus::Exited) {
        return sendProcessFailure(current, "mpc", "Timeout getting status");
    }
    infra::ProcessResult status = m_deps.runner->run({"mpc", "status"}, timeoutMs);
    if (status.status != infra::ProcessStatus::Exited) {
        return sendProcessFailure(status, "mpc", "Timeout getting status");
    }

    const std::string &statusText = status.stdoutText;
    JsonDocument doc;
    doc["success"] = true;
    doc["current_track"] = current.exitCode == 0 ? trim(current.stdoutText) : std::string();
    doc["is_playing"] = statusText.find("[playing]") != std::string::npos;
    doc["is_paused"] = statusText.find("[paused]") != std::string::npos;
    doc["volume"] = parseVolume(statusText);
    return sendJson(HttpStatus::OK, doc);
}

BackendResponse BackendRouter::handleState(const std::string &body)
{
    JsonDocument request;
    BackendResponse error;
    if (!readJsonBody(body, request, error)) {
        return error;
    }

    const std::string &path = m_deps.settings.stateFile;
    StateRecord record;
    StateReadStatus readStatus = m_deps.stateStore ? m_deps.stateStore->load(path, record)
                                                   : StateReadStatus::IoError;
    if (readStatus == StateReadStatus::NotFound) {
        return sendError(HttpStatus::OK, "State file not found: " + path, nullptr);
    }
    if (readStatus == StateReadStatus::IoError) {
        return sendError(HttpStatus::INTERNAL_ERROR, "Failed to read state file: " + path, ErrorTypes::IO_ERROR);
    }

    auto field = [&record](const char *key, const char *fallback) {
        auto it = record.find(key);
        return it == record.end() ? std::string(fallback) : it->second;
    };

    JsonDocument doc;
    doc["success"] = true;
    doc["bank"] = parseIntOr(field("current_bank", "0"), 0);
    doc["station"] = parseIntOr(field("current_station", "0"), 0);
    doc["bank_name"] = field("bank_name", "");
    doc["station_name"] = field("station_name", "");
    doc["playback_state"] = field("playback_state", "stopped");
    return sendJson(HttpStatus::OK, doc);
}

BackendResponse BackendRouter::handleConfig() const
{
    JsonDocument doc;
    doc["mode"] = "local";
    doc["bind_host"] = m_deps.settings.bindHost;
    doc["bind_port"] = m_deps.settings.bindPort;
    doc["radio_play_cmd"] = m_deps.settings.radioPlayCommand;
    return sendJson(HttpStatus::OK, doc);
}

BackendResponse BackendRouter::handleGetSourceUrl()
{
    if (!m_deps.configLoader) {
        return sendError(HttpStatus::INTERNAL_ERROR, "Hardware config unavailable", ErrorTypes::IO_ERROR);
    }
    ConfigValue tree;
    if (!m_deps.configLoader->load(m_deps.settings.hardwareConfigPath, tree)) {
        return sendError(HttpStatus::INTERNAL_ERROR, m_deps.configLoader->lastError(), ErrorTypes::IO_ERROR);
    }

    const ConfigValue *url = ConfigLoader::lookup(tree, SOURCE_URL_KEY);
    JsonDocument doc;
    doc["success"] = true;
    doc["url"] = (url && url->isString()) ? url->asString() : std::string();
    return sendJson(HttpStatus::OK, doc);
}

BackendResponse BackendRouter::handleSetSourceUrl(const std::string &body)
{
    JsonDocument request;
    BackendResponse error;
    if (!readJsonBody(body, request, error)) {
        return error;
    }

    JsonVariantConst field = request.as<JsonObjectConst>()["url"];
    const std::string url = field.is<const char*>() ? trim(field.as<const char*>()) : std::string();
    if (!isValidSourceUrl(url)) {
        return sendError(HttpStatus::BAD_REQUEST, "URL must start with http:// or https://", ErrorTypes::INVALID_URL);
    }
    if (!m_deps.configLoader) {
        return sendError(HttpStatus::INTERNAL_ERROR, "Hardware config unavailable", ErrorTypes::IO_ERROR);
    }
    if (!m_deps.configLoader->updateValue(m_deps.settings.hardwareConfigPath, SOURCE_URL_KEY,
                                          ConfigValue::makeString(url))) {
        return sendError(HttpStatus::INTERNAL_ERROR, m_deps.configLoader->lastError(), ErrorTypes::IO_ERROR);
    }

    LOG_INFO(TAG, "Stations source set to %s", url.c_str());
    JsonDocument doc;
    doc["success"] = true;
    doc["url"] = url;
    return sendJson(HttpStatus::OK, doc);
}

bool BackendRouter::isValidSourceUrl(const std::string &url)
{
    size_t prefix = 0;
    if (url.compare(0, 7, "http://") == 0) {
        prefix = 7;
    } else if (url.compare(0, 8, "https://") == 0) {
        prefix = 8;
    } else {
        return false;
    }
    if (url.size() == prefix) {
        return false;
    }
    for (char c : url) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            return false;
        }
    }
    return true;
}

int BackendRouter::parseVolume(const std::string &statusText, int fallback)
{
    static const std::regex volumePattern(R"(volume:\s*(\d+)%)");
    std::smatch match;
    if (!std::regex_search(statusText, match, volumePattern)) {
        return fallback;
    }
    return parseIntOr(match[1].str(), fallback);
}
