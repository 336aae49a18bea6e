#ifndef BACKEND_ROUTER_H
#define BACKEND_ROUTER_H

#include <string>

class CommandAuthorizer;
class ConfigLoader;
class StateStore;

namespace infra {
class IProcessRunner;
}

namespace ErrorTypes {
    constexpr const char* FORBIDDEN_COMMAND = "forbidden_command";
    constexpr const char* COMMAND_FAILED = "command_failed";
    constexpr const char* TIMEOUT = "timeout";
    constexpr const char* COMMAND_NOT_FOUND = "command_not_found";
    constexpr const char* SPAWN_FAILED = "spawn_failed";
    constexpr const char* INVALID_REQUEST = "invalid_request";
    constexpr const char* INVALID_URL = "invalid_url";
    constexpr const char* IO_ERROR = "io_error";
    constexpr const char* NOT_FOUND = "not_found";
}

namespace HttpStatus {
    constexpr int OK = 200;
    constexpr int BAD_REQUEST = 400;
    constexpr int FORBIDDEN = 403;
    constexpr int NOT_FOUND = 404;
    constexpr int INTERNAL_ERROR = 500;
    constexpr int GATEWAY_TIMEOUT = 504;
}

struct BackendResponse {
    int status = HttpStatus::OK;
    std::string body;  // JSON document
};

// JSON request handling behind the appliance's local HTTP endpoint. The
// socket layer hands over method, path and raw body and writes back the
// status and body unchanged. Requests are handled one at a time.
class BackendRouter {
public:
    struct Settings {
        std::string bindHost = "0.0.0.0";
        int bindPort = 8080;
        std::string radioPlayCommand = "radio-play";
        std::string stateFile;
        std::string hardwareConfigPath;
        unsigned long commandTimeoutMs = 10000;
    };

    struct Dependencies {
        const CommandAuthorizer *authorizer = nullptr;
        infra::IProcessRunner *runner = nullptr;
        StateStore *stateStore = nullptr;
        ConfigLoader *configLoader = nullptr;
        Settings settings;
    };

    explicit BackendRouter(const Dependencies &deps);

    BackendResponse handle(const std::string &method, const std::string &path, const std::string &body);

    BackendResponse handleCommand(const std::string &body);
    BackendResponse handleStatus(const std::string &body);
    BackendResponse handleState(const std::string &body);
    BackendResponse handleConfig() const;
    BackendResponse handleGetSourceUrl();
    BackendResponse handleSetSourceUrl(const std::string &body);

    static bool isValidSourceUrl(const std::string &url);
    // Volume percentage from `mpc status` output; fallback when absent.
    static int parseVolume(const std::string &statusText, int fallback = 50);

private:
    Dependencies m_deps;
};

#endif // BACKEND_ROUTER_H
