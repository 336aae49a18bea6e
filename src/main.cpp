#ifndef UNIT_TEST

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "app_controller.h"
#include "config_manager.h"
#include "infra/log_sink.h"

namespace {

void printUsage() {
    std::fprintf(stderr, "usage: radioctl [--settings <file>] [command [args...]]\n"
                         "       radioctl help\n");
}

}  // namespace

int main(int argc, char** argv) {
    std::string settingsPath = ConfigManager::kDefaultSettingsPath;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        if (args.empty() && std::strcmp(argv[i], "--settings") == 0) {
            if (i + 1 >= argc) {
                printUsage();
                return 1;
            }
            settingsPath = argv[++i];
            continue;
        }
        if (args.empty() && (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0)) {
            printUsage();
            return 0;
        }
        args.push_back(argv[i]);
    }

    AppController app(infra::getLogSink(),
                      AppController::ModuleOptions::DefaultsFromBuildFlags(),
                      AppController::ModuleProviders{});
    if (!app.setup(settingsPath)) {
        return 1;
    }

    if (args.empty()) {
        return app.runInteractive(stdin);
    }
    return app.runCommand(args);
}

#endif  // UNIT_TEST
