#ifndef COMMAND_AUTHORIZER_H
#define COMMAND_AUTHORIZER_H

#include <map>
#include <regex>
#include <string>
#include <vector>

#include "runtime/module_options.h"

enum class CommandDecision : unsigned char {
    Allowed = 0,
    Forbidden,    // no whitelist pattern matched
    LexFailure    // matched, but the text could not be split into arguments
};

// Whitelist gate for commands arriving over the network. Admission is a full
// match of the trimmed text against an ordered pattern table; nothing about
// the requester is considered.
class CommandAuthorizer {
public:
    struct Options {
        bool allowShutdown = RADIO_ENABLE_SHUTDOWN_COMMAND != 0;
        std::string radioPlayCommand = "radio-play";
    };

    CommandAuthorizer();
    explicit CommandAuthorizer(const Options &options);

    bool isAllowed(const std::string &command) const;

    // Shell-style split, then swaps a logical executable name for its
    // configured path. Does not authorize.
    bool toExecutable(const std::string &command, std::vector<std::string> &argv) const;

    // Authorization first, then lexing.
    CommandDecision prepare(const std::string &command, std::vector<std::string> &argv) const;

    size_t patternCount() const { return m_patterns.size(); }
    const std::vector<std::string> &patternSources() const { return m_sources; }

    // POSIX shell word splitting without expansion. False on an unterminated
    // quote or a trailing backslash.
    static bool splitCommandLine(const std::string &command, std::vector<std::string> &argv);

private:
    void addPattern(const char *source);

    std::vector<std::regex> m_patterns;
    std::vector<std::string> m_sources;
    std::map<std::string, std::string> m_aliases;
};

const char *commandDecisionName(CommandDecision decision);

#endif // COMMAND_AUTHORIZER_H
