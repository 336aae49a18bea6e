#include "command_authorizer.h"

#include "logging_manager.h"

static constexpr const char* TAG = "CommandAuth";

namespace {

const char *const kBasePatterns[] = {
    R"(^mpc\s+(play|pause|stop|next|prev|volume\s+\d{1,3})$)",
    R"(^radio-play\s+\d+\s+\d+$)",
};

const char *const kShutdownPattern = R"(^sudo\s+shutdown\s+-h\s+now$)";

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

bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

CommandAuthorizer::CommandAuthorizer()
    : CommandAuthorizer(Options())
{
}

CommandAuthorizer::CommandAuthorizer(const Options &options)
{
    for (const char *pattern : kBasePatterns) {
        addPattern(pattern);
    }
    if (options.allowShutdown) {
        addPattern(kShutdownPattern);
    }
    m_aliases["radio-play"] = options.radioPlayCommand.empty() ? "radio-play" : options.radioPlayCommand;
}

void CommandAuthorizer::addPattern(const char *source)
{
    m_patterns.emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
    m_sources.emplace_back(source);
}

bool CommandAuthorizer::isAllowed(const std::string &command) const
{
    const std::string trimmed = trim(command);
    for (const auto &pattern : m_patterns) {
        if (std::regex_match(trimmed, pattern)) {
            return true;
        }
    }
    return false;
}

bool CommandAuthorizer::toExecutable(const std::string &command, std::vector<std::string> &argv) const
{
    if (!splitCommandLine(command, argv)) {
        return false;
    }
    if (!argv.empty()) {
        auto alias = m_aliases.find(argv[0]);
        if (alias != m_aliases.end()) {
            argv[0] = alias->second;
        }
    }
    return true;
}

CommandDecision CommandAuthorizer::prepare(const std::string &command, std::vector<std::string> &argv) const
{
    argv.clear();
    if (!isAllowed(command)) {
        LOG_WARN(TAG, "Rejected command: %s", command.c_str());
        return CommandDecision::Forbidden;
    }
    if (!toExecutable(command, argv)) {
        LOG_WARN(TAG, "Could not split command: %s", command.c_str());
        return CommandDecision::LexFailure;
    }
    LOG_DEBUG(TAG, "Admitted command: %s", command.c_str());
    return CommandDecision::Allowed;
}

bool CommandAuthorizer::splitCommandLine(const std::string &command, std::vector<std::string> &argv)
{
    enum class State { Blank, Word, SingleQuoted, DoubleQuoted };

    argv.clear();
    std::string word;
    State state = State::Blank;

    for (size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];
        switch (state) {
            case State::Blank:
            case State::Word:
                if (isBlank(c)) {
                    if (state == State::Word) {
                        argv.push_back(word);
                        word.clear();
                        state = State::Blank;
                    }
                } else if (c == '\'') {
                    state = State::SingleQuoted;
                } else if (c == '"') {
                    state = State::DoubleQuoted;
                } else if (c == '\\') {
                    if (i + 1 >= command.size()) {
                        argv.clear();
                        return false;
                    }
                    word.push_back(command[++i]);
                    state = State::Word;
                } else {
                    word.push_back(c);
                    state = State::Word;
                }
                break;

            case State::SingleQuoted:
                if (c == '\'') {
                    state = State::Word;
                } else {
                    word.push_back(c);
                }
                break;

            case State::DoubleQuoted:
                if (c == '"') {
                    state = State::Word;
                } else if (c == '\\' && i + 1 < command.size() &&
                           (command[i + 1] == '\\' || command[i + 1] == '"' ||
                            command[i + 1] == '$' || command[i + 1] == '`')) {
                    word.push_back(command[++i]);
                } else {
                    word.push_back(c);
                }
                break;
        }
    }

    if (state == State::SingleQuoted || state == State::DoubleQuoted) {
        argv.clear();
        return false;
    }
    // A closed quote leaves State::Word even for "" so empty arguments survive.
    if (state == State::Word) {
        argv.push_back(word);
    }
    return true;
}

const char *commandDecisionName(CommandDecision decision)
{
    switch (decision) {
        case CommandDecision::Allowed:    return "allowed";
        case CommandDecision::Forbidden:  return "forbidden";
        case CommandDecision::LexFailure: return "lex failure";
    }
    return "unknown";
}
