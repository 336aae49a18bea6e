#ifndef CLI_SERVICE_H
#define CLI_SERVICE_H

#include <cstdio>
#include <functional>
#include <string>

// Line-oriented command reader for the interactive radioctl shell.
class CliService {
public:
    using CommandHandler = std::function<void(const std::string&)>;

    CliService(std::FILE *input, CommandHandler handler);

    // Reads one line (blocking) and dispatches it unless blank. Returns false
    // at end of input.
    bool poll();

private:
    std::FILE *m_input;
    CommandHandler m_handler;
    std::string m_buffer;

    void dispatchBuffer();
};

#endif  // CLI_SERVICE_H
