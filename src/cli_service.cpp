#include "cli_service.h"

#include <utility>

CliService::CliService(std::FILE *input, CommandHandler handler)
    : m_input(input), m_handler(std::move(handler)), m_buffer() {
}

bool CliService::poll() {
    if (!m_input) {
        return false;
    }
    int c;
    while ((c = std::fgetc(m_input)) != EOF) {
        if (c == '\r') {
            continue;
        }
        if (c == '\n') {
            dispatchBuffer();
            return true;
        }
        m_buffer += static_cast<char>(c);
    }

    // Last line without a newline.
    dispatchBuffer();
    return false;
}

void CliService::dispatchBuffer() {
    if (m_buffer.empty()) {
        return;
    }
    std::string line;
    line.swap(m_buffer);
    if (m_handler) {
        m_handler(line);
    }
}
