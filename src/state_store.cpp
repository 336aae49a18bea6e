#include "state_store.h"

#include <cstdio>
#include <cstdlib>

#include "infra/filesystem.h"
#include "logging_manager.h"

static constexpr const char* TAG = "StateStore";

namespace {

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

}  // namespace

StateUpdate &StateUpdate::set(const std::string &key, const std::string &value)
{
    m_values[key] = value;
    return *this;
}

StateUpdate &StateUpdate::set(const std::string &key, const char *value)
{
    return set(key, std::string(value ? value : ""));
}

StateUpdate &StateUpdate::set(const std::string &key, long long value)
{
    return set(key, std::to_string(value));
}

StateUpdate &StateUpdate::set(const std::string &key, int value)
{
    return set(key, static_cast<long long>(value));
}

StateUpdate &StateUpdate::set(const std::string &key, double value)
{
    // Shortest text that reads back as the same double.
    char buffer[32];
    for (int precision = 1; precision <= 17; ++precision) {
        snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return set(key, std::string(buffer));
}

StateUpdate &StateUpdate::set(const std::string &key, bool value)
{
    return set(key, std::string(value ? "true" : "false"));
}

StateStore::StateStore(infra::IFileSystem &fileSystem)
    : m_fileSystem(fileSystem)
{
}

StateRecord StateStore::read(const std::string &path)
{
    StateRecord record;
    load(path, record);
    return record;
}

StateReadStatus StateStore::load(const std::string &path, StateRecord &out)
{
    out.clear();
    if (!m_fileSystem.exists(path.c_str())) {
        return StateReadStatus::NotFound;
    }
    auto file = m_fileSystem.open(path.c_str(), infra::kFileRead);
    if (!file) {
        LOG_ERROR(TAG, "Failed to open state file %s", path.c_str());
        return StateReadStatus::IoError;
    }
    std::string text = file->readString();
    file->close();

    out = parse(text);
    return StateReadStatus::Ok;
}

bool StateStore::write(const std::string &path, const StateUpdate &updates)
{
    for (const auto &entry : updates.values()) {
        if (!isRepresentable(entry.first, entry.second)) {
            LOG_ERROR(TAG, "Rejecting state update for key '%s': not representable as key=value",
                      entry.first.c_str());
            return false;
        }
    }

    StateRecord current;
    if (load(path, current) == StateReadStatus::IoError) {
        return false;
    }
    for (const auto &entry : updates.values()) {
        current[entry.first] = entry.second;
    }

    auto file = m_fileSystem.open(path.c_str(), infra::kFileWrite);
    if (!file) {
        LOG_ERROR(TAG, "Failed to open state file %s for writing", path.c_str());
        return false;
    }
    bool written = file->write(serialize(current));
    file->close();
    if (!written) {
        LOG_ERROR(TAG, "Failed to write state file %s", path.c_str());
        return false;
    }
    LOG_DEBUG(TAG, "Wrote %u key(s) to %s", static_cast<unsigned>(current.size()), path.c_str());
    return true;
}

StateRecord StateStore::parse(const std::string &text)
{
    StateRecord record;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t newline = text.find('\n', pos);
        if (newline == std::string::npos) {
            newline = text.size();
        }
        std::string line = trim(text.substr(pos, newline - pos));
        pos = newline + 1;

        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t separator = line.find('=');
        if (separator == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, separator));
        if (!key.empty()) {
            record[key] = trim(line.substr(separator + 1));
        }
    }
    return record;
}

std::string StateStore::serialize(const StateRecord &record)
{
    std::string out;
    for (const auto &entry : record) {
        out += entry.first;
        out += '=';
        out += entry.second;
        out += '\n';
    }
    return out;
}

bool StateStore::isRepresentable(const std::string &key, const std::string &value)
{
    // Reads trim both sides of the '=', so edge whitespace would not survive.
    // A leading '#' would turn the line into a comment on the next read.
    if (key.empty() || key != trim(key) || key[0] == '#' || key.find_first_of("=\n\r") != std::string::npos) {
        return false;
    }
    return value == trim(value) && value.find_first_of("=\n\r") == std::string::npos;
}

const char *stateReadStatusName(StateReadStatus status)
{
    switch (status) {
        case StateReadStatus::Ok:       return "ok";
        case StateReadStatus::NotFound: return "not found";
        case StateReadStatus::IoError:  return "io error";
    }
    return "unknown";
}
