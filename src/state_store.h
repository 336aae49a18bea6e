#ifndef STATE_STORE_H
#define STATE_STORE_H

#include <map>
#include <string>

namespace infra {
class IFileSystem;
}

using StateRecord = std::map<std::string, std::string>;

enum class StateReadStatus : unsigned char {
    Ok = 0,
    NotFound,
    IoError
};

// Pending changes for StateStore::write. Values are stored as text.
class StateUpdate {
public:
    StateUpdate &set(const std::string &key, const std::string &value);
    StateUpdate &set(const std::string &key, const char *value);
    StateUpdate &set(const std::string &key, long long value);
    StateUpdate &set(const std::string &key, int value);
    StateUpdate &set(const std::string &key, double value);
    StateUpdate &set(const std::string &key, bool value);

    const StateRecord &values() const { return m_values; }
    bool empty() const { return m_values.empty(); }

private:
    StateRecord m_values;
};

// Flat key=value state file (current bank/station, playback state, volume).
//
// write() is an unlocked read-modify-write followed by a full rewrite. Two
// processes writing at the same time can lose one of the updates.
class StateStore {
public:
    explicit StateStore(infra::IFileSystem &fileSystem);

    // Missing file yields an empty record.
    StateRecord read(const std::string &path);
    StateReadStatus load(const std::string &path, StateRecord &out);

    // Keys not named in `updates` keep their current value. Returns false
    // without touching the file when a key or value cannot be represented.
    bool write(const std::string &path, const StateUpdate &updates);

    static StateRecord parse(const std::string &text);
    static std::string serialize(const StateRecord &record);
    // False for text a later read would not return unchanged: '=' or line
    // breaks, edge whitespace, or a key that is empty or starts with '#'.
    static bool isRepresentable(const std::string &key, const std::string &value);

private:
    infra::IFileSystem &m_fileSystem;
};

const char *stateReadStatusName(StateReadStatus status);

#endif // STATE_STORE_H
