#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <string>

#include "config_value.h"

namespace infra {
class IFileSystem;
}

// Reads and writes JSON configuration files as ConfigValue trees.
class ConfigLoader {
public:
    explicit ConfigLoader(infra::IFileSystem &fileSystem);

    // A missing file is not an error: `out` becomes an empty mapping and the
    // call returns true. Returns false only when the file exists but cannot be
    // read or is not valid JSON; lastError() then describes the problem.
    bool load(const std::string &path, ConfigValue &out);

    bool save(const std::string &path, const ConfigValue &tree);

    // Read-modify-write of one dotted key ("sources.stations_url"), creating
    // intermediate mappings. Keys outside the path are preserved. No locking:
    // a concurrent writer can lose this update or have its own update lost.
    bool updateValue(const std::string &path, const std::string &dottedKey, const ConfigValue &value);

    static bool parse(const std::string &text, ConfigValue &out, std::string *error = nullptr);
    static std::string serialize(const ConfigValue &tree);

    // Follows a dotted key through nested mappings; nullptr when any step is missing.
    static const ConfigValue *lookup(const ConfigValue &tree, const std::string &dottedKey);

    const std::string &lastError() const { return m_lastError; }

private:
    infra::IFileSystem &m_fileSystem;
    std::string m_lastError;
};

#endif // CONFIG_LOADER_H
