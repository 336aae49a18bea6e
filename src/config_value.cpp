#include "config_value.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

ConfigValue::ConfigValue()
    : m_type(Type::Null),
      m_bool(false),
      m_integer(0),
      m_float(0.0)
{
}

ConfigValue ConfigValue::makeBool(bool value)
{
    ConfigValue v;
    v.m_type = Type::Bool;
    v.m_bool = value;
    return v;
}

ConfigValue ConfigValue::makeInteger(long long value)
{
    ConfigValue v;
    v.m_type = Type::Integer;
    v.m_integer = value;
    return v;
}

ConfigValue ConfigValue::makeFloat(double value)
{
    ConfigValue v;
    v.m_type = Type::Float;
    v.m_float = value;
    return v;
}

ConfigValue ConfigValue::makeString(const std::string &value)
{
    ConfigValue v;
    v.m_type = Type::String;
    v.m_string = value;
    return v;
}

ConfigValue ConfigValue::makeSequence()
{
    ConfigValue v;
    v.m_type = Type::Sequence;
    return v;
}

ConfigValue ConfigValue::makeMapping()
{
    ConfigValue v;
    v.m_type = Type::Mapping;
    return v;
}

double ConfigValue::asNumber() const
{
    if (m_type == Type::Integer) {
        return static_cast<double>(m_integer);
    }
    return m_float;
}

size_t ConfigValue::size() const
{
    if (m_type == Type::Mapping) {
        return m_entries.size();
    }
    if (m_type == Type::Sequence) {
        return m_items.size();
    }
    return 0;
}

bool ConfigValue::contains(const std::string &key) const
{
    return find(key) != nullptr;
}

const ConfigValue *ConfigValue::find(const std::string &key) const
{
    if (m_type != Type::Mapping) {
        return nullptr;
    }
    for (const auto &entry : m_entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

ConfigValue *ConfigValue::find(const std::string &key)
{
    if (m_type != Type::Mapping) {
        return nullptr;
    }
    for (auto &entry : m_entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const ConfigValue &ConfigValue::operator[](const std::string &key) const
{
    static const ConfigValue s_null;
    const ConfigValue *found = find(key);
    return found ? *found : s_null;
}

void ConfigValue::set(const std::string &key, const ConfigValue &value)
{
    if (m_type == Type::Null) {
        m_type = Type::Mapping;
    }
    if (m_type != Type::Mapping) {
        return;
    }
    if (ConfigValue *existing = find(key)) {
        *existing = value;
        return;
    }
    m_entries.emplace_back(key, value);
}

void ConfigValue::append(const ConfigValue &value)
{
    if (m_type == Type::Null) {
        m_type = Type::Sequence;
    }
    if (m_type == Type::Sequence) {
        m_items.push_back(value);
    }
}

std::string ConfigValue::describe() const
{
    char buffer[64];
    switch (m_type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return m_bool ? "true" : "false";
        case Type::Integer:
            snprintf(buffer, sizeof(buffer), "%lld", m_integer);
            return buffer;
        case Type::Float:
            snprintf(buffer, sizeof(buffer), "%g", m_float);
            return buffer;
        case Type::String:
            return "'" + m_string + "'";
        case Type::Sequence:
            return "<sequence>";
        case Type::Mapping:
            return "<mapping>";
    }
    return "<unknown>";
}

const char *ConfigValue::typeName(Type type)
{
    switch (type) {
        case Type::Null:     return "null";
        case Type::Bool:     return "bool";
        case Type::Integer:  return "integer";
        case Type::Float:    return "float";
        case Type::String:   return "string";
        case Type::Sequence: return "sequence";
        case Type::Mapping:  return "mapping";
    }
    return "unknown";
}

bool ConfigValue::parseIntegerKey(const std::string &key, long long &out)
{
    size_t start = (!key.empty() && key[0] == '-') ? 1 : 0;
    if (start == key.size()) {
        return false;
    }
    for (size_t i = start; i < key.size(); ++i) {
        if (key[i] < '0' || key[i] > '9') {
            return false;
        }
    }
    errno = 0;
    long long value = std::strtoll(key.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return false;
    }
    out = value;
    return true;
}
