#ifndef CONFIG_VALUE_H
#define CONFIG_VALUE_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Generic decoded form of a configuration file. Untyped until a validator
// or a typed projection looks at it. Mappings keep their input order.
class ConfigValue {
public:
    enum class Type : unsigned char {
        Null = 0,
        Bool,
        Integer,
        Float,
        String,
        Sequence,
        Mapping
    };

    using Sequence = std::vector<ConfigValue>;
    using Entry = std::pair<std::string, ConfigValue>;
    using Mapping = std::vector<Entry>;

    ConfigValue();

    static ConfigValue makeBool(bool value);
    static ConfigValue makeInteger(long long value);
    static ConfigValue makeFloat(double value);
    static ConfigValue makeString(const std::string &value);
    static ConfigValue makeSequence();
    static ConfigValue makeMapping();

    Type type() const { return m_type; }
    bool isNull() const { return m_type == Type::Null; }
    bool isBool() const { return m_type == Type::Bool; }
    bool isInteger() const { return m_type == Type::Integer; }
    bool isFloat() const { return m_type == Type::Float; }
    bool isNumber() const { return m_type == Type::Integer || m_type == Type::Float; }
    bool isString() const { return m_type == Type::String; }
    bool isSequence() const { return m_type == Type::Sequence; }
    bool isMapping() const { return m_type == Type::Mapping; }

    bool asBool() const { return m_bool; }
    long long asInteger() const { return m_integer; }
    double asNumber() const;
    const std::string &asString() const { return m_string; }

    const Sequence &items() const { return m_items; }
    const Mapping &entries() const { return m_entries; }
    size_t size() const;

    bool contains(const std::string &key) const;
    const ConfigValue *find(const std::string &key) const;
    ConfigValue *find(const std::string &key);
    // Missing keys (or a non-mapping receiver) yield a shared null value.
    const ConfigValue &operator[](const std::string &key) const;

    // Replaces an existing key in place or appends a new one. Turns a null
    // value into an empty mapping first; no effect on other types.
    void set(const std::string &key, const ConfigValue &value);
    void append(const ConfigValue &value);

    // Human readable rendering used in validation messages, e.g. 16, 'abc', 3.5.
    std::string describe() const;

    static const char *typeName(Type type);

    // Mapping keys are text; numeric indexes ("0", "12", "-1") are parsed
    // strictly: optional minus sign, decimal digits, nothing else.
    static bool parseIntegerKey(const std::string &key, long long &out);

private:
    Type m_type;
    bool m_bool;
    long long m_integer;
    double m_float;
    std::string m_string;
    Sequence m_items;
    Mapping m_entries;
};

#endif // CONFIG_VALUE_H
