#include "config_loader.h"

#include <ArduinoJson.h>

#include "infra/filesystem.h"
#include "logging_manager.h"

static constexpr const char* TAG = "ConfigLoader";

namespace {

ConfigValue fromJson(JsonVariantConst variant)
{
    if (variant.isNull()) {
        return ConfigValue();
    }
    if (variant.is<bool>()) {
        return ConfigValue::makeBool(variant.as<bool>());
    }
    if (variant.is<long long>()) {
        return ConfigValue::makeInteger(variant.as<long long>());
    }
    if (variant.is<double>()) {
        return ConfigValue::makeFloat(variant.as<double>());
    }
    if (variant.is<const char*>()) {
        return ConfigValue::makeString(variant.as<const char*>());
    }
    if (variant.is<JsonArrayConst>()) {
        ConfigValue sequence = ConfigValue::makeSequence();
        for (JsonVariantConst item : variant.as<JsonArrayConst>()) {
            sequence.append(fromJson(item));
        }
        return sequence;
    }
    if (variant.is<JsonObjectConst>()) {
        ConfigValue mapping = ConfigValue::makeMapping();
        for (JsonPairConst pair : variant.as<JsonObjectConst>()) {
            mapping.set(pair.key().c_str(), fromJson(pair.value()));
        }
        return mapping;
    }
    return ConfigValue();
}

template <typename TRef>
void toJson(const ConfigValue &value, TRef ref)
{
    switch (value.type()) {
        case ConfigValue::Type::Null:
            ref.set(nullptr);
            break;
        case ConfigValue::Type::Bool:
            ref.set(value.asBool());
            break;
        case ConfigValue::Type::Integer:
            ref.set(value.asInteger());
            break;
        case ConfigValue::Type::Float:
            ref.set(value.asNumber());
            break;
        case ConfigValue::Type::String:
            ref.set(value.asString());
            break;
        case ConfigValue::Type::Sequence: {
            JsonArray array = ref.template to<JsonArray>();
            for (const auto &item : value.items()) {
                toJson(item, array.template add<JsonVariant>());
            }
            break;
        }
        case ConfigValue::Type::Mapping: {
            JsonObject object = ref.template to<JsonObject>();
            for (const auto &entry : value.entries()) {
                toJson(entry.second, object[entry.first]);
            }
            break;
        }
    }
}

bool isBlank(const std::string &text)
{
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> splitDotted(const std::string &dottedKey)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : dottedKey) {
        if (c == '.') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

}  // namespace

ConfigLoader::ConfigLoader(infra::IFileSystem &fileSystem)
    : m_fileSystem(fileSystem)
{
}

bool ConfigLoader::load(const std::string &path, ConfigValue &out)
{
    m_lastError.clear();
    out = ConfigValue::makeMapping();

    if (!m_fileSystem.exists(path.c_str())) {
        LOG_DEBUG(TAG, "%s not found; using empty configuration", path.c_str());
        return true;
    }

    auto file = m_fileSystem.open(path.c_str(), infra::kFileRead);
    if (!file) {
        m_lastError = "Failed to open " + path;
        LOG_ERROR(TAG, "%s", m_lastError.c_str());
        return false;
    }
    std::string text = file->readString();
    file->close();

    std::string parseError;
    if (!parse(text, out, &parseError)) {
        m_lastError = "Invalid JSON in " + path + ": " + parseError;
        LOG_ERROR(TAG, "%s", m_lastError.c_str());
        out = ConfigValue::makeMapping();
        return false;
    }

    LOG_DEBUG(TAG, "Loaded %s (%u top-level keys)", path.c_str(), static_cast<unsigned>(out.size()));
    return true;
}

bool ConfigLoader::save(const std::string &path, const ConfigValue &tree)
{
    m_lastError.clear();
    std::string text = serialize(tree);
    if (text.empty()) {
        m_lastError = "Failed to serialize configuration for " + path;
        LOG_ERROR(TAG, "%s", m_lastError.c_str());
        return false;
    }

    auto file = m_fileSystem.open(path.c_str(), infra::kFileWrite);
    if (!file) {
        m_lastError = "Failed to open " + path + " for writing";
        LOG_ERROR(TAG, "%s", m_lastError.c_str());
        return false;
    }
    bool written = file->write(text) && file->write("\n");
    file->close();
    if (!written) {
        m_lastError = "Failed to write " + path;
        LOG_ERROR(TAG, "%s", m_lastError.c_str());
        return false;
    }
    return true;
}

bool ConfigLoader::updateValue(const std::string &path, const std::string &dottedKey, const ConfigValue &value)
{
    ConfigValue tree;
    if (!load(path, tree)) {
        return false;
    }
    if (!tree.isMapping()) {
        m_lastError = "Top level of " + path + " is not a mapping";
        LOG_ERROR(TAG, "%s", m_lastError.c_str());
        return false;
    }

    std::vector<std::string> parts = splitDotted(dottedKey);
    ConfigValue *node = &tree;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        ConfigValue *child = node->find(parts[i]);
        if (!child) {
            node->set(parts[i], ConfigValue::makeMapping());
            child = node->find(parts[i]);
        } else if (!child->isMapping()) {
            m_lastError = "Cannot set " + dottedKey + ": '" + parts[i] + "' is not a mapping";
            LOG_ERROR(TAG, "%s", m_lastError.c_str());
            return false;
        }
        node = child;
    }
    node->set(parts.back(), value);

    if (!save(path, tree)) {
        return false;
    }
    LOG_INFO(TAG, "Updated %s in %s", dottedKey.c_str(), path.c_str());
    return true;
}

bool ConfigLoader::parse(const std::string &text, ConfigValue &out, std::string *error)
{
    if (isBlank(text)) {
        out = ConfigValue::makeMapping();
        return true;
    }

    JsonDocument doc;
    DeserializationError result = deserializeJson(doc, text);
    if (result) {
        if (error) {
            *error = result.c_str();
        }
        return false;
    }

    out = fromJson(doc.as<JsonVariantConst>());
    if (out.isNull()) {
        out = ConfigValue::makeMapping();
    }
    return true;
}

std::string ConfigLoader::serialize(const ConfigValue &tree)
{
    JsonDocument doc;
    toJson(tree, doc.to<JsonVariant>());
    if (doc.overflowed()) {
        LOG_ERROR(TAG, "Configuration too large to serialize");
        return std::string();
    }
    std::string text;
    serializeJsonPretty(doc, text);
    return text;
}

const ConfigValue *ConfigLoader::lookup(const ConfigValue &tree, const std::string &dottedKey)
{
    const ConfigValue *node = &tree;
    for (const auto &part : splitDotted(dottedKey)) {
        node = node->find(part);
        if (!node) {
            return nullptr;
        }
    }
    return node;
}
