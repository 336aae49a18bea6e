#include "hardware_config_validator.h"

#include "config_value.h"
#include "i2c_address.h"

namespace {

const char *const kControlKeys[] = {
    "bank_min", "bank_max", "station_min", "station_max", "volume_min", "volume_max", "volume_step"
};

const char *const kSwitchNames[] = {"station_switch", "bank_switch"};
const char *const kSwitchBits[] = {"bit0", "bit1", "bit2", "bit3"};
const char *const kDecodeMapNames[] = {"bank_decode_map", "station_decode_map"};

void addError(std::vector<ValidationError> &errors, const std::string &path, const std::string &message)
{
    ValidationError error;
    error.path = path;
    error.message = message;
    errors.push_back(error);
}

bool isIntegerField(const ConfigValue &section, const char *key)
{
    const ConfigValue *value = section.find(key);
    return value && value->isInteger();
}

void checkRangeOrder(const ConfigValue &controls, const char *minKey, const char *maxKey,
                     std::vector<ValidationError> &errors)
{
    if (!isIntegerField(controls, minKey) || !isIntegerField(controls, maxKey)) {
        return;
    }
    if (controls[minKey].asInteger() > controls[maxKey].asInteger()) {
        addError(errors, std::string("controls.") + minKey,
                 std::string("controls.") + minKey + " must be <= controls." + maxKey);
    }
}

// ---------------------------------------------------------------------------
// encoder_oled
// ---------------------------------------------------------------------------

void validateEncoderOled(const ConfigValue &tree, std::vector<ValidationError> &errors)
{
    const ConfigValue *i2c = tree.find("i2c");
    if (!i2c) {
        addError(errors, "i2c", "Missing 'i2c' section");
    } else if (!i2c->isMapping()) {
        addError(errors, "i2c", "Invalid 'i2c' section (must be a mapping)");
    } else {
        if (!i2c->contains("encoder_i2c_address")) {
            addError(errors, "i2c.encoder_i2c_address", "Missing i2c.encoder_i2c_address");
        }
        if (!i2c->contains("oled_i2c_address")) {
            addError(errors, "i2c.oled_i2c_address", "Missing i2c.oled_i2c_address");
        }
    }

    if (!tree.contains("encoders")) {
        addError(errors, "encoders", "Missing 'encoders' section");
    }

    const ConfigValue *controls = tree.find("controls");
    if (!controls) {
        addError(errors, "controls", "Missing 'controls' section");
    } else if (!controls->isMapping()) {
        addError(errors, "controls", "Invalid 'controls' section (must be a mapping)");
    } else {
        for (const char *key : kControlKeys) {
            if (!controls->contains(key)) {
                addError(errors, std::string("controls.") + key, std::string("Missing controls.") + key);
            }
        }
    }

    if (!tree.contains("buttons")) {
        addError(errors, "buttons", "Missing 'buttons' section");
    }
    if (!tree.contains("display")) {
        addError(errors, "display", "Missing 'display' section");
    }
}

// ---------------------------------------------------------------------------
// rotary
// ---------------------------------------------------------------------------

const ConfigValue *requireSection(const ConfigValue &tree, const char *name, std::vector<ValidationError> &errors)
{
    const ConfigValue *section = tree.find(name);
    if (!section || !section->isMapping()) {
        addError(errors, name, std::string("Missing or invalid '") + name + "' section (must be a mapping)");
        return nullptr;
    }
    return section;
}

void validateRotaryI2C(const ConfigValue &i2c, std::vector<ValidationError> &errors)
{
    const ConfigValue *address = i2c.find("volume_i2c_address");
    if (!address || address->isNull()) {
        addError(errors, "i2c.volume_i2c_address", "Missing i2c.volume_i2c_address");
        return;
    }
    I2CAddressResult parsed = parseI2CAddress(*address);
    if (!parsed.ok()) {
        addError(errors, "i2c.volume_i2c_address",
                 "Invalid i2c.volume_i2c_address (" + address->describe() + "): " +
                     i2cAddressStatusName(parsed.status) + " (" + parsed.detail + ")");
    }
}

std::string renderDecodeKey(const std::string &key)
{
    long long ignored = 0;
    if (ConfigValue::parseIntegerKey(key, ignored)) {
        return key;
    }
    return "'" + key + "'";
}

void validateDecodeMap(const ConfigValue &switches, const char *mapName, std::vector<ValidationError> &errors)
{
    const ConfigValue *decodeMap = switches.find(mapName);
    if (!decodeMap || decodeMap->isNull()) {
        return;
    }
    const std::string path = std::string("switches.") + mapName;
    if (!decodeMap->isMapping()) {
        addError(errors, path, path + " must be a mapping of raw_code->decoded_digit");
        return;
    }

    for (const auto &entry : decodeMap->entries()) {
        const std::string shownKey = renderDecodeKey(entry.first);
        const std::string entryPath = path + "[" + shownKey + "]";

        long long rawCode = 0;
        if (!ConfigValue::parseIntegerKey(entry.first, rawCode)) {
            addError(errors, entryPath, path + " key " + shownKey + " must be an integer");
        } else if (rawCode < 0 || rawCode > 15) {
            addError(errors, entryPath, path + " key " + shownKey + " must be in range 0-15");
        }

        const ConfigValue &digit = entry.second;
        if (!digit.isInteger()) {
            addError(errors, entryPath, entryPath + " must be an integer");
        } else if (digit.asInteger() < 0 || digit.asInteger() > 9) {
            addError(errors, entryPath, entryPath + " must be in range 0-9");
        }
    }
}

void validateRotarySwitches(const ConfigValue &switches, std::vector<ValidationError> &errors)
{
    for (const char *switchName : kSwitchNames) {
        const std::string path = std::string("switches.") + switchName;
        const ConfigValue *pins = switches.find(switchName);
        if (!pins || !pins->isMapping()) {
            addError(errors, path, "Missing or invalid " + path + " (must be a mapping)");
            continue;
        }
        for (const char *bit : kSwitchBits) {
            if (!isIntegerField(*pins, bit)) {
                addError(errors, path + "." + bit, path + "." + bit + " must be an integer GPIO pin");
            }
        }
    }

    for (const char *mapName : kDecodeMapNames) {
        validateDecodeMap(switches, mapName, errors);
    }
}

void validateRotaryControls(const ConfigValue &controls, std::vector<ValidationError> &errors)
{
    for (const char *key : kControlKeys) {
        if (!isIntegerField(controls, key)) {
            addError(errors, std::string("controls.") + key, std::string("controls.") + key + " must be an integer");
        }
    }

    checkRangeOrder(controls, "bank_min", "bank_max", errors);
    checkRangeOrder(controls, "station_min", "station_max", errors);
    checkRangeOrder(controls, "volume_min", "volume_max", errors);

    if (isIntegerField(controls, "volume_step") && controls["volume_step"].asInteger() <= 0) {
        addError(errors, "controls.volume_step", "controls.volume_step must be > 0");
    }
}

// Optional timing fields only fall back when the key is absent; an explicit
// null is a type error.
bool timingAtLeast(const ConfigValue &polling, const char *key, bool hasDefault, double floor, bool strict)
{
    const ConfigValue *value = polling.find(key);
    if (!value) {
        return hasDefault;
    }
    if (!value->isNumber()) {
        return false;
    }
    return strict ? value->asNumber() > floor : value->asNumber() >= floor;
}

void validateRotaryPolling(const ConfigValue &polling, std::vector<ValidationError> &errors)
{
    if (!timingAtLeast(polling, "switch_poll_interval", false, 0.0, true)) {
        addError(errors, "polling.switch_poll_interval", "polling.switch_poll_interval must be a number > 0");
    }
    if (!timingAtLeast(polling, "switch_debounce", false, 0.0, false)) {
        addError(errors, "polling.switch_debounce", "polling.switch_debounce must be a number >= 0");
    }
    if (!timingAtLeast(polling, "switch_stability_window", true, 0.0, false)) {
        addError(errors, "polling.switch_stability_window", "polling.switch_stability_window must be a number >= 0");
    }
    if (!timingAtLeast(polling, "invalid_code_log_interval", true, 0.0, false)) {
        addError(errors, "polling.invalid_code_log_interval",
                 "polling.invalid_code_log_interval must be a number >= 0");
    }
}

void validateRotary(const ConfigValue &tree, std::vector<ValidationError> &errors)
{
    if (const ConfigValue *i2c = requireSection(tree, "i2c", errors)) {
        validateRotaryI2C(*i2c, errors);
    }

    if (const ConfigValue *switches = requireSection(tree, "switches", errors)) {
        validateRotarySwitches(*switches, errors);
    }

    if (const ConfigValue *encoders = requireSection(tree, "encoders", errors)) {
        if (!isIntegerField(*encoders, "volume_encoder")) {
            addError(errors, "encoders.volume_encoder", "encoders.volume_encoder must be an integer");
        }
    }

    if (const ConfigValue *controls = requireSection(tree, "controls", errors)) {
        validateRotaryControls(*controls, errors);
    }

    if (const ConfigValue *buttons = requireSection(tree, "buttons", errors)) {
        const ConfigValue &action = (*buttons)["volume_button"];
        VolumeButtonAction parsed;
        if (!action.isString() || !parseVolumeButtonAction(action.asString(), parsed)) {
            addError(errors, "buttons.volume_button",
                     "buttons.volume_button must be one of: play_pause, mute_toggle, noop");
        }
    }

    if (const ConfigValue *polling = requireSection(tree, "polling", errors)) {
        validateRotaryPolling(*polling, errors);
    }
}

}  // namespace

std::vector<ValidationError> validateHardwareConfig(const ConfigValue &tree, HardwareVariant variant)
{
    std::vector<ValidationError> errors;
    if (!tree.isMapping()) {
        addError(errors, "", "Hardware config must be a mapping");
        return errors;
    }

    switch (variant) {
        case HardwareVariant::EncoderOled:
            validateEncoderOled(tree, errors);
            break;
        case HardwareVariant::Rotary:
            validateRotary(tree, errors);
            break;
    }
    return errors;
}

std::vector<ValidationError> validateHardwareConfig(const ConfigValue &tree, const std::string &variant)
{
    HardwareVariant parsed;
    if (!parseHardwareVariant(variant, parsed)) {
        std::vector<ValidationError> errors;
        addError(errors, "", "Unknown hardware variant: " + variant);
        return errors;
    }
    return validateHardwareConfig(tree, parsed);
}
