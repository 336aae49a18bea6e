#include "hardware_config.h"

#include "config_value.h"
#include "hardware_config_validator.h"
#include "i2c_address.h"
#include "logging_manager.h"

static constexpr const char* TAG = "HardwareConfig";

bool parseHardwareVariant(const std::string &name, HardwareVariant &out)
{
    if (name == "encoder_oled") {
        out = HardwareVariant::EncoderOled;
        return true;
    }
    if (name == "rotary") {
        out = HardwareVariant::Rotary;
        return true;
    }
    return false;
}

const char *hardwareVariantName(HardwareVariant variant)
{
    switch (variant) {
        case HardwareVariant::EncoderOled: return "encoder_oled";
        case HardwareVariant::Rotary:      return "rotary";
    }
    return "unknown";
}

bool DecodeMap::lookup(int rawCode, int &digit) const
{
    if (!present) {
        digit = rawCode;
        return true;
    }
    auto it = entries.find(rawCode);
    if (it == entries.end()) {
        return false;
    }
    digit = it->second;
    return true;
}

bool parseVolumeButtonAction(const std::string &name, VolumeButtonAction &out)
{
    if (name == "play_pause") {
        out = VolumeButtonAction::PlayPause;
    } else if (name == "mute_toggle") {
        out = VolumeButtonAction::MuteToggle;
    } else if (name == "noop") {
        out = VolumeButtonAction::Noop;
    } else {
        return false;
    }
    return true;
}

const char *volumeButtonActionName(VolumeButtonAction action)
{
    switch (action) {
        case VolumeButtonAction::PlayPause:  return "play_pause";
        case VolumeButtonAction::MuteToggle: return "mute_toggle";
        case VolumeButtonAction::Noop:       return "noop";
    }
    return "noop";
}

namespace {

long long intField(const ConfigValue &section, const char *key, long long fallback)
{
    const ConfigValue &value = section[key];
    return value.isInteger() ? value.asInteger() : fallback;
}

double numberField(const ConfigValue &section, const char *key, double fallback)
{
    const ConfigValue &value = section[key];
    return value.isNumber() ? value.asNumber() : fallback;
}

long long addressField(const ConfigValue &section, const char *key)
{
    I2CAddressResult parsed = parseI2CAddress(section[key]);
    if (!parsed.ok()) {
        LOG_WARN(TAG, "i2c.%s not usable (%s); using 0", key, i2cAddressStatusName(parsed.status));
        return 0;
    }
    return parsed.address;
}

void readControls(const ConfigValue &controls, ControlRanges &out)
{
    ControlRanges defaults;
    out.bankMin = intField(controls, "bank_min", defaults.bankMin);
    out.bankMax = intField(controls, "bank_max", defaults.bankMax);
    out.stationMin = intField(controls, "station_min", defaults.stationMin);
    out.stationMax = intField(controls, "station_max", defaults.stationMax);
    out.volumeMin = intField(controls, "volume_min", defaults.volumeMin);
    out.volumeMax = intField(controls, "volume_max", defaults.volumeMax);
    out.volumeStep = intField(controls, "volume_step", defaults.volumeStep);
}

void readSwitchPins(const ConfigValue &pins, SwitchPins &out)
{
    static const char *const bitNames[] = {"bit0", "bit1", "bit2", "bit3"};
    for (int i = 0; i < 4; ++i) {
        out.bits[i] = intField(pins, bitNames[i], 0);
    }
}

void readDecodeMap(const ConfigValue &source, DecodeMap &out)
{
    out.present = source.isMapping();
    out.entries.clear();
    for (const auto &entry : source.entries()) {
        long long rawCode = 0;
        if (ConfigValue::parseIntegerKey(entry.first, rawCode) && entry.second.isInteger()) {
            out.entries[static_cast<int>(rawCode)] = static_cast<int>(entry.second.asInteger());
        }
    }
}

void readRotary(const ConfigValue &tree, RotaryConfig &out)
{
    const ConfigValue &switches = tree["switches"];
    const ConfigValue &polling = tree["polling"];
    PollingSettings pollingDefaults;

    out.volumeI2CAddress = addressField(tree["i2c"], "volume_i2c_address");
    readSwitchPins(switches["station_switch"], out.stationSwitch);
    readSwitchPins(switches["bank_switch"], out.bankSwitch);
    readDecodeMap(switches["bank_decode_map"], out.bankDecodeMap);
    readDecodeMap(switches["station_decode_map"], out.stationDecodeMap);
    out.volumeEncoder = intField(tree["encoders"], "volume_encoder", 0);
    readControls(tree["controls"], out.controls);
    parseVolumeButtonAction(tree["buttons"]["volume_button"].asString(), out.volumeButton);
    out.polling.switchPollInterval = numberField(polling, "switch_poll_interval", pollingDefaults.switchPollInterval);
    out.polling.switchDebounce = numberField(polling, "switch_debounce", pollingDefaults.switchDebounce);
    out.polling.switchStabilityWindow =
        numberField(polling, "switch_stability_window", pollingDefaults.switchStabilityWindow);
    out.polling.invalidCodeLogInterval =
        numberField(polling, "invalid_code_log_interval", pollingDefaults.invalidCodeLogInterval);
}

void readEncoderOled(const ConfigValue &tree, EncoderOledConfig &out)
{
    const ConfigValue &i2c = tree["i2c"];
    out.encoderI2CAddress = addressField(i2c, "encoder_i2c_address");
    out.oledI2CAddress = addressField(i2c, "oled_i2c_address");
    readControls(tree["controls"], out.controls);
}

}  // namespace

bool buildHardwareConfig(const ConfigValue &tree, HardwareVariant variant, HardwareConfig &out,
                         std::vector<ValidationError> &errors)
{
    errors = validateHardwareConfig(tree, variant);
    if (!errors.empty()) {
        LOG_ERROR(TAG, "Hardware config (%s) has %u error(s)", hardwareVariantName(variant),
                  static_cast<unsigned>(errors.size()));
        return false;
    }

    out = HardwareConfig();
    out.variant = variant;
    if (variant == HardwareVariant::Rotary) {
        readRotary(tree, out.rotary);
    } else {
        readEncoderOled(tree, out.encoderOled);
    }

    const ConfigValue &url = tree["sources"]["stations_url"];
    if (url.isString()) {
        out.stationsUrl = url.asString();
    }

    LOG_INFO(TAG, "Hardware config ready (variant=%s)", hardwareVariantName(variant));
    return true;
}
