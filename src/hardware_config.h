#ifndef HARDWARE_CONFIG_H
#define HARDWARE_CONFIG_H

#include <map>
#include <string>
#include <vector>

class ConfigValue;
struct ValidationError;

enum class HardwareVariant : unsigned char {
    EncoderOled = 0,  // legacy: I2C encoders plus OLED display
    Rotary            // 4-bit rotary switches plus one volume encoder
};

// Accepts "encoder_oled" and "rotary"; returns false for anything else.
bool parseHardwareVariant(const std::string &name, HardwareVariant &out);
const char *hardwareVariantName(HardwareVariant variant);

// Integer fields keep the full width the validator accepted.
struct ControlRanges {
    long long bankMin = 0;
    long long bankMax = 0;
    long long stationMin = 0;
    long long stationMax = 0;
    long long volumeMin = 0;
    long long volumeMax = 100;
    long long volumeStep = 1;
};

struct SwitchPins {
    long long bits[4] = {0, 0, 0, 0};  // bit0..bit3 GPIO numbers
};

// Raw 4-bit switch reading to decimal digit. Partial tables are legal.
struct DecodeMap {
    bool present = false;
    std::map<int, int> entries;

    // Without a table the raw code is the digit.
    bool lookup(int rawCode, int &digit) const;
};

enum class VolumeButtonAction : unsigned char {
    PlayPause = 0,
    MuteToggle,
    Noop
};

bool parseVolumeButtonAction(const std::string &name, VolumeButtonAction &out);
const char *volumeButtonActionName(VolumeButtonAction action);

struct PollingSettings {
    double switchPollInterval = 0.0;
    double switchDebounce = 0.0;
    double switchStabilityWindow = 0.12;
    double invalidCodeLogInterval = 5.0;
};

struct RotaryConfig {
    long long volumeI2CAddress = 0;
    SwitchPins stationSwitch;
    SwitchPins bankSwitch;
    DecodeMap bankDecodeMap;
    DecodeMap stationDecodeMap;
    long long volumeEncoder = 0;
    ControlRanges controls;
    VolumeButtonAction volumeButton = VolumeButtonAction::PlayPause;
    PollingSettings polling;
};

// The legacy variant is only checked for presence; addresses that do not
// parse are left at zero.
struct EncoderOledConfig {
    long long encoderI2CAddress = 0;
    long long oledI2CAddress = 0;
    ControlRanges controls;
};

struct HardwareConfig {
    HardwareVariant variant = HardwareVariant::EncoderOled;
    EncoderOledConfig encoderOled;  // valid when variant == EncoderOled
    RotaryConfig rotary;            // valid when variant == Rotary
    std::string stationsUrl;        // sources.stations_url, empty when unset
};

// Validates `tree` for `variant` and, when no errors were found, fills `out`.
// Returns true on success; `errors` receives everything the validator reported.
bool buildHardwareConfig(const ConfigValue &tree, HardwareVariant variant, HardwareConfig &out,
                         std::vector<ValidationError> &errors);

#endif // HARDWARE_CONFIG_H
