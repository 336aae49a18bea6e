#include <unity.h>
#include "config_value.h"
#include "fake_log_sink.h"
#include "fixture_loader.h"
#include "hardware_config.h"
#include "validation_error.h"

static FakeLogSink g_logSink;

void setUp(void) {
    g_logSink.clear();
    infra::setLogSink(&g_logSink);
}
void tearDown(void) {
    infra::setLogSink(nullptr);
}

static void test_variant_names(void) {
    HardwareVariant variant = HardwareVariant::EncoderOled;
    TEST_ASSERT_TRUE(parseHardwareVariant("rotary", variant));
    TEST_ASSERT_EQUAL(HardwareVariant::Rotary, variant);
    TEST_ASSERT_TRUE(parseHardwareVariant("encoder_oled", variant));
    TEST_ASSERT_EQUAL(HardwareVariant::EncoderOled, variant);
    TEST_ASSERT_FALSE(parseHardwareVariant("Rotary", variant));
    TEST_ASSERT_FALSE(parseHardwareVariant("", variant));
    TEST_ASSERT_EQUAL_STRING("rotary", hardwareVariantName(HardwareVariant::Rotary));
    TEST_ASSERT_EQUAL_STRING("encoder_oled", hardwareVariantName(HardwareVariant::EncoderOled));
}

static void test_volume_button_actions(void) {
    VolumeButtonAction action = VolumeButtonAction::Noop;
    TEST_ASSERT_TRUE(parseVolumeButtonAction("play_pause", action));
    TEST_ASSERT_EQUAL(VolumeButtonAction::PlayPause, action);
    TEST_ASSERT_TRUE(parseVolumeButtonAction("mute_toggle", action));
    TEST_ASSERT_EQUAL(VolumeButtonAction::MuteToggle, action);
    TEST_ASSERT_FALSE(parseVolumeButtonAction("reboot", action));
    TEST_ASSERT_EQUAL(VolumeButtonAction::MuteToggle, action);
    TEST_ASSERT_EQUAL_STRING("noop", volumeButtonActionName(VolumeButtonAction::Noop));
}

static void test_decode_map_lookup(void) {
    DecodeMap identity;
    int digit = -1;
    TEST_ASSERT_TRUE(identity.lookup(7, digit));
    TEST_ASSERT_EQUAL_INT(7, digit);

    DecodeMap partial;
    partial.present = true;
    partial.entries[3] = 2;
    TEST_ASSERT_TRUE(partial.lookup(3, digit));
    TEST_ASSERT_EQUAL_INT(2, digit);
    TEST_ASSERT_FALSE(partial.lookup(4, digit));
}

static void test_builds_rotary_config(void) {
    HardwareConfig config;
    std::vector<ValidationError> errors;
    TEST_ASSERT_TRUE(buildHardwareConfig(loadConfigFixture("hardware_rotary.json"), HardwareVariant::Rotary,
                                         config, errors));
    TEST_ASSERT_EQUAL_UINT32(0, errors.size());

    const RotaryConfig &rotary = config.rotary;
    TEST_ASSERT_EQUAL(HardwareVariant::Rotary, config.variant);
    TEST_ASSERT_EQUAL_INT64(0x49, rotary.volumeI2CAddress);
    TEST_ASSERT_EQUAL_INT64(5, rotary.stationSwitch.bits[0]);
    TEST_ASSERT_EQUAL_INT64(19, rotary.stationSwitch.bits[3]);
    TEST_ASSERT_EQUAL_INT64(17, rotary.bankSwitch.bits[0]);
    TEST_ASSERT_EQUAL_INT64(0, rotary.volumeEncoder);
    TEST_ASSERT_EQUAL_INT64(9, rotary.controls.bankMax);
    TEST_ASSERT_EQUAL_INT64(2, rotary.controls.volumeStep);
    TEST_ASSERT_EQUAL(VolumeButtonAction::MuteToggle, rotary.volumeButton);
    TEST_ASSERT_EQUAL_STRING("https://radio.example.net/stations.json", config.stationsUrl.c_str());

    TEST_ASSERT_TRUE(rotary.bankDecodeMap.present);
    TEST_ASSERT_EQUAL_UINT32(10, rotary.bankDecodeMap.entries.size());
    int digit = -1;
    TEST_ASSERT_TRUE(rotary.bankDecodeMap.lookup(12, digit));
    TEST_ASSERT_EQUAL_INT(8, digit);
    TEST_ASSERT_FALSE(rotary.bankDecodeMap.lookup(15, digit));
}

static void test_polling_defaults_apply_only_when_absent(void) {
    HardwareConfig config;
    std::vector<ValidationError> errors;
    TEST_ASSERT_TRUE(buildHardwareConfig(loadConfigFixture("hardware_rotary.json"), HardwareVariant::Rotary,
                                         config, errors));

    const PollingSettings &polling = config.rotary.polling;
    TEST_ASSERT_EQUAL_FLOAT(0.05f, static_cast<float>(polling.switchPollInterval));
    TEST_ASSERT_EQUAL_FLOAT(0.15f, static_cast<float>(polling.switchDebounce));
    TEST_ASSERT_EQUAL_FLOAT(0.12f, static_cast<float>(polling.switchStabilityWindow));
    TEST_ASSERT_EQUAL_FLOAT(5.0f, static_cast<float>(polling.invalidCodeLogInterval));
}

static void test_builds_encoder_oled_config(void) {
    HardwareConfig config;
    std::vector<ValidationError> errors;
    TEST_ASSERT_TRUE(buildHardwareConfig(loadConfigFixture("hardware_encoder_oled.json"),
                                         HardwareVariant::EncoderOled, config, errors));

    TEST_ASSERT_EQUAL(HardwareVariant::EncoderOled, config.variant);
    TEST_ASSERT_EQUAL_INT64(0x36, config.encoderOled.encoderI2CAddress);
    TEST_ASSERT_EQUAL_INT64(60, config.encoderOled.oledI2CAddress);
    TEST_ASSERT_EQUAL_INT64(19, config.encoderOled.controls.stationMax);
    TEST_ASSERT_TRUE(config.stationsUrl.empty());
}

static void test_encoder_oled_unparsable_address_becomes_zero(void) {
    ConfigValue tree = loadConfigFixture("hardware_encoder_oled.json");
    ConfigValue i2c = tree["i2c"];
    i2c.set("oled_i2c_address", ConfigValue::makeString("display"));
    tree.set("i2c", i2c);

    HardwareConfig config;
    std::vector<ValidationError> errors;
    TEST_ASSERT_TRUE(buildHardwareConfig(tree, HardwareVariant::EncoderOled, config, errors));
    TEST_ASSERT_EQUAL_INT64(0, config.encoderOled.oledI2CAddress);
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "oled_i2c_address"));
}

static void test_wide_control_values_survive_projection(void) {
    ConfigValue tree = loadConfigFixture("hardware_rotary.json");
    ConfigValue controls = tree["controls"];
    controls.set("bank_min", ConfigValue::makeInteger(5));
    controls.set("bank_max", ConfigValue::makeInteger(4294967297LL));
    controls.set("volume_step", ConfigValue::makeInteger(4294967296LL));
    tree.set("controls", controls);

    HardwareConfig config;
    std::vector<ValidationError> errors;
    TEST_ASSERT_TRUE(buildHardwareConfig(tree, HardwareVariant::Rotary, config, errors));
    TEST_ASSERT_EQUAL_UINT32(0, errors.size());

    const ControlRanges &ranges = config.rotary.controls;
    TEST_ASSERT_TRUE(ranges.bankMin <= ranges.bankMax);
    TEST_ASSERT_TRUE(ranges.bankMax == 4294967297LL);
    TEST_ASSERT_TRUE(ranges.volumeStep == 4294967296LL);
}

static void test_invalid_config_is_not_built(void) {
    HardwareConfig config;
    config.stationsUrl = "untouched";
    std::vector<ValidationError> errors;
    TEST_ASSERT_FALSE(buildHardwareConfig(loadConfigFixture("hardware_rotary_broken.json"),
                                          HardwareVariant::Rotary, config, errors));
    TEST_ASSERT_EQUAL_UINT32(16, errors.size());
    TEST_ASSERT_EQUAL_STRING("untouched", config.stationsUrl.c_str());
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Error, "16 error(s)"));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_variant_names);
    RUN_TEST(test_volume_button_actions);
    RUN_TEST(test_decode_map_lookup);
    RUN_TEST(test_builds_rotary_config);
    RUN_TEST(test_polling_defaults_apply_only_when_absent);
    RUN_TEST(test_builds_encoder_oled_config);
    RUN_TEST(test_encoder_oled_unparsable_address_becomes_zero);
    RUN_TEST(test_wide_control_values_survive_projection);
    RUN_TEST(test_invalid_config_is_not_built);
    return UNITY_END();
}
