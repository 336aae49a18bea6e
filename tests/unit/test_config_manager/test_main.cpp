#include <unity.h>
#include <map>
#include <string>
#include "config_manager.h"
#include "fake_filesystem.h"
#include "fake_log_sink.h"
#include "infra/log_sink.h"

static FakeLogSink g_logSink;
static std::map<std::string, std::string> g_environment;

void setUp(void) {
    g_logSink.clear();
    g_environment.clear();
    ConfigManager &config = ConfigManager::getInstance();
    config.setLogSink(&g_logSink);
    config.setEnvironmentProvider([](const char *name) -> const char * {
        auto it = g_environment.find(name);
        return it == g_environment.end() ? nullptr : it->second.c_str();
    });
}
void tearDown(void) {}

static void test_load_config_happy_path(void) {
    FakeFileSystem fs;
    fs.addFile("/etc/radio/radio.conf",
               "# radio control plane\n"
               "bind_host = 127.0.0.1\n"
               "bind_port=9090\n"
               "radio_play_cmd=/opt/radio/bin/radio-play\n"
               "state_file=/var/lib/radio/state\n"
               "hardware_variant=encoder_oled\n"
               "command_timeout_ms=2500\n");

    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    TEST_ASSERT_TRUE(config.loadConfig());
    TEST_ASSERT_EQUAL_STRING("/etc/radio/radio.conf", config.settingsPath().c_str());
    TEST_ASSERT_EQUAL_STRING("127.0.0.1", config.getBindHost().c_str());
    TEST_ASSERT_EQUAL(9090, config.getBindPort());
    TEST_ASSERT_EQUAL_STRING("/opt/radio/bin/radio-play", config.getRadioPlayCommand().c_str());
    TEST_ASSERT_EQUAL_STRING("/var/lib/radio/state", config.getStateFile().c_str());
    TEST_ASSERT_EQUAL_STRING("encoder_oled", config.getHardwareVariant().c_str());
    TEST_ASSERT_EQUAL_UINT32(2500, config.getCommandTimeoutMs());
}

static void test_missing_file_uses_defaults(void) {
    FakeFileSystem fs;

    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    TEST_ASSERT_TRUE(config.loadConfig("/nowhere/radio.conf"));
    TEST_ASSERT_EQUAL_STRING("0.0.0.0", config.getBindHost().c_str());
    TEST_ASSERT_EQUAL(8080, config.getBindPort());
    TEST_ASSERT_EQUAL_STRING("radio-play", config.getRadioPlayCommand().c_str());
    TEST_ASSERT_EQUAL_UINT32(10000, config.getCommandTimeoutMs());
    TEST_ASSERT_EQUAL_STRING("/home/radio/.radio-state", config.getStateFile().c_str());
    TEST_ASSERT_EQUAL_STRING("/home/radio/hardware-config.json", config.getHardwareConfigPath().c_str());
    TEST_ASSERT_EQUAL_STRING("/home/radio/stations.json", config.getStationsConfigPath().c_str());
    TEST_ASSERT_EQUAL_STRING("", config.getLogFile().c_str());
    TEST_ASSERT_EQUAL_STRING("rotary", config.getHardwareVariant().c_str());
    TEST_ASSERT_EQUAL(infra::LogLevel::Info, config.getLogLevel());
}

static void test_reload_clears_missing_keys(void) {
    FakeFileSystem fs;
    fs.addFile("/radio.conf", "bind_port=9000\nlog_file=/var/log/radio.log\n");

    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    TEST_ASSERT_TRUE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_EQUAL_STRING("/var/log/radio.log", config.getLogFile().c_str());

    fs.addFile("/radio.conf", "bind_port=9001\n");
    TEST_ASSERT_TRUE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_EQUAL_STRING("", config.getLogFile().c_str());
    TEST_ASSERT_EQUAL(9001, config.getBindPort());
}

static void test_environment_overrides_file(void) {
    FakeFileSystem fs;
    fs.addFile("/radio.conf", "bind_port=9000\nradio_play_cmd=/usr/bin/radio-play\n");
    g_environment["BIND_PORT"] = "7000";
    g_environment["RADIO_PLAY_CMD"] = "/opt/radio-play";
    g_environment["RADIO_STATIONS_CONFIG"] = "/srv/stations.json";
    g_environment["RADIO_LOG_LEVEL"] = "debug";

    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    TEST_ASSERT_TRUE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_EQUAL(7000, config.getBindPort());
    TEST_ASSERT_EQUAL_STRING("/opt/radio-play", config.getRadioPlayCommand().c_str());
    TEST_ASSERT_EQUAL_STRING("/srv/stations.json", config.getStationsConfigPath().c_str());
    TEST_ASSERT_EQUAL(infra::LogLevel::Debug, config.getLogLevel());
    TEST_ASSERT_EQUAL_STRING("7000", config.getValue("bind_port").c_str());
}

static void test_invalid_values_fall_back_with_warnings(void) {
    FakeFileSystem fs;
    fs.addFile("/radio.conf",
               "bind_port=80a\n"
               "command_timeout_ms=5\n"
               "hardware_variant=touchscreen\n"
               "radio_play_cmd=\n"
               "log_level=loud\n"
               "just some text\n");

    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    TEST_ASSERT_TRUE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_EQUAL(8080, config.getBindPort());
    TEST_ASSERT_EQUAL_UINT32(10000, config.getCommandTimeoutMs());
    TEST_ASSERT_EQUAL_STRING("touchscreen", config.getHardwareVariant().c_str());
    TEST_ASSERT_EQUAL_STRING("radio-play", config.getRadioPlayCommand().c_str());
    TEST_ASSERT_EQUAL(infra::LogLevel::Info, config.getLogLevel());

    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "Invalid bind_port '80a'"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "Invalid command_timeout_ms '5'"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "Unknown hardware_variant 'touchscreen'"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "Empty radio_play_cmd"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "Unknown log_level 'loud'"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Warn, "Ignoring settings line without '='"));
}

static void test_port_bounds(void) {
    FakeFileSystem fs;
    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    fs.addFile("/radio.conf", "bind_port=65535\n");
    TEST_ASSERT_TRUE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_EQUAL(65535, config.getBindPort());

    fs.addFile("/radio.conf", "bind_port=0\n");
    TEST_ASSERT_TRUE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_EQUAL(8080, config.getBindPort());
}

static void test_unopenable_file_fails(void) {
    FakeFileSystem fs;
    fs.failOpen("/radio.conf");

    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(&fs);

    TEST_ASSERT_FALSE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Error, "Failed to open settings file"));
}

static void test_missing_filesystem_fails_under_test(void) {
    ConfigManager &config = ConfigManager::getInstance();
    config.setFileSystem(nullptr);

    TEST_ASSERT_FALSE(config.loadConfig("/radio.conf"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Error, "No filesystem provided"));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_load_config_happy_path);
    RUN_TEST(test_missing_file_uses_defaults);
    RUN_TEST(test_reload_clears_missing_keys);
    RUN_TEST(test_environment_overrides_file);
    RUN_TEST(test_invalid_values_fall_back_with_warnings);
    RUN_TEST(test_port_bounds);
    RUN_TEST(test_unopenable_file_fails);
    RUN_TEST(test_missing_filesystem_fails_under_test);
    return UNITY_END();
}
