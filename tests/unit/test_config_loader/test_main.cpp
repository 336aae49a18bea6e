#include <unity.h>
#include "config_loader.h"
#include "fake_filesystem.h"
#include "fake_log_sink.h"
#include "fixture_loader.h"

static FakeLogSink g_logSink;

void setUp(void) {
    g_logSink.clear();
    infra::setLogSink(&g_logSink);
}
void tearDown(void) {
    infra::setLogSink(nullptr);
}

static void test_missing_file_is_empty_mapping(void) {
    FakeFileSystem fs;
    ConfigLoader loader(fs);
    ConfigValue tree = ConfigValue::makeString("stale");

    TEST_ASSERT_TRUE(loader.load("/home/radio/hardware-config.json", tree));
    TEST_ASSERT_TRUE(tree.isMapping());
    TEST_ASSERT_EQUAL_UINT32(0, tree.size());
    TEST_ASSERT_TRUE(loader.lastError().empty());
}

static void test_empty_and_null_documents_are_empty_mappings(void) {
    FakeFileSystem fs;
    fs.addFile("/empty.json", "  \n");
    fs.addFile("/null.json", "null");
    ConfigLoader loader(fs);

    ConfigValue tree;
    TEST_ASSERT_TRUE(loader.load("/empty.json", tree));
    TEST_ASSERT_TRUE(tree.isMapping());
    TEST_ASSERT_TRUE(loader.load("/null.json", tree));
    TEST_ASSERT_TRUE(tree.isMapping());
    TEST_ASSERT_EQUAL_UINT32(0, tree.size());
}

static void test_loads_types_and_preserves_order(void) {
    FakeFileSystem fs;
    fs.addFile("/cfg.json",
               "{\"zeta\": 1, \"alpha\": 2.5, \"flag\": true, \"name\": \"radio\","
               " \"none\": null, \"list\": [1, \"two\"], \"nested\": {\"k\": \"v\"}}");
    ConfigLoader loader(fs);

    ConfigValue tree;
    TEST_ASSERT_TRUE(loader.load("/cfg.json", tree));
    TEST_ASSERT_EQUAL_UINT32(7, tree.size());
    TEST_ASSERT_EQUAL_STRING("zeta", tree.entries()[0].first.c_str());
    TEST_ASSERT_EQUAL_STRING("alpha", tree.entries()[1].first.c_str());

    TEST_ASSERT_TRUE(tree["zeta"].isInteger());
    TEST_ASSERT_EQUAL_INT64(1, tree["zeta"].asInteger());
    TEST_ASSERT_TRUE(tree["alpha"].isFloat());
    TEST_ASSERT_EQUAL_FLOAT(2.5, static_cast<float>(tree["alpha"].asNumber()));
    TEST_ASSERT_TRUE(tree["flag"].isBool());
    TEST_ASSERT_FALSE(tree["flag"].isInteger());
    TEST_ASSERT_EQUAL_STRING("radio", tree["name"].asString().c_str());
    TEST_ASSERT_TRUE(tree.contains("none"));
    TEST_ASSERT_TRUE(tree["none"].isNull());
    TEST_ASSERT_TRUE(tree["list"].isSequence());
    TEST_ASSERT_EQUAL_UINT32(2, tree["list"].size());
    TEST_ASSERT_EQUAL_STRING("two", tree["list"].items()[1].asString().c_str());
    TEST_ASSERT_EQUAL_STRING("v", tree["nested"]["k"].asString().c_str());
}

static void test_invalid_json_is_a_load_failure(void) {
    FakeFileSystem fs;
    fs.addFile("/bad.json", "{\"i2c\": {");
    ConfigLoader loader(fs);

    ConfigValue tree;
    TEST_ASSERT_FALSE(loader.load("/bad.json", tree));
    TEST_ASSERT_TRUE(tree.isMapping());
    TEST_ASSERT_EQUAL_UINT32(0, tree.size());
    TEST_ASSERT_NOT_EQUAL(std::string::npos, loader.lastError().find("/bad.json"));
    TEST_ASSERT_TRUE(g_logSink.contains(infra::LogLevel::Error, "Invalid JSON"));
}

static void test_unopenable_file_is_a_load_failure(void) {
    FakeFileSystem fs;
    fs.failOpen("/locked.json");
    ConfigLoader loader(fs);

    ConfigValue tree;
    TEST_ASSERT_FALSE(loader.load("/locked.json", tree));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, loader.lastError().find("Failed to open"));
}

static void test_lookup_follows_dotted_keys(void) {
    ConfigValue tree = loadConfigFixture("hardware_rotary.json");

    const ConfigValue *url = ConfigLoader::lookup(tree, "sources.stations_url");
    TEST_ASSERT_NOT_NULL(url);
    TEST_ASSERT_EQUAL_STRING("https://radio.example.net/stations.json", url->asString().c_str());
    TEST_ASSERT_NULL(ConfigLoader::lookup(tree, "sources.missing"));
    TEST_ASSERT_NULL(ConfigLoader::lookup(tree, "sources.stations_url.deeper"));
}

static void test_update_value_merges_into_existing_file(void) {
    FakeFileSystem fs;
    fs.addFile("/hw.json", loadFixture("hardware_rotary.json"));
    ConfigLoader loader(fs);

    TEST_ASSERT_TRUE(loader.updateValue("/hw.json", "sources.stations_url",
                                        ConfigValue::makeString("http://mirror.example.net/s.json")));

    ConfigValue reloaded;
    TEST_ASSERT_TRUE(loader.load("/hw.json", reloaded));
    TEST_ASSERT_EQUAL_STRING("http://mirror.example.net/s.json",
                             reloaded["sources"]["stations_url"].asString().c_str());
    TEST_ASSERT_EQUAL_STRING("0x49", reloaded["i2c"]["volume_i2c_address"].asString().c_str());
    TEST_ASSERT_EQUAL_INT64(2, reloaded["controls"]["volume_step"].asInteger());
    TEST_ASSERT_EQUAL_FLOAT(0.05, static_cast<float>(reloaded["polling"]["switch_poll_interval"].asNumber()));
    TEST_ASSERT_EQUAL_STRING("i2c", reloaded.entries()[0].first.c_str());
}

static void test_update_value_creates_missing_file_and_sections(void) {
    FakeFileSystem fs;
    ConfigLoader loader(fs);

    TEST_ASSERT_TRUE(loader.updateValue("/new.json", "sources.stations_url",
                                        ConfigValue::makeString("https://a.example/s.json")));
    TEST_ASSERT_TRUE(fs.exists("/new.json"));

    ConfigValue tree;
    TEST_ASSERT_TRUE(ConfigLoader::parse(fs.contents("/new.json"), tree));
    TEST_ASSERT_EQUAL_STRING("https://a.example/s.json", tree["sources"]["stations_url"].asString().c_str());
}

static void test_update_value_refuses_to_replace_scalar_section(void) {
    FakeFileSystem fs;
    fs.addFile("/hw.json", "{\"sources\": \"legacy\"}");
    ConfigLoader loader(fs);

    TEST_ASSERT_FALSE(loader.updateValue("/hw.json", "sources.stations_url",
                                         ConfigValue::makeString("https://a.example/s.json")));
    TEST_ASSERT_EQUAL_STRING("{\"sources\": \"legacy\"}", fs.contents("/hw.json").c_str());
}

static void test_save_reports_write_failure(void) {
    FakeFileSystem fs;
    fs.failWrites(true);
    ConfigLoader loader(fs);

    ConfigValue tree = ConfigValue::makeMapping();
    tree.set("k", ConfigValue::makeInteger(1));
    TEST_ASSERT_FALSE(loader.save("/out.json", tree));
    TEST_ASSERT_NOT_EQUAL(std::string::npos, loader.lastError().find("/out.json"));
}

static void test_serialize_keeps_integers_and_floats_apart(void) {
    ConfigValue tree = ConfigValue::makeMapping();
    tree.set("pin", ConfigValue::makeInteger(17));
    tree.set("interval", ConfigValue::makeFloat(0.25));
    tree.set("enabled", ConfigValue::makeBool(false));

    ConfigValue parsed;
    TEST_ASSERT_TRUE(ConfigLoader::parse(ConfigLoader::serialize(tree), parsed));
    TEST_ASSERT_TRUE(parsed["pin"].isInteger());
    TEST_ASSERT_TRUE(parsed["interval"].isFloat());
    TEST_ASSERT_TRUE(parsed["enabled"].isBool());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_missing_file_is_empty_mapping);
    RUN_TEST(test_empty_and_null_documents_are_empty_mappings);
    RUN_TEST(test_loads_types_and_preserves_order);
    RUN_TEST(test_invalid_json_is_a_load_failure);
    RUN_TEST(test_unopenable_file_is_a_load_failure);
    RUN_TEST(test_lookup_follows_dotted_keys);
    RUN_TEST(test_update_value_merges_into_existing_file);
    RUN_TEST(test_update_value_creates_missing_file_and_sections);
    RUN_TEST(test_update_value_refuses_to_replace_scalar_section);
    RUN_TEST(test_save_reports_write_failure);
    RUN_TEST(test_serialize_keeps_integers_and_floats_apart);
    return UNITY_END();
}
