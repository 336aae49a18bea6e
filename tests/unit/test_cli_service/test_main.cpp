#include <unity.h>
#include <cstdio>
#include <string>
#include <vector>
#include "cli_service.h"

static std::vector<std::string> g_commands;

static std::FILE *makeInput(const char *text) {
    std::FILE *file = std::tmpfile();
    TEST_ASSERT_NOT_NULL(file);
    std::fputs(text, file);
    std::rewind(file);
    return file;
}

static void record(const std::string &line) {
    g_commands.push_back(line);
}

void setUp(void) {
    g_commands.clear();
}
void tearDown(void) {}

static void test_dispatches_one_line_per_poll(void) {
    std::FILE *input = makeInput("status\r\nallow mpc play\n");
    CliService service(input, record);

    TEST_ASSERT_TRUE(service.poll());
    TEST_ASSERT_EQUAL_UINT32(1, g_commands.size());
    TEST_ASSERT_EQUAL_STRING("status", g_commands[0].c_str());

    TEST_ASSERT_TRUE(service.poll());
    TEST_ASSERT_EQUAL_STRING("allow mpc play", g_commands[1].c_str());

    TEST_ASSERT_FALSE(service.poll());
    TEST_ASSERT_EQUAL_UINT32(2, g_commands.size());
    std::fclose(input);
}

static void test_blank_lines_are_skipped(void) {
    std::FILE *input = makeInput("\n\nhelp\n");
    CliService service(input, record);

    while (service.poll()) {
    }
    TEST_ASSERT_EQUAL_UINT32(1, g_commands.size());
    TEST_ASSERT_EQUAL_STRING("help", g_commands[0].c_str());
    std::fclose(input);
}

static void test_last_line_without_newline(void) {
    std::FILE *input = makeInput("state");
    CliService service(input, record);

    TEST_ASSERT_FALSE(service.poll());
    TEST_ASSERT_EQUAL_UINT32(1, g_commands.size());
    TEST_ASSERT_EQUAL_STRING("state", g_commands[0].c_str());
    TEST_ASSERT_FALSE(service.poll());
    TEST_ASSERT_EQUAL_UINT32(1, g_commands.size());
    std::fclose(input);
}

static void test_missing_input_ends_immediately(void) {
    CliService service(nullptr, record);
    TEST_ASSERT_FALSE(service.poll());
    TEST_ASSERT_EQUAL_UINT32(0, g_commands.size());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_dispatches_one_line_per_poll);
    RUN_TEST(test_blank_lines_are_skipped);
    RUN_TEST(test_last_line_without_newline);
    RUN_TEST(test_missing_input_ends_immediately);
    return UNITY_END();
}
