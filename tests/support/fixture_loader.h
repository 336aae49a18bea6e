#pragma once

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config_loader.h"

inline std::string loadFixture(const char *relativePath) {
    if (!relativePath) {
        throw std::invalid_argument("relativePath is null");
    }
    std::ifstream file(std::string("tests/fixtures/") + relativePath, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error(std::string("Failed to open fixture: ") + relativePath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Parses a JSON fixture into a tree; throws when the fixture is not valid JSON.
inline ConfigValue loadConfigFixture(const char *relativePath) {
    ConfigValue tree;
    std::string error;
    if (!ConfigLoader::parse(loadFixture(relativePath), tree, &error)) {
        throw std::runtime_error(std::string("Invalid JSON fixture ") + relativePath + ": " + error);
    }
    return tree;
}

// Inline JSON for tests that build small trees.
inline ConfigValue parseJson(const std::string &text) {
    ConfigValue tree;
    std::string error;
    if (!ConfigLoader::parse(text, tree, &error)) {
        throw std::runtime_error("Invalid JSON in test: " + error);
    }
    return tree;
}
