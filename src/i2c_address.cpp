#include "i2c_address.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "config_value.h"

namespace {

std::string trimLower(const std::string &text)
{
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    std::string out;
    out.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
    }
    return out;
}

I2CAddressResult parseFailure(const char *reason)
{
    I2CAddressResult result;
    result.status = I2CAddressStatus::ParseFailure;
    result.detail = reason;
    return result;
}

}  // namespace

I2CAddressResult parseI2CAddressText(const std::string &text)
{
    std::string normalized = trimLower(text);

    int base = 10;
    std::string digits = normalized;
    if (normalized.compare(0, 2, "0x") == 0) {
        base = 16;
        digits = normalized.substr(2);
    }

    if (digits.empty()) {
        return parseFailure("empty address");
    }
    // Decimal text may carry one sign; hex may not. strtoll would otherwise
    // accept a sign after "0x" or whitespace after the sign.
    size_t first = (base == 10 && (digits[0] == '-' || digits[0] == '+')) ? 1 : 0;
    if (first >= digits.size() || !std::isxdigit(static_cast<unsigned char>(digits[first]))) {
        return parseFailure(base == 16 ? "invalid hex literal" : "invalid decimal literal");
    }

    errno = 0;
    char *end = nullptr;
    long long value = std::strtoll(digits.c_str(), &end, base);
    if (errno == ERANGE) {
        return parseFailure("address out of range");
    }
    if (!end || *end != '\0') {
        return parseFailure(base == 16 ? "invalid hex literal" : "invalid decimal literal");
    }

    I2CAddressResult result;
    result.address = value;
    return result;
}

I2CAddressResult parseI2CAddress(const ConfigValue &value)
{
    if (value.isInteger()) {
        I2CAddressResult result;
        result.address = value.asInteger();
        return result;
    }
    if (value.isString()) {
        return parseI2CAddressText(value.asString());
    }

    I2CAddressResult result;
    result.status = I2CAddressStatus::TypeMismatch;
    result.detail = std::string("expected integer or string, got ") + ConfigValue::typeName(value.type());
    return result;
}

const char *i2cAddressStatusName(I2CAddressStatus status)
{
    switch (status) {
        case I2CAddressStatus::Ok:           return "ok";
        case I2CAddressStatus::TypeMismatch: return "type mismatch";
        case I2CAddressStatus::ParseFailure: return "parse failure";
    }
    return "unknown";
}
