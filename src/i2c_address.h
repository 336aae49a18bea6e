#ifndef I2C_ADDRESS_H
#define I2C_ADDRESS_H

#include <string>

class ConfigValue;

enum class I2CAddressStatus : unsigned char {
    Ok = 0,
    TypeMismatch,   // neither an integer nor a string
    ParseFailure    // string that is not hex ("0x..") or decimal
};

struct I2CAddressResult {
    I2CAddressStatus status = I2CAddressStatus::Ok;
    long long address = 0;
    std::string detail;

    bool ok() const { return status == I2CAddressStatus::Ok; }
};

// Accepts 73, "73", "0x49", " 0X49 ". No range check is applied; bus-level
// limits belong to the driver that opens the device.
I2CAddressResult parseI2CAddress(const ConfigValue &value);
I2CAddressResult parseI2CAddressText(const std::string &text);

const char *i2cAddressStatusName(I2CAddressStatus status);

#endif // I2C_ADDRESS_H
