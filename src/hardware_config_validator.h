#ifndef HARDWARE_CONFIG_VALIDATOR_H
#define HARDWARE_CONFIG_VALIDATOR_H

#include <string>
#include <vector>

#include "hardware_config.h"
#include "validation_error.h"

class ConfigValue;

// Returns every problem found, in check order. Malformed input never throws.
std::vector<ValidationError> validateHardwareConfig(const ConfigValue &tree, HardwareVariant variant);

// Variant by name. An unknown name yields a single "Unknown hardware variant" error.
std::vector<ValidationError> validateHardwareConfig(const ConfigValue &tree, const std::string &variant);

#endif // HARDWARE_CONFIG_VALIDATOR_H
