#ifndef STATIONS_VALIDATOR_H
#define STATIONS_VALIDATOR_H

#include <map>
#include <string>
#include <vector>

#include "validation_error.h"

class ConfigValue;

// Structural check of the banks/stations directory. Station records
// themselves are not inspected.
std::vector<ValidationError> validateStationsConfig(const ConfigValue &tree);

struct Station {
    std::string name;
    std::string url;
    std::map<std::string, std::string> fields;  // remaining scalar fields, as text
};

struct Bank {
    std::string name;
    std::map<int, Station> stations;
};

struct StationsDirectory {
    std::map<int, Bank> banks;

    const Bank *findBank(int index) const;
    const Station *findStation(int bank, int station) const;
    size_t stationCount() const;
};

// Projects a tree that passed validateStationsConfig. Bank or station
// entries whose key is not an int, or whose index repeats an earlier entry
// ("0" and "00"), are skipped with a warning. Returns
// false when the tree is not structurally valid.
bool buildStationsDirectory(const ConfigValue &tree, StationsDirectory &out);

#endif // STATIONS_VALIDATOR_H
