#include "stations_validator.h"

#include <climits>

#include "config_value.h"
#include "logging_manager.h"

static constexpr const char* TAG = "Stations";

namespace {

void addError(std::vector<ValidationError> &errors, const std::string &path, const std::string &message)
{
    ValidationError error;
    error.path = path;
    error.message = message;
    errors.push_back(error);
}

std::string scalarText(const ConfigValue &value)
{
    switch (value.type()) {
        case ConfigValue::Type::String:
            return value.asString();
        case ConfigValue::Type::Null:
            return std::string();
        case ConfigValue::Type::Bool:
        case ConfigValue::Type::Integer:
        case ConfigValue::Type::Float:
            return value.describe();
        case ConfigValue::Type::Sequence:
        case ConfigValue::Type::Mapping:
            break;
    }
    return std::string();
}

bool parseIndex(const std::string &key, int &out)
{
    long long value = 0;
    if (!ConfigValue::parseIntegerKey(key, value) || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

Station readStation(const ConfigValue &record)
{
    Station station;
    if (!record.isMapping()) {
        station.url = scalarText(record);
        return station;
    }
    for (const auto &entry : record.entries()) {
        if (entry.first == "name") {
            station.name = scalarText(entry.second);
        } else if (entry.first == "url") {
            station.url = scalarText(entry.second);
        } else if (!entry.second.isMapping() && !entry.second.isSequence()) {
            station.fields[entry.first] = scalarText(entry.second);
        }
    }
    return station;
}

}  // namespace

std::vector<ValidationError> validateStationsConfig(const ConfigValue &tree)
{
    std::vector<ValidationError> errors;
    if (!tree.isMapping()) {
        addError(errors, "", "Stations config must be a mapping");
        return errors;
    }

    const ConfigValue *banks = tree.find("banks");
    if (!banks) {
        addError(errors, "banks", "Missing 'banks' section");
        return errors;
    }
    if (!banks->isMapping()) {
        addError(errors, "banks", "'banks' must be a mapping");
        return errors;
    }

    for (const auto &entry : banks->entries()) {
        const std::string &bankId = entry.first;
        const ConfigValue &bank = entry.second;
        const std::string path = "banks." + bankId;

        if (!bank.isMapping()) {
            addError(errors, path, "Bank " + bankId + " must be a mapping");
            continue;
        }
        const ConfigValue *stations = bank.find("stations");
        if (!stations) {
            addError(errors, path + ".stations", "Bank " + bankId + " missing 'stations'");
            continue;
        }
        if (!stations->isMapping()) {
            addError(errors, path + ".stations", "Bank " + bankId + ".stations must be a mapping");
        }
    }
    return errors;
}

const Bank *StationsDirectory::findBank(int index) const
{
    auto it = banks.find(index);
    return it == banks.end() ? nullptr : &it->second;
}

const Station *StationsDirectory::findStation(int bank, int station) const
{
    const Bank *found = findBank(bank);
    if (!found) {
        return nullptr;
    }
    auto it = found->stations.find(station);
    return it == found->stations.end() ? nullptr : &it->second;
}

size_t StationsDirectory::stationCount() const
{
    size_t count = 0;
    for (const auto &bank : banks) {
        count += bank.second.stations.size();
    }
    return count;
}

bool buildStationsDirectory(const ConfigValue &tree, StationsDirectory &out)
{
    out.banks.clear();
    std::vector<ValidationError> errors = validateStationsConfig(tree);
    if (!errors.empty()) {
        LOG_ERROR(TAG, "Stations directory has %u error(s)", static_cast<unsigned>(errors.size()));
        return false;
    }

    for (const auto &bankEntry : tree["banks"].entries()) {
        int bankIndex = 0;
        if (!parseIndex(bankEntry.first, bankIndex)) {
            LOG_WARN(TAG, "Skipping bank '%s': index is not an integer", bankEntry.first.c_str());
            continue;
        }
        if (out.banks.count(bankIndex)) {
            LOG_WARN(TAG, "Skipping bank '%s': index %d already used", bankEntry.first.c_str(), bankIndex);
            continue;
        }

        Bank bank;
        bank.name = scalarText(bankEntry.second["name"]);
        for (const auto &stationEntry : bankEntry.second["stations"].entries()) {
            int stationIndex = 0;
            if (!parseIndex(stationEntry.first, stationIndex)) {
                LOG_WARN(TAG, "Skipping station '%s' in bank %d: index is not an integer",
                         stationEntry.first.c_str(), bankIndex);
                continue;
            }
            if (bank.stations.count(stationIndex)) {
                LOG_WARN(TAG, "Skipping station '%s' in bank %d: index %d already used",
                         stationEntry.first.c_str(), bankIndex, stationIndex);
                continue;
            }
            bank.stations[stationIndex] = readStation(stationEntry.second);
        }
        out.banks[bankIndex] = bank;
    }

    LOG_DEBUG(TAG, "Loaded %u bank(s), %u station(s)", static_cast<unsigned>(out.banks.size()),
              static_cast<unsigned>(out.stationCount()));
    return true;
}
