#pragma once

#include <string>
#include <vector>

namespace vmedia::config {

struct GeneralConfig {
    std::string stateDir{"./state"};   // device store lives here
    std::string cacheDir{"./cache"};   // downloaded images
    std::string nameSpace{"vmedia"};   // state file is "<nameSpace>.yaml"
    bool        persistent{true};      // false: device state is kept in memory only
};

struct FetchConfig {
    int         maxAttempts{5};
    int         initialBackoffMs{1000};
    int         backoffMultiplier{2};
    int         timeoutSeconds{60};
    int         chunkSize{8192};
    bool        verifyTls{false};
    std::string defaultFileName{"image.iso"};
};

struct DeviceConfig {
    std::string              device;       // catalog key, e.g. "Cd"
    std::string              name;         // display name
    std::vector<std::string> mediaTypes;
};

struct LogConfig {
    std::string level{"info"};
};

std::vector<DeviceConfig> default_devices();

// Unified config for the emulator.
struct VmediaConfig {
    GeneralConfig             general;
    FetchConfig               fetch;
    std::vector<DeviceConfig> devices = default_devices();
    LogConfig                 log;
};

// Abstract storage interface.
class VmediaConfigStore {
public:
    virtual ~VmediaConfigStore() = default;

    virtual VmediaConfig load() = 0;
    virtual void         save(const VmediaConfig& cfg) = 0;
};

} // namespace vmedia::config
