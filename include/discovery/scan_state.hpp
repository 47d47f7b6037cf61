#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace discovery
{

struct DiscoveredDevice
{
    std::string  address;  // identity, uniqueness key
    std::string  name;     // "Unknown Device" when the radio reported none
    std::int16_t rssi      = 0;
    std::int64_t last_seen = 0;  // epoch ms

    bool operator==(const DiscoveredDevice &o) const
    {
        return address == o.address && name == o.name && rssi == o.rssi &&
               last_seen == o.last_seen;
    }
    bool operator!=(const DiscoveredDevice &o) const { return !(*this == o); }
};

// first-sighting order, one entry per address
using DeviceList = std::vector<DiscoveredDevice>;

struct ScanIdle
{
};
struct ScanScanning
{
    DeviceList devices;
};
struct ScanComplete
{
    DeviceList devices;
};
struct ScanError
{
    std::string message;
};

using ScanState = std::variant<ScanIdle, ScanScanning, ScanComplete, ScanError>;

const char *state_name(const ScanState &s);
// Devices carried by Scanning/Complete, empty otherwise.
DeviceList  devices_of(const ScanState &s);

}  // namespace discovery
